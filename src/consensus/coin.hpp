#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "../core/protocol.hpp"

// source of fair random bits used for tie-breaking
class ICoin {
public:
    virtual Value flip() = 0;
    virtual ~ICoin() = default;
};


class RandomCoin : public ICoin {
public:
    explicit RandomCoin(std::optional<uint32_t> seed = std::nullopt)
        : gen_(seed.has_value() ? seed.value() : std::random_device{}()), bit_(0, 1) {
    }

    Value flip() override {
        return value_from_bit(bit_(gen_));
    }

private:
    std::mt19937 gen_;
    std::uniform_int_distribution<uint32_t> bit_;
};
