#pragma once

#include <cstdint>
#include <optional>

#include "../consensus/config.hpp"
#include "../core/protocol.hpp"

enum Role {
    Fair,
    FailStop, // never participates
};

struct NodeConfig {
    uint32_t id;
    QuorumConfig quorum;
    Value initial_value{Value::Unknown};
    Role role{Fair};
    TimingConfig timing{};
    std::optional<uint32_t> coin_seed{};
};
