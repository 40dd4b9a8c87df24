#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "message.hpp"

enum class Value {
    Zero = 0,
    One = 1,
    Unknown = 2, // "?", no settled proposal yet
};

enum class Phase {
    R,
    P,
};

inline Value value_from_bit(uint32_t bit) {
    return bit == 0 ? Value::Zero : Value::One;
}

std::ostream& operator<<(std::ostream& out, Value value);
std::ostream& operator<<(std::ostream& out, Phase phase);

void to_json(json& j, Value value);
void to_json(json& j, Phase phase);

std::optional<Value> parse_value(const json& j);
std::optional<Phase> parse_phase(const json& j);


struct ProtocolMessage {
    Phase phase{Phase::R};
    uint32_t sender_id{0};
    uint32_t round{0};
    Value value{Value::Unknown};

    bool operator==(const ProtocolMessage& other) const = default;

    friend std::ostream& operator<<(std::ostream& out, const ProtocolMessage& msg);
};

void to_json(json& j, const ProtocolMessage& msg);

// nullopt when the envelope is malformed
std::optional<ProtocolMessage> decode_protocol_message(const json& j);

// wraps the envelope into a transport message
Message make_protocol_message(const ProtocolMessage& msg);
std::optional<ProtocolMessage> extract_protocol_message(const Message& msg);

inline const std::string BEN_OR_MSG_TYPE = "BenOr";
