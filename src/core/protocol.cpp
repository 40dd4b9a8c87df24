#include "protocol.hpp"

#include <cstdint>


std::ostream& operator<<(std::ostream& out, Value value) {
    switch (value) {
        case Value::Zero:
            return out << "0";
        case Value::One:
            return out << "1";
        case Value::Unknown:
            return out << "?";
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, Phase phase) {
    return out << (phase == Phase::R ? "R" : "P");
}

void to_json(json& j, Value value) {
    switch (value) {
        case Value::Zero:
            j = 0;
            break;
        case Value::One:
            j = 1;
            break;
        case Value::Unknown:
            j = "?";
            break;
    }
}

void to_json(json& j, Phase phase) {
    j = (phase == Phase::R ? "R" : "P");
}

std::optional<Value> parse_value(const json& j) {
    if (j.is_number_integer()) {
        int64_t bit = j.get<int64_t>();
        if (bit == 0) {
            return Value::Zero;
        }
        if (bit == 1) {
            return Value::One;
        }
        return std::nullopt;
    }

    if (j.is_string() && j.get<std::string>() == "?") {
        return Value::Unknown;
    }

    return std::nullopt;
}

std::optional<Phase> parse_phase(const json& j) {
    if (!j.is_string()) {
        return std::nullopt;
    }

    const std::string& phase = j.get_ref<const std::string&>();
    if (phase == "R") {
        return Phase::R;
    }
    if (phase == "P") {
        return Phase::P;
    }
    return std::nullopt;
}


std::ostream& operator<<(std::ostream& out, const ProtocolMessage& msg) {
    out << "{" << msg.phase << ", from: " << msg.sender_id << ", round: " << msg.round
        << ", value: " << msg.value << "}";
    return out;
}

void to_json(json& j, const ProtocolMessage& msg) {
    j = json{
        {"phase", msg.phase},
        {"senderId", msg.sender_id},
        {"round", msg.round},
        {"value", msg.value},
    };
}

std::optional<ProtocolMessage> decode_protocol_message(const json& j) {
    if (!j.is_object() || !j.contains("phase") || !j.contains("senderId")
        || !j.contains("round") || !j.contains("value")) {
        return std::nullopt;
    }

    auto non_negative = [](const json& field) {
        return field.is_number_integer() && field.get<int64_t>() >= 0
               && field.get<int64_t>() <= UINT32_MAX;
    };
    if (!non_negative(j["senderId"]) || !non_negative(j["round"])) {
        return std::nullopt;
    }

    auto phase = parse_phase(j["phase"]);
    auto value = parse_value(j["value"]);
    if (!phase.has_value() || !value.has_value()) {
        return std::nullopt;
    }

    ProtocolMessage msg;
    msg.phase = phase.value();
    msg.sender_id = j["senderId"].get<uint32_t>();
    msg.round = j["round"].get<uint32_t>();
    msg.value = value.value();
    return msg;
}

Message make_protocol_message(const ProtocolMessage& msg) {
    return Message(BEN_OR_MSG_TYPE, json(msg), static_cast<int>(msg.sender_id));
}

std::optional<ProtocolMessage> extract_protocol_message(const Message& msg) {
    if (msg.type != BEN_OR_MSG_TYPE) {
        return std::nullopt;
    }

    auto decoded = decode_protocol_message(msg.data);
    if (!decoded.has_value()) {
        return std::nullopt;
    }

    // transport knows the real sender, the envelope must agree with it
    if (msg.from >= 0 && static_cast<uint32_t>(msg.from) != decoded->sender_id) {
        return std::nullopt;
    }

    return decoded;
}
