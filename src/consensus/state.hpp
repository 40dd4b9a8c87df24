#pragma once

#include <cstdint>
#include <iostream>
#include <optional>

#include "../core/protocol.hpp"

struct NodeConsensusState {
    // nullopt for a faulty node
    std::optional<Value> current_value;
    bool decided{false};
    uint32_t round{0};
    bool stopped{false};

    static NodeConsensusState initial(Value value, bool faulty) {
        NodeConsensusState state;
        if (!faulty) {
            state.current_value = value;
        }
        return state;
    }

    bool is_faulty() const {
        return !current_value.has_value();
    }

    bool operator==(const NodeConsensusState& other) const = default;

    friend std::ostream& operator<<(std::ostream& out, const NodeConsensusState& state);
};

// faulty nodes report null for everything but "stopped"
void to_json(json& j, const NodeConsensusState& state);
