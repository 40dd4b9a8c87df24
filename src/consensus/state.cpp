#include "state.hpp"


std::ostream& operator<<(std::ostream& out, const NodeConsensusState& state) {
    if (state.is_faulty()) {
        return out << "{faulty, stopped: " << state.stopped << "}";
    }

    out << "{x: " << state.current_value.value() << ", decided: " << state.decided
        << ", round: " << state.round << ", stopped: " << state.stopped << "}";
    return out;
}

void to_json(json& j, const NodeConsensusState& state) {
    j = json{{"stopped", state.stopped}};
    if (state.is_faulty()) {
        j["currentValue"] = nullptr;
        j["decided"] = nullptr;
        j["round"] = nullptr;
        return;
    }

    j["currentValue"] = state.current_value.value();
    j["decided"] = state.decided;
    j["round"] = state.round;
}
