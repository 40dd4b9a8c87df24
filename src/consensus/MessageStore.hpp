#pragma once

#include <map>
#include <unordered_map>
#include <vector>

#include "../core/protocol.hpp"

class MessageStore {
    struct RoundBuffer {
        // one message per sender, last write wins
        std::unordered_map<uint32_t, ProtocolMessage> received[2];
    };

public:
    // false if the message belongs to an already pruned round
    bool record(const ProtocolMessage& msg);
    std::vector<ProtocolMessage> read(uint32_t round, Phase phase) const;

    // drops every round older than before_round - 1, later messages for them are ignored
    void prune(uint32_t before_round);

    bool has_round(uint32_t round) const;
    std::vector<uint32_t> rounds() const;

private:
    static size_t index(Phase phase) {
        return phase == Phase::R ? 0 : 1;
    }

private:
    std::map<uint32_t, RoundBuffer> rounds_;
    uint32_t oldest_kept_{0};
};
