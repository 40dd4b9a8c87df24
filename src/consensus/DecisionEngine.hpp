#pragma once

#include <vector>

#include "../core/protocol.hpp"
#include "coin.hpp"
#include "config.hpp"
#include "state.hpp"

struct ValueCounts {
    size_t zeros{0};
    size_t ones{0};
};

ValueCounts count_values(const std::vector<ProtocolMessage>& msgs);


struct Resolution {
    Value value;
    bool decided;

    bool operator==(const Resolution& other) const = default;
};


/*  Majority and quorum rules of a Ben-Or round.
    Everything here is deterministic apart from coin_.flip(). */
class DecisionEngine {
public:
    DecisionEngine(QuorumConfig quorum, ICoin& coin);

    // value to send in phase P, given the R messages of the round
    Value propose_from_r(const std::vector<ProtocolMessage>& r_msgs);

    // new estimate after phase P
    Resolution resolve_from_p(const std::vector<ProtocolMessage>& p_msgs, Value current);

    // false when F > N/2; the only place the override is decided
    bool termination_permitted() const;

    // every external read of the state goes through here
    NodeConsensusState observe(const NodeConsensusState& state) const;

    const QuorumConfig& quorum() const {
        return quorum_;
    }

private:
    QuorumConfig quorum_;
    ICoin& coin_;
};
