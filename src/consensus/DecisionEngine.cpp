#include "DecisionEngine.hpp"

#include <glog/logging.h>


ValueCounts count_values(const std::vector<ProtocolMessage>& msgs) {
    ValueCounts counts;
    for (const auto& msg : msgs) {
        if (msg.value == Value::Zero) {
            ++counts.zeros;
        } else if (msg.value == Value::One) {
            ++counts.ones;
        }
    }
    return counts;
}


DecisionEngine::DecisionEngine(QuorumConfig quorum, ICoin& coin) : quorum_(quorum), coin_(coin) {
}

Value DecisionEngine::propose_from_r(const std::vector<ProtocolMessage>& r_msgs) {
    ValueCounts counts = count_values(r_msgs);

    if (quorum_.majority(counts.zeros)) {
        return Value::Zero;
    }
    if (quorum_.majority(counts.ones)) {
        return Value::One;
    }

    Value flipped = coin_.flip();
    DVLOG(6) << "no R majority (" << counts.zeros << "/" << counts.ones << "), coin: " << flipped;
    return flipped;
}

Resolution DecisionEngine::resolve_from_p(const std::vector<ProtocolMessage>& p_msgs, Value current) {
    ValueCounts counts = count_values(p_msgs);
    bool may_decide = termination_permitted();

    // a lone node keeps its value, or takes its own P proposal while it has none
    if (may_decide && quorum_.nodes == 1) {
        if (current != Value::Unknown) {
            return {current, true};
        }
        if (counts.zeros > 0) {
            return {Value::Zero, true};
        }
        if (counts.ones > 0) {
            return {Value::One, true};
        }
    }

    if (may_decide) {
        if (counts.zeros >= quorum_.decide_threshold()) {
            return {Value::Zero, true};
        }
        if (counts.ones >= quorum_.decide_threshold()) {
            return {Value::One, true};
        }
    }

    if (counts.zeros >= quorum_.adopt_threshold()) {
        return {Value::Zero, false};
    }
    if (counts.ones >= quorum_.adopt_threshold()) {
        return {Value::One, false};
    }

    Value flipped = coin_.flip();
    DVLOG(6) << "no P quorum (" << counts.zeros << "/" << counts.ones << "), coin: " << flipped;
    return {flipped, false};
}

bool DecisionEngine::termination_permitted() const {
    return quorum_.fault_bound_respected();
}

NodeConsensusState DecisionEngine::observe(const NodeConsensusState& state) const {
    NodeConsensusState observed = state;
    if (!termination_permitted()) {
        observed.decided = false;
    }
    return observed;
}
