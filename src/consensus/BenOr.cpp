#include "BenOr.hpp"

#include <glog/logging.h>


BenOr::BenOr(uint32_t id, NodeConsensusState& state, MessageStore& store,
             DecisionEngine& engine, INetManager& net)
    : id_(id), state_(state), store_(store), engine_(engine), net_(net) {
}


bool BenOr::broadcast_r() {
    if (!can_act()) {
        return false;
    }

    if (step_ != Idle && step_ != NextRound) {
        LOG(WARNING) << id_ << " broadcast_r called in step " << step_;
        return false;
    }

    step_ = BroadcastR;
    ProtocolMessage msg{Phase::R, id_, state_.round, state_.current_value.value()};

    DVLOG(5) << id_ << " round: " << state_.round << " broadcast R: " << msg;

    send_and_record(msg);
    step_ = AwaitR;
    return true;
}


bool BenOr::broadcast_p() {
    if (!can_act()) {
        return false;
    }

    if (step_ != AwaitR) {
        LOG(WARNING) << id_ << " broadcast_p called in step " << step_;
        return false;
    }

    step_ = BroadcastP;
    Value proposal = engine_.propose_from_r(store_.read(state_.round, Phase::R));
    ProtocolMessage msg{Phase::P, id_, state_.round, proposal};

    DVLOG(5) << id_ << " round: " << state_.round << " broadcast P: " << msg;

    send_and_record(msg);
    step_ = AwaitP;
    return true;
}


BenOr::Step BenOr::resolve() {
    if (!can_act()) {
        return step_;
    }

    if (step_ != AwaitP) {
        LOG(WARNING) << id_ << " resolve called in step " << step_;
        return step_;
    }

    step_ = Resolve;
    Resolution res = engine_.resolve_from_p(store_.read(state_.round, Phase::P),
                                            state_.current_value.value());
    ++metrics_.rounds_number;

    state_.current_value = res.value;

    DVLOG(5) << id_ << " round: " << state_.round << " resolved x: " << res.value
             << " decided: " << res.decided;

    if (res.decided) {
        state_.decided = true;
        metrics_.decided_round = state_.round;
        step_ = Decided;

        LOG(INFO) << id_ << " DECIDED round: " << state_.round << " decision: " << res.value;
        return step_;
    }

    advance_round();
    return step_;
}


bool BenOr::finished() const {
    return state_.stopped || state_.is_faulty() || step_ == Decided;
}


bool BenOr::can_act() const {
    return !state_.stopped && !state_.is_faulty() && step_ != Decided;
}

void BenOr::send_and_record(const ProtocolMessage& msg) {
    net_.broadcast(make_protocol_message(msg));
    CHECK(store_.record(msg)) << id_ << " own message for a pruned round: " << msg;
}

void BenOr::advance_round() {
    ++state_.round;
    store_.prune(state_.round);
    step_ = NextRound;

    DVLOG(5) << id_ << " advanced to round: " << state_.round;
}


std::ostream& operator<<(std::ostream& out, BenOr::Step step) {
    static const char* names[] = {
        "Idle", "BroadcastR", "AwaitR", "BroadcastP", "AwaitP", "Resolve", "Decided", "NextRound",
    };
    return out << names[step];
}
