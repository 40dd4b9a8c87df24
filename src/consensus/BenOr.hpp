#pragma once

#include <iostream>

#include "../core/protocol.hpp"
#include "../network/netmanager.hpp"
#include "DecisionEngine.hpp"
#include "MessageStore.hpp"
#include "metrics.hpp"
#include "state.hpp"

/*  One node's round state machine:
        Idle -> BroadcastR -> AwaitR -> BroadcastP -> AwaitP -> Resolve -> (Decided | NextRound)
    NextRound re-enters BroadcastR. Waiting in AwaitR/AwaitP is up to the caller. */
class BenOr {
public:
    enum Step {
        Idle,
        BroadcastR,
        AwaitR,
        BroadcastP,
        AwaitP,
        Resolve,
        Decided,
        NextRound,
    };

public:
    BenOr(uint32_t id, NodeConsensusState& state, MessageStore& store,
          DecisionEngine& engine, INetManager& net);

    // Idle | NextRound -> AwaitR; false if the step did not run
    bool broadcast_r();
    // AwaitR -> AwaitP
    bool broadcast_p();
    // AwaitP -> Decided | NextRound
    Step resolve();

    Step step() const {
        return step_;
    }

    // no more rounds will be run
    bool finished() const;

    const BenOrMetrics& get_metrics() const {
        return metrics_;
    }

private:
    bool can_act() const;
    void send_and_record(const ProtocolMessage& msg);
    void advance_round();

private:
    uint32_t id_;
    NodeConsensusState& state_;
    MessageStore& store_;
    DecisionEngine& engine_;
    INetManager& net_;

    Step step_{Idle};
    BenOrMetrics metrics_;
};

std::ostream& operator<<(std::ostream& out, BenOr::Step step);
