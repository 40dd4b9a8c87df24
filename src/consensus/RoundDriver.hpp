#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "../network/netmanager.hpp"
#include "BenOr.hpp"
#include "DecisionEngine.hpp"
#include "config.hpp"
#include "state.hpp"

// shared flag, every scheduled callback checks it before running
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
    }

    bool cancelled() const {
        return cancelled_->load();
    }

    void cancel() {
        cancelled_->store(true);
    }

    bool operator==(const CancellationToken& other) const {
        return cancelled_ == other.cancelled_;
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};


class RoundDriver {
public:
    RoundDriver(BenOr& machine, NodeConsensusState& state, DecisionEngine& engine,
                INetManager& net, TimingConfig timing);

    /*  Runs rounds once ready() returns true. Repeated calls return the same token.
        nullopt if the node is stopped or faulty. */
    std::optional<CancellationToken> start(std::function<bool()> ready);

    void stop();

    NodeConsensusState inspect() const;

    bool running() const {
        return running_;
    }

private:
    void await_readiness(CancellationToken token);
    void run_round(CancellationToken token);
    void schedule(std::chrono::milliseconds delay, CancellationToken token, std::function<void()> task);

private:
    BenOr& machine_;
    NodeConsensusState& state_;
    DecisionEngine& engine_;
    INetManager& net_;
    TimingConfig timing_;

    std::function<bool()> ready_;
    std::optional<CancellationToken> token_;
    bool running_{false};
};
