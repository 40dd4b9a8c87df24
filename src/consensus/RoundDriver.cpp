#include "RoundDriver.hpp"

#include <glog/logging.h>


RoundDriver::RoundDriver(BenOr& machine, NodeConsensusState& state, DecisionEngine& engine,
                         INetManager& net, TimingConfig timing)
    : machine_(machine), state_(state), engine_(engine), net_(net), timing_(timing) {
}


std::optional<CancellationToken> RoundDriver::start(std::function<bool()> ready) {
    if (state_.stopped || state_.is_faulty()) {
        return std::nullopt;
    }

    if (token_.has_value()) {
        return token_;
    }

    token_ = CancellationToken();
    ready_ = std::move(ready);
    running_ = true;

    LOG(INFO) << net_.get_id() << " consensus started";

    await_readiness(token_.value());
    return token_;
}


void RoundDriver::stop() {
    if (token_.has_value()) {
        token_->cancel();
    }

    if (!state_.stopped) {
        LOG(INFO) << net_.get_id() << " stopped at round: " << state_.round;
    }

    state_.stopped = true;
    running_ = false;
}


NodeConsensusState RoundDriver::inspect() const {
    return engine_.observe(state_);
}


void RoundDriver::await_readiness(CancellationToken token) {
    if (token.cancelled()) {
        return;
    }

    if (!ready_ || ready_()) {
        run_round(token);
        return;
    }

    DVLOG(5) << net_.get_id() << " waiting for peers";
    schedule(timing_.readiness_poll, token, [this, token] {
        this->await_readiness(token);
    });
}


void RoundDriver::run_round(CancellationToken token) {
    if (token.cancelled() || machine_.finished()) {
        running_ = false;
        return;
    }

    machine_.broadcast_r();

    schedule(timing_.round_window, token, [this, token] {
        machine_.broadcast_p();

        schedule(timing_.round_window, token, [this, token] {
            if (machine_.resolve() == BenOr::Decided) {
                running_ = false;
                return;
            }

            schedule(timing_.round_gap, token, [this, token] {
                this->run_round(token);
            });
        });
    });
}


void RoundDriver::schedule(std::chrono::milliseconds delay, CancellationToken token,
                           std::function<void()> task) {
    net_.set_timer(delay, [token, task = std::move(task)] {
        if (token.cancelled()) {
            return;
        }
        task();
    });
}
