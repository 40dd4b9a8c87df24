#pragma once
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

#include "../core/message.hpp"
#include "../core/protocol.hpp"
#include "../network/netmanager.hpp"
#include "../network/network.hpp"
#include "../consensus/BenOr.hpp"
#include "../consensus/DecisionEngine.hpp"
#include "../consensus/MessageStore.hpp"
#include "../consensus/RoundDriver.hpp"
#include "../consensus/coin.hpp"
#include "../consensus/metrics.hpp"
#include "../consensus/state.hpp"
#include "config.hpp"

enum class NodeHealth {
    Live,
    Faulty,
};

void to_json(json& j, NodeHealth health);


/*  One protocol participant with its own event loop thread.
    Public calls may come from any thread, they are executed on the loop. */
class BenOrNode {
public:
    BenOrNode(NodeConfig config, INetwork& net, std::function<bool()> nodes_are_ready,
              std::unique_ptr<ICoin> coin = nullptr);

    BenOrNode(const BenOrNode&) = delete;
    BenOrNode& operator=(const BenOrNode&) = delete;

    ~BenOrNode();

    // starts the event loop, the node can receive messages afterwards
    void run();
    // stops the event loop and joins it
    void shutdown();

    NodeHealth status() const;

    // false if the node is stopped or faulty
    bool submit_message(const ProtocolMessage& msg);

    // nullopt if the node is stopped or faulty
    std::optional<CancellationToken> start();

    void stop();

    NodeConsensusState snapshot();

    BenOrMetrics get_metrics();

    // rounds currently held by the message store
    std::vector<uint32_t> stored_rounds();

    uint32_t get_id() const {
        return config_.id;
    }

    bool is_fair() const {
        return config_.role == Fair;
    }

private:
    void handle_message(Message msg);
    bool accept(const ProtocolMessage& msg);

    template <typename F>
    auto dispatch(F task) -> decltype(task());

private:
    NodeConfig config_;
    std::function<bool()> nodes_are_ready_;

    NodeConsensusState state_;
    MessageStore store_;
    std::unique_ptr<ICoin> coin_;
    DecisionEngine engine_;
    std::unique_ptr<INetManager> net_manager_;
    BenOr machine_;
    RoundDriver driver_;

    std::thread msg_processor_;
    std::atomic<bool> processing_{false};
};


template <typename F>
auto BenOrNode::dispatch(F task) -> decltype(task()) {
    using namespace std::chrono_literals;
    using Result = decltype(task());

    if (!processing_ || std::this_thread::get_id() == msg_processor_.get_id()) {
        return task();
    }

    // whoever claims the task first runs it, the loop or the caller once the loop is gone
    auto claimed = std::make_shared<std::atomic<bool>>(false);
    auto shared_task = std::make_shared<F>(std::move(task));
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    net_manager_->post([promise, claimed, shared_task]() {
        if (claimed->exchange(true)) {
            return;
        }
        if constexpr (std::is_void_v<Result>) {
            (*shared_task)();
            promise->set_value();
        } else {
            promise->set_value((*shared_task)());
        }
    });

    while (future.wait_for(10ms) != std::future_status::ready) {
        if (!processing_ && !claimed->exchange(true)) {
            DVLOG(6) << config_.id << " event loop is gone, running the call in place";
            return (*shared_task)();
        }
    }
    return future.get();
}
