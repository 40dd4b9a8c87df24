#pragma once

#include <chrono>
#include <memory>
#include <unordered_map>

#include "../core/message.hpp"
#include "channel.hpp"

class INetwork {
public:
    virtual IChannel& add_node(uint32_t node_id) = 0;
    virtual std::unordered_map<uint32_t, Sender> get_nodes() = 0;
    virtual ~INetwork() = default;
};


// every delivery is delayed by a random amount around avg_delay
class TimerNetwork : public INetwork {
public:
    explicit TimerNetwork(std::chrono::microseconds avg_delay = std::chrono::microseconds(1000));

    IChannel& add_node(uint32_t node_id) override;
    std::unordered_map<uint32_t, Sender> get_nodes() override;
    void shutdown();

private:
    std::chrono::microseconds avg_delay_;
    std::unordered_map<uint32_t, std::unique_ptr<TimerChannel>> node_channels_;
};
