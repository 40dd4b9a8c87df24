#include "network.hpp"


/////////////////////////////////////     TimerNetwork     ///////////////////////////////////////////

TimerNetwork::TimerNetwork(std::chrono::microseconds avg_delay) : avg_delay_(avg_delay) {
}

IChannel& TimerNetwork::add_node(uint32_t node_id) {
    auto& channel = node_channels_[node_id];
    if (!channel) {
        channel = std::make_unique<TimerChannel>(avg_delay_);
    }

    return *channel;
}

std::unordered_map<uint32_t, Sender> TimerNetwork::get_nodes() {
    std::unordered_map<uint32_t, Sender> nodes;
    for (const auto& node : node_channels_) {
        nodes.emplace(node.first, node.second->get_sender());
    }
    return nodes;
}

void TimerNetwork::shutdown() {
    for (auto& node : node_channels_) {
        node.second->stop();
    }
}
