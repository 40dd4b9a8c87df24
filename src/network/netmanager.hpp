#pragma once

#include <chrono>
#include <cstddef>
#include <glog/logging.h>
#include <functional>
#include <unordered_map>

#include "../core/message.hpp"
#include "channel.hpp"
#include "network.hpp"

class INetManager {
public:
    virtual void update_nodes() = 0;
    virtual uint32_t get_nodes_cnt() const = 0;
    virtual uint32_t get_id() const = 0;
    // to every peer except this node, unreachable peers are skipped
    virtual void broadcast(Message msg) = 0;
    virtual void handle_messages() = 0;
    virtual void stop_receive() = 0;
    virtual void set_timer(std::chrono::milliseconds, std::function<void()>) = 0;
    virtual void post(std::function<void()>) = 0;
    virtual ~INetManager() = default;
};


class NetManager : public INetManager {
public:
    NetManager(
        uint32_t id,
        IChannel& channel,
        INetwork& net,
        std::function<void(Message)> handler = [](Message) {}
    ) : id_(id), channel_(channel), net_(net) {

        channel_.set_handler([handler = std::move(handler)](Message msg) {
            DVLOG(7) << msg.to << " <-- " << msg.from << " " << msg << std::endl;
            handler(std::move(msg));
        });
    }

    void update_nodes() override {
        auto nodes = net_.get_nodes();
        DVLOG(3) << id_ << " GET NODES: " << nodes.size() << std::endl;
        nodes_ = std::move(nodes);
    }

    uint32_t get_nodes_cnt() const override {
        return nodes_.size();
    }

    uint32_t get_id() const override {
        return id_;
    }

    void handle_messages() override {
        channel_.handle_messages();
    }

    void stop_receive() override {
        channel_.stop();
    }

    void broadcast(Message msg) override {
        msg.from = id_;
        for (auto& node : nodes_) {
            if (node.first == id_) {
                continue;
            }

            msg.to = node.first;
            DVLOG(7) << msg.from << " --> " << msg.to << " " << msg << std::endl;
            if (!node.second.send(msg)) {
                DVLOG(7) << msg.from << " --> " << msg.to << " unreachable, skipped" << std::endl;
            }
        }
    }

    void set_timer(std::chrono::milliseconds timeout, std::function<void()> handler) override {
        channel_.set_timer(timeout, std::move(handler));
    }

    void post(std::function<void()> task) override {
        channel_.post(std::move(task));
    }

private:
    uint32_t id_;
    IChannel& channel_;
    INetwork& net_;
    std::unordered_map<uint32_t, Sender> nodes_;
};
