#include "node.hpp"

void to_json(json& j, NodeHealth health) {
    j = (health == NodeHealth::Live ? "live" : "faulty");
}


BenOrNode::BenOrNode(NodeConfig config, INetwork& net, std::function<bool()> nodes_are_ready,
                     std::unique_ptr<ICoin> coin)
    : config_(config),
      nodes_are_ready_(std::move(nodes_are_ready)),
      state_(NodeConsensusState::initial(config.initial_value, config.role != Fair)),
      coin_(coin ? std::move(coin) : std::make_unique<RandomCoin>(config.coin_seed)),
      engine_(config.quorum, *coin_),
      net_manager_(std::make_unique<NetManager>(
          config.id, net.add_node(config.id), net,
          [this](Message msg) { this->handle_message(std::move(msg)); })),
      machine_(config.id, state_, store_, engine_, *net_manager_),
      driver_(machine_, state_, engine_, *net_manager_, config.timing) {
    CHECK_LT(config_.id, config_.quorum.nodes) << "node id out of range";
}

BenOrNode::~BenOrNode() {
    shutdown();
}


void BenOrNode::run() {
    if (msg_processor_.joinable()) {
        return;
    }

    net_manager_->update_nodes();
    if (net_manager_->get_nodes_cnt() != config_.quorum.nodes) {
        LOG(WARNING) << config_.id << " sees " << net_manager_->get_nodes_cnt()
                     << " nodes, configured for " << config_.quorum.nodes;
    }

    processing_ = true;
    std::thread thread([this]() {
        net_manager_->handle_messages();
        processing_ = false;
    });

    msg_processor_ = std::move(thread);
}

void BenOrNode::shutdown() {
    if (!msg_processor_.joinable()) {
        return;
    }

    net_manager_->stop_receive();
    msg_processor_.join();
}


NodeHealth BenOrNode::status() const {
    return is_fair() ? NodeHealth::Live : NodeHealth::Faulty;
}

bool BenOrNode::submit_message(const ProtocolMessage& msg) {
    return dispatch([this, msg] {
        return this->accept(msg);
    });
}

std::optional<CancellationToken> BenOrNode::start() {
    auto token = dispatch([this] {
        return driver_.start(nodes_are_ready_);
    });

    if (!token.has_value()) {
        LOG(WARNING) << config_.id << " start rejected: node is faulty or stopped";
    }
    return token;
}

void BenOrNode::stop() {
    dispatch([this] {
        driver_.stop();
    });
}

NodeConsensusState BenOrNode::snapshot() {
    return dispatch([this] {
        return driver_.inspect();
    });
}

std::vector<uint32_t> BenOrNode::stored_rounds() {
    return dispatch([this] {
        return store_.rounds();
    });
}

BenOrMetrics BenOrNode::get_metrics() {
    return dispatch([this] {
        return machine_.get_metrics();
    });
}


void BenOrNode::handle_message(Message msg) {
    auto protocol_msg = extract_protocol_message(msg);
    if (!protocol_msg.has_value()) {
        LOG(WARNING) << config_.id << " dropped malformed message: " << msg;
        return;
    }

    accept(protocol_msg.value());
}

bool BenOrNode::accept(const ProtocolMessage& msg) {
    if (state_.stopped || state_.is_faulty()) {
        DVLOG(6) << config_.id << " unavailable, rejected: " << msg;
        return false;
    }

    DVLOG(6) << config_.id << " got msg: " << msg;

    // nothing reads the store after the decision
    if (state_.decided) {
        return true;
    }
    if (!store_.record(msg)) {
        DVLOG(6) << config_.id << " round: " << state_.round << " stale, ignored: " << msg;
    }
    return true;
}
