#include "simulation.hpp"

#include <algorithm>
#include <random>
#include <thread>


Simulation::Simulation(SimulationConfig& config, std::function<Value(uint32_t)> gen_value)
    : config_(config), net_(config.avg_delay) {
    CHECK_GT(config_.nodes, 0u);
    CHECK_LE(config_.fail, config_.nodes);
    generate_nodes(gen_value);
}

Simulation::~Simulation() {
    shutdown();
}

void Simulation::run() {
    CHECK(!nodes_.empty());

    for (auto& node : nodes_) {
        node->run();
        ++running_nodes_;
    }

    for (auto& node : nodes_) {
        if (node->is_fair()) {
            node->start();
        }
    }
}

bool Simulation::wait_decided(std::chrono::milliseconds timeout) {
    return wait_for(timeout, [](const NodeConsensusState& state) {
        return state.decided;
    });
}

bool Simulation::wait_round(uint32_t round, std::chrono::milliseconds timeout) {
    return wait_for(timeout, [round](const NodeConsensusState& state) {
        return state.round > round;
    });
}

void Simulation::stop() {
    for (auto& node : nodes_) {
        node->stop();
    }
}

void Simulation::shutdown() {
    for (auto& node : nodes_) {
        node->shutdown();
    }
    net_.shutdown();
}

std::vector<std::unique_ptr<BenOrNode>>& Simulation::get_nodes() {
    return nodes_;
}

std::vector<NodeConsensusState> Simulation::fair_snapshots() {
    std::vector<NodeConsensusState> snapshots;
    for (auto& node : nodes_) {
        if (node->is_fair()) {
            snapshots.push_back(node->snapshot());
        }
    }
    return snapshots;
}

std::optional<Value> Simulation::get_decision() {
    std::optional<Value> decision;
    for (const auto& state : fair_snapshots()) {
        if (!state.decided) {
            continue;
        }

        if (decision.has_value() && decision != state.current_value) {
            LOG(ERROR) << "fair nodes decided different values";
            return std::nullopt;
        }
        decision = state.current_value;
    }
    return decision;
}

void Simulation::write_results(std::ofstream& file, size_t run_id) {
    size_t decided = 0;
    uint32_t max_round = 0;
    for (const auto& state : fair_snapshots()) {
        decided += state.decided ? 1 : 0;
        max_round = std::max(max_round, state.round);
    }

    auto decision = get_decision();

    file << "BenOr,"
         << config_.sim_type << ","
         << run_id << ","
         << config_.nodes << ","
         << config_.fail << ","
         << decided << ","
         << max_round << ",";
    if (decision.has_value()) {
        file << decision.value();
    }
    file << "\n";
    file.flush();
}


void Simulation::generate_nodes(const std::function<Value(uint32_t)>& gen_value) {
    std::vector<Role> roles(config_.nodes, Fair);
    std::fill_n(roles.begin(), config_.fail, FailStop);

    if (config_.shuffle) {
        std::mt19937 engine(std::random_device{}());
        std::shuffle(std::begin(roles), std::end(roles), engine);
    }

    QuorumConfig quorum(config_.nodes, config_.fail);
    auto nodes_are_ready = [this] {
        return running_nodes_ == config_.nodes;
    };

    for (uint32_t i = 0; i < config_.nodes; ++i) {
        NodeConfig node_config{i, quorum, gen_value(i), roles[i], config_.timing};
        nodes_.emplace_back(std::make_unique<BenOrNode>(node_config, net_, nodes_are_ready));
    }
}

bool Simulation::wait_for(std::chrono::milliseconds timeout,
                          const std::function<bool(const NodeConsensusState&)>& done) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto snapshots = fair_snapshots();
        if (std::all_of(snapshots.begin(), snapshots.end(), done)) {
            return true;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}
