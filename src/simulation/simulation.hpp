#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "../network/network.hpp"
#include "../node/node.hpp"
#include "structs.hpp"

/*  N nodes on one TimerNetwork, the first config.fail of them faulty
    (positions shuffled if config.shuffle). */
class Simulation {
public:
    Simulation(SimulationConfig& config, std::function<Value(uint32_t)> gen_value);
    ~Simulation();

    void run();

    // true if every fair node decided before the deadline
    bool wait_decided(std::chrono::milliseconds timeout);
    // waits until every fair node passed the given round, false on timeout
    bool wait_round(uint32_t round, std::chrono::milliseconds timeout);

    void stop();
    void shutdown();

    std::vector<std::unique_ptr<BenOrNode>>& get_nodes();
    std::vector<NodeConsensusState> fair_snapshots();

    // decision shared by all decided fair nodes, nullopt if none decided or they disagree
    std::optional<Value> get_decision();

    void write_results(std::ofstream& file, size_t run_id);

private:
    void generate_nodes(const std::function<Value(uint32_t)>& gen_value);
    bool wait_for(std::chrono::milliseconds timeout, const std::function<bool(const NodeConsensusState&)>& done);

private:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

    SimulationConfig config_;
    TimerNetwork net_;
    std::atomic<size_t> running_nodes_{0};
    std::vector<std::unique_ptr<BenOrNode>> nodes_;
};
