#pragma once

#include <chrono>
#include <cstdint>
#include <glog/logging.h>

struct QuorumConfig {
    uint32_t nodes;
    uint32_t faults;

    QuorumConfig(uint32_t nodes_cnt, uint32_t faults_cnt) : nodes(nodes_cnt), faults(faults_cnt) {
        CHECK_GT(nodes, 0u) << "quorum needs at least one node";
    }

    // F <= N/2, termination is allowed only under this assumption
    bool fault_bound_respected() const {
        return 2 * static_cast<uint64_t>(faults) <= nodes;
    }

    // strictly more than N/2
    bool majority(size_t count) const {
        return 2 * count > nodes;
    }

    size_t decide_threshold() const {
        return faults >= nodes ? 0 : nodes - faults;
    }

    size_t adopt_threshold() const {
        return static_cast<size_t>(faults) + 1;
    }
};


struct TimingConfig {
    std::chrono::milliseconds round_window{100};
    std::chrono::milliseconds round_gap{100};
    std::chrono::milliseconds readiness_poll{10};
};
