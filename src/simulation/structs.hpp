#pragma once

#include <chrono>
#include <string>

#include "../consensus/config.hpp"

struct SimulationConfig {
    std::string sim_type;
    size_t nodes;
    size_t fail;
    bool shuffle{false};
    TimingConfig timing{};
    std::chrono::microseconds avg_delay{1000};
};
