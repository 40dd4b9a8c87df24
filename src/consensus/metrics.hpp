#pragma once

#include <cstddef>
#include <optional>

struct BenOrMetrics {
    // rounds that went through the resolve phase
    size_t rounds_number{0};
    std::optional<size_t> decided_round;
};
