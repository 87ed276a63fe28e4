#pragma once

#include "core/move.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace agent {

class RandomPolicy {
public:
    RandomPolicy();
    explicit RandomPolicy(uint32_t seed);
    ~RandomPolicy() = default;

    // Uniform pick; moves must not be empty
    const core::Move& select(const std::vector<core::Move>& moves);

private:
    std::mt19937 rng_;
};

} // namespace agent
