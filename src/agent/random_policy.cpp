#include "agent/random_policy.hpp"
#include <stdexcept>

namespace agent {

RandomPolicy::RandomPolicy() : rng_(std::random_device{}()) {
}

RandomPolicy::RandomPolicy(uint32_t seed) : rng_(seed) {
}

const core::Move& RandomPolicy::select(const std::vector<core::Move>& moves) {
    if (moves.empty()) {
        throw std::invalid_argument("RandomPolicy::select called without moves");
    }
    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    return moves[dist(rng_)];
}

} // namespace agent
