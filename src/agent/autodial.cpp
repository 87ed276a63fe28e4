#include "agent/autodial.hpp"
#include <iostream>

namespace agent {

Autodial::Autodial(SlotLedger& ledger, bool verbose)
    : ledger_(ledger), verbose_(verbose) {
}

bool Autodial::is_occupied(uint64_t index) {
    probes_++;
    return ledger_.fetch(index).status == ledger::MatchStatus::Active;
}

uint64_t Autodial::find_free_slot(uint64_t start) {
    probes_ = 0;
    if (verbose_) {
        std::cout << "[AUTODIAL] Begin at " << start << "\n";
    }

    // Extending: probe start, start+1, start+3, start+7, ... until a free slot
    uint64_t step = 1;
    uint64_t low = start;        // last active probe, valid once any probe was active
    uint64_t high = start;       // first free probe
    bool seen_active = false;
    while (is_occupied(high)) {
        seen_active = true;
        low = high;
        high += step;
        step *= 2;
    }

    // Narrowing: invariant low is active, high is free
    if (seen_active) {
        while (high - low > 1) {
            const uint64_t mid = low + (high - low) / 2;
            if (is_occupied(mid)) {
                low = mid;
            } else {
                high = mid;
            }
        }
    }

    if (verbose_) {
        std::cout << "[AUTODIAL] Free slot at " << high << " after "
                  << probes_ << " queries\n";
    }
    return high;
}

} // namespace agent
