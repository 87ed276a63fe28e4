#pragma once

#include "slot_ledger.hpp"
#include <cstdint>

namespace agent {

// Finds where the run of active matches ends. Matches are opened in index
// order, so active slots form a prefix of unknown length; the search gallops
// forward with a doubling step to bound it, then bisects the last gap.
class Autodial {
public:
    Autodial(SlotLedger& ledger, bool verbose);
    ~Autodial() = default;

    // Lowest index >= start whose match is not active
    uint64_t find_free_slot(uint64_t start);

    int last_probe_count() const noexcept { return probes_; }

private:
    SlotLedger& ledger_;
    bool verbose_;
    int probes_ = 0;

    bool is_occupied(uint64_t index);
};

} // namespace agent
