#pragma once

#include "config.hpp"
#include "slot_ledger.hpp"
#include "core/board.hpp"
#include "ledger/board_report.hpp"
#include <cstdint>

namespace agent {

struct ClaimResult {
    uint64_t index = 0;
    core::Board board;        // position when it is first our turn
    bool moves_first = false; // true when we created the match (red)
};

// Claims a seat at or after a candidate index. Other agents race for the
// same slots with no coordination besides the ledger itself, so every claim
// is re-read until the ledger shows it took effect for us.
class Bidder {
public:
    Bidder(SlotLedger& ledger, ledger::PlayerId self, const Config& config);
    ~Bidder() = default;

    ClaimResult claim(uint64_t start);

private:
    enum class Wait { Claimed, RetrySame, Advance };

    SlotLedger& ledger_;
    ledger::PlayerId self_;
    const Config& config_;

    bool try_create(uint64_t index);
    bool try_join(uint64_t index);

    // Creator side: wait for somebody to join. RetrySame if our claim was overwritten.
    Wait await_joiner(uint64_t index, ClaimResult& result);

    // Joiner side: wait for the creator's first move. Advance if another agent holds seat 2.
    Wait await_first_move(uint64_t index, const ledger::BoardReport& before, ClaimResult& result);
};

} // namespace agent
