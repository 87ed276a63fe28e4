#include "agent/slot_ledger.hpp"
#include "core/slot_index.hpp"
#include "ledger/errors.hpp"
#include <iostream>

namespace agent {

SlotLedger::SlotLedger(ledger::LedgerClient& client, Clock& clock,
                       int retries, std::chrono::milliseconds retry_delay)
    : client_(client), clock_(clock), retries_(retries), retry_delay_(retry_delay) {
}

ledger::BoardReport SlotLedger::fetch(uint64_t index) {
    const core::SlotCoord coord = core::SlotIndex::decode(index);
    for (int attempt = 0;; ++attempt) {
        try {
            queries_++;
            return ledger::parse_board_report(client_.get_checkers_board(coord.x, coord.y));
        } catch (const ledger::TransportError& ex) {
            if (attempt >= retries_) throw;
            std::cerr << "[LEDGER] Board query for slot " << index << " failed ("
                      << ex.what() << "), retrying\n";
            clock_.sleep_for(retry_delay_);
        }
    }
}

void SlotLedger::create(uint64_t index) {
    const core::SlotCoord coord = core::SlotIndex::decode(index);
    client_.new_checkers_game(coord.x, coord.y, "0");
}

void SlotLedger::join(uint64_t index) {
    const core::SlotCoord coord = core::SlotIndex::decode(index);
    client_.join_checkers_game(coord.x, coord.y);
}

void SlotLedger::play(uint64_t index, const core::Move& move) {
    const core::SlotCoord coord = core::SlotIndex::decode(index);
    client_.play_checkers(coord.x, coord.y, move);
}

} // namespace agent
