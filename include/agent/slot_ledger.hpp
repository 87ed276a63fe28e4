#pragma once

#include "clock.hpp"
#include "ledger/board_report.hpp"
#include "ledger/ledger_client.hpp"
#include "core/move.hpp"
#include <chrono>
#include <cstdint>

namespace agent {

// Index-addressed view of the ledger used by discovery, claiming and play.
// Board queries are retried on TransportError; RpcError and ParseError
// propagate untouched.
class SlotLedger {
public:
    SlotLedger(ledger::LedgerClient& client, Clock& clock,
               int retries, std::chrono::milliseconds retry_delay);
    ~SlotLedger() = default;

    ledger::BoardReport fetch(uint64_t index);

    void create(uint64_t index);
    void join(uint64_t index);
    void play(uint64_t index, const core::Move& move);

    ledger::LedgerClient& client() noexcept { return client_; }
    Clock& clock() noexcept { return clock_; }

    int queries() const noexcept { return queries_; }

private:
    ledger::LedgerClient& client_;
    Clock& clock_;
    int retries_;
    std::chrono::milliseconds retry_delay_;
    int queries_ = 0;
};

} // namespace agent
