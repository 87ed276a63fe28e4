#pragma once

#include "autodial.hpp"
#include "bidder.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "random_policy.hpp"
#include "slot_ledger.hpp"
#include "core/move_generator.hpp"
#include "ledger/ledger_client.hpp"
#include <cstdint>
#include <stdexcept>

namespace agent {

// Registration could not be completed; the session cannot continue
struct RegistrationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class MatchEnd {
    NoMoves,        // our side has no legal move
    MoveRejected,   // ledger refused our submission
    Timeout,        // the board stopped changing
    Finished,       // ledger no longer reports the match as active
    Aborted         // transport or parse failure cut the attempt short
};

const char* match_end_name(MatchEnd end) noexcept;

struct MatchOutcome {
    uint64_t index = 0;
    bool claimed = false;
    bool moves_first = false;
    int moves_played = 0;
    MatchEnd end = MatchEnd::Aborted;
};

// Register -> (discover -> claim -> play)*
class Session {
public:
    Session(ledger::LedgerClient& client, Clock& clock, Config config);
    ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Throws RegistrationError when the ledger keeps failing or refuses twice
    const ledger::PlayerId& register_player();

    // One discover/claim/play cycle. Registers first if needed.
    MatchOutcome run_once();

    // Registers, then plays until config.max_matches cycles are done (0 = forever)
    void run();

    const ledger::PlayerId& player() const noexcept { return player_; }
    uint64_t next_index() const noexcept { return next_index_; }

private:
    Clock& clock_;
    Config config_;
    ledger::LedgerClient& client_;
    SlotLedger ledger_;
    core::MoveGenerator generator_;
    RandomPolicy policy_;

    ledger::PlayerId player_;
    uint64_t next_index_;

    void play(const ClaimResult& claim, MatchOutcome& outcome);

    // Polls until the board differs from `from` or the match stops being
    // active. False if move_timeout elapses first.
    bool await_change(uint64_t index, const core::Board& from, ledger::BoardReport& out);
};

} // namespace agent
