#include "agent/session.hpp"
#include "ledger/errors.hpp"
#include <iostream>
#include <utility>

namespace agent {

const char* match_end_name(MatchEnd end) noexcept {
    switch (end) {
        case MatchEnd::NoMoves:      return "no legal moves";
        case MatchEnd::MoveRejected: return "move rejected";
        case MatchEnd::Timeout:      return "timed out";
        case MatchEnd::Finished:     return "finished";
        case MatchEnd::Aborted:      return "aborted";
    }
    return "aborted";
}

Session::Session(ledger::LedgerClient& client, Clock& clock, Config config)
    : clock_(clock)
    , config_(std::move(config))
    , client_(client)
    , ledger_(client, clock, config_.rpc_retries, config_.rpc_retry_delay)
    , generator_(config_.rules)
    , policy_(config_.seed == 0 ? RandomPolicy() : RandomPolicy(config_.seed))
    , next_index_(config_.start_index) {
}

const ledger::PlayerId& Session::register_player() {
    auto delay = config_.register_retry_delay;

    for (int attempt = 1; attempt <= config_.register_attempts; ++attempt) {
        try {
            try {
                player_ = client_.register_my_player();
                std::cout << "[SESSION] Registered as player " << player_ << "\n";
            } catch (const ledger::RpcError& ex) {
                // Already registered; look the identity up instead
                try {
                    player_ = client_.get_my_player();
                } catch (const ledger::RpcError& inner) {
                    throw RegistrationError(std::string("failed to load player information: ") +
                                            inner.what());
                }
                std::cout << "[SESSION] Using existing player " << player_ << "\n";
            }

            if (config_.registration_settle.count() > 0) {
                if (config_.verbose) {
                    std::cout << "[SESSION] Waiting for the registration to be included...\n";
                }
                clock_.sleep_for(config_.registration_settle);
            }
            return player_;
        } catch (const ledger::TransportError& ex) {
            std::cerr << "[SESSION] WARN: connection failed (attempt " << attempt << "/"
                      << config_.register_attempts << "): " << ex.what() << "\n";
            if (attempt < config_.register_attempts) {
                clock_.sleep_for(delay);
                delay *= 2;
            }
        }
    }

    throw RegistrationError("could not reach the ledger after " +
                            std::to_string(config_.register_attempts) + " attempts");
}

MatchOutcome Session::run_once() {
    if (player_.empty()) {
        register_player();
    }

    MatchOutcome outcome;
    outcome.index = next_index_;

    try {
        Autodial autodial(ledger_, config_.verbose);
        const uint64_t candidate = autodial.find_free_slot(next_index_);

        Bidder bidder(ledger_, player_, config_);
        ClaimResult claim = bidder.claim(candidate);

        outcome.index = claim.index;
        outcome.claimed = true;
        outcome.moves_first = claim.moves_first;

        play(claim, outcome);
    } catch (const ledger::ParseError& ex) {
        std::cerr << "[SESSION] Unreadable board report: " << ex.what() << "\n";
        outcome.end = MatchEnd::Aborted;
    } catch (const ledger::TransportError& ex) {
        std::cerr << "[SESSION] Ledger unreachable: " << ex.what() << "\n";
        outcome.end = MatchEnd::Aborted;
    } catch (const ledger::RpcError& ex) {
        std::cerr << "[SESSION] Ledger refused a board query: " << ex.what() << "\n";
        outcome.end = MatchEnd::Aborted;
    }

    // A match we sat in is done for good; otherwise search again from the same place
    if (outcome.claimed) {
        next_index_ = outcome.index + 1;
    }

    std::cout << "[SESSION] Game " << outcome.index << " over (" << match_end_name(outcome.end)
              << ", " << outcome.moves_played << " moves played). Moving on...\n";
    return outcome;
}

void Session::run() {
    register_player();

    for (int played = 0; config_.max_matches == 0 || played < config_.max_matches; ++played) {
        run_once();
    }
}

void Session::play(const ClaimResult& claim, MatchOutcome& outcome) {
    const core::Side side = claim.moves_first ? core::Side::Red : core::Side::Black;
    core::Board board = claim.board;

    if (config_.verbose) {
        std::cout << "[PLAY] Game " << claim.index << " as "
                  << (side == core::Side::Red ? "red" : "black") << "\n";
    }

    for (;;) {
        const std::vector<core::Move> moves = generator_.generate(board, side);
        if (moves.empty()) {
            outcome.end = MatchEnd::NoMoves;
            return;
        }

        const core::Move move = policy_.select(moves);
        if (config_.verbose) {
            std::cout << "[PLAY] " << move.to_string() << " (from " << moves.size() << " moves)\n";
        }

        try {
            ledger_.play(claim.index, move);
        } catch (const ledger::RpcError& ex) {
            std::cerr << "[PLAY] Failed to play move: " << ex.what() << "\n";
            outcome.end = MatchEnd::MoveRejected;
            return;
        } catch (const ledger::TransportError& ex) {
            std::cerr << "[PLAY] Failed to play move: " << ex.what() << "\n";
            outcome.end = MatchEnd::MoveRejected;
            return;
        }
        outcome.moves_played++;

        core::Board expected = board;
        expected.apply(move);

        // First our own move has to show up, then the opponent's reply
        ledger::BoardReport report;
        if (!await_change(claim.index, board, report)) {
            std::cerr << "[PLAY] Our move never reached the ledger\n";
            outcome.end = MatchEnd::Timeout;
            return;
        }
        if (report.status != ledger::MatchStatus::Active) {
            outcome.end = MatchEnd::Finished;
            return;
        }

        if (report.board == expected) {
            if (!await_change(claim.index, expected, report)) {
                std::cerr << "[PLAY] Timed out waiting for other player move!\n";
                outcome.end = MatchEnd::Timeout;
                return;
            }
            if (report.status != ledger::MatchStatus::Active) {
                outcome.end = MatchEnd::Finished;
                return;
            }
        }

        board = report.board;
    }
}

bool Session::await_change(uint64_t index, const core::Board& from, ledger::BoardReport& out) {
    const auto started = clock_.now();
    do {
        clock_.sleep_for(config_.move_poll_interval);
        out = ledger_.fetch(index);
        if (out.board != from || out.status != ledger::MatchStatus::Active) {
            return true;
        }
    } while (clock_.elapsed_since(started) < config_.move_timeout);
    return false;
}

} // namespace agent
