#include "agent/bidder.hpp"
#include "ledger/errors.hpp"
#include <iostream>
#include <utility>

namespace agent {

Bidder::Bidder(SlotLedger& ledger, ledger::PlayerId self, const Config& config)
    : ledger_(ledger), self_(std::move(self)), config_(config) {
}

ClaimResult Bidder::claim(uint64_t start) {
    uint64_t index = start;
    ClaimResult result;

    for (;;) {
        ledger::BoardReport report = ledger_.fetch(index);
        if (config_.verbose) {
            std::cout << "[BID] Slot " << index << " is " << ledger::status_name(report.status) << "\n";
        }

        bool waited = false;
        Wait wait = Wait::Advance;

        if (report.status == ledger::MatchStatus::NotStarted) {
            if (try_create(index)) {
                wait = await_joiner(index, result);
                waited = true;
            } else {
                // Somebody else may have opened it in the meantime
                report = ledger_.fetch(index);
            }
        }

        if (!waited && report.status == ledger::MatchStatus::WaitingForJoin) {
            if (report.player1 == self_) {
                // Our own earlier create landed after all
                wait = await_joiner(index, result);
                waited = true;
            } else if (try_join(index)) {
                wait = await_first_move(index, report, result);
                waited = true;
            }
        }

        if (waited && wait == Wait::Claimed) {
            return result;
        }
        if (waited && wait == Wait::RetrySame) {
            continue;
        }
        index++;
    }
}

bool Bidder::try_create(uint64_t index) {
    try {
        ledger_.create(index);
        if (config_.verbose) {
            std::cout << "[BID] Created new game at " << index << "\n";
        }
        return true;
    } catch (const ledger::RpcError& ex) {
        if (config_.verbose) {
            std::cout << "[BID] Could not start game at " << index << ": " << ex.what() << "\n";
        }
    } catch (const ledger::TransportError& ex) {
        if (config_.verbose) {
            std::cout << "[BID] Start request for " << index << " was lost: " << ex.what() << "\n";
        }
    }
    return false;
}

bool Bidder::try_join(uint64_t index) {
    try {
        ledger_.join(index);
        if (config_.verbose) {
            std::cout << "[BID] Joined game at " << index << "\n";
        }
        return true;
    } catch (const ledger::RpcError& ex) {
        if (config_.verbose) {
            std::cout << "[BID] Could not join game at " << index << ": " << ex.what() << "\n";
        }
    } catch (const ledger::TransportError& ex) {
        if (config_.verbose) {
            std::cout << "[BID] Join request for " << index << " was lost: " << ex.what() << "\n";
        }
    }
    return false;
}

Bidder::Wait Bidder::await_joiner(uint64_t index, ClaimResult& result) {
    Clock& clock = ledger_.clock();
    const auto started = clock.now();
    int unseen_polls = 0;

    for (;;) {
        ledger::BoardReport game = ledger_.fetch(index);

        // Until our create is included the slot still reads "not started"
        if (game.status == ledger::MatchStatus::NotStarted) {
            if (++unseen_polls > config_.create_grace_polls) {
                if (config_.verbose) {
                    std::cout << "[BID] Create for game " << index << " never showed up, bidding again\n";
                }
                return Wait::RetrySame;
            }
        } else if (game.player1 != self_) {
            if (config_.verbose) {
                std::cout << "[BID] Game " << index << " was taken by " << game.player1
                          << ", bidding again\n";
            }
            return Wait::RetrySame;
        }

        if (game.status == ledger::MatchStatus::Active) {
            result.index = index;
            result.board = game.board;
            result.moves_first = true;
            return Wait::Claimed;
        }

        if (game.status == ledger::MatchStatus::Finished) {
            return Wait::Advance;
        }

        if (config_.join_timeout.count() > 0 && clock.elapsed_since(started) >= config_.join_timeout) {
            if (config_.verbose) {
                std::cout << "[BID] Nobody joined game " << index << ", moving on\n";
            }
            return Wait::Advance;
        }

        if (config_.verbose) {
            std::cout << "[BID] Waiting for a player to join game " << index << "\n";
        }
        clock.sleep_for(config_.poll_interval);
    }
}

Bidder::Wait Bidder::await_first_move(uint64_t index, const ledger::BoardReport& before,
                                      ClaimResult& result) {
    Clock& clock = ledger_.clock();
    const auto started = clock.now();
    ledger::BoardReport game = before;

    while (game.board == before.board) {
        if (clock.elapsed_since(started) >= config_.move_timeout) {
            if (config_.verbose) {
                std::cout << "[BID] Creator of game " << index << " never moved, moving on\n";
            }
            return Wait::Advance;
        }

        if (config_.verbose) {
            std::cout << "[BID] Waiting for the opening move in game " << index << "\n";
        }
        clock.sleep_for(config_.poll_interval);
        game = ledger_.fetch(index);

        // Join not included yet
        if (game.status == ledger::MatchStatus::WaitingForJoin) continue;

        if (game.player2 != self_) {
            if (config_.verbose) {
                std::cout << "[BID] Seat in game " << index << " went to " << game.player2
                          << ", bidding again\n";
            }
            return Wait::Advance;
        }

        if (game.status == ledger::MatchStatus::Finished) {
            return Wait::Advance;
        }
    }

    result.index = index;
    result.board = game.board;
    result.moves_first = false;
    return Wait::Claimed;
}

} // namespace agent
