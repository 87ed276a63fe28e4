#pragma once

#include "core/move.hpp"
#include <cstdint>
#include <string>

namespace ledger {

using PlayerId = std::string;

// Request surface of the checkers ledger. Every call blocks until the ledger
// answers; failures are reported as TransportError or RpcError.
class LedgerClient {
public:
    virtual ~LedgerClient() = default;

    virtual PlayerId register_my_player() = 0;
    virtual PlayerId get_my_player() = 0;

    // Raw report text, see parse_board_report
    virtual std::string get_checkers_board(uint32_t x, uint32_t y) = 0;

    // `other_player` of "0" leaves the second seat open for a join
    virtual void new_checkers_game(uint32_t x, uint32_t y, const std::string& other_player) = 0;
    virtual void join_checkers_game(uint32_t x, uint32_t y) = 0;
    virtual void play_checkers(uint32_t x, uint32_t y, const core::Move& move) = 0;
};

} // namespace ledger
