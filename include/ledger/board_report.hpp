#pragma once

#include "core/board.hpp"
#include "ledger_client.hpp"
#include <string>

namespace ledger {

enum class MatchStatus {
    NotStarted,
    WaitingForJoin,
    Active,
    Finished    // anything the ledger reports beyond the three above
};

MatchStatus parse_status(const std::string& text) noexcept;
const char* status_name(MatchStatus status) noexcept;

struct BoardReport {
    MatchStatus status = MatchStatus::NotStarted;
    PlayerId player1;
    PlayerId player2;
    core::Board board;
};

// Parses the get_checkers_board text:
//   status: <status>
//   player 1: <id>
//   player 2: <id>
//   ...
//   1 | b . b . b . b . |      (eight rows, '|' at offset 2)
// Throws ParseError on anything else.
BoardReport parse_board_report(const std::string& text);

// Inverse of parse_board_report, as the ledger renders it
std::string format_board_report(const BoardReport& report);

} // namespace ledger
