#include "ledger/board_report.hpp"
#include "ledger/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace ledger {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

std::string trim(const std::string& text) {
    auto first = std::find_if(text.begin(), text.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    auto last = std::find_if(text.rbegin(), text.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base();
    return first < last ? std::string(first, last) : std::string();
}

// Value after "<label>:" anywhere in the line, label matched case-insensitively
std::string read_field(const std::string& line, const std::string& label) {
    const std::string lowered = to_lower(line);
    const std::string key = label + ":";
    const auto pos = lowered.find(key);
    if (pos == std::string::npos) {
        throw ParseError("expected '" + label + ":' line, got: " + line);
    }
    return trim(line.substr(pos + key.size()));
}

} // namespace

MatchStatus parse_status(const std::string& text) noexcept {
    const std::string status = to_lower(trim(text));
    if (status == "not started") return MatchStatus::NotStarted;
    if (status == "waiting for join") return MatchStatus::WaitingForJoin;
    if (status == "active") return MatchStatus::Active;
    return MatchStatus::Finished;
}

const char* status_name(MatchStatus status) noexcept {
    switch (status) {
        case MatchStatus::NotStarted:     return "not started";
        case MatchStatus::WaitingForJoin: return "waiting for join";
        case MatchStatus::Active:         return "active";
        case MatchStatus::Finished:       return "finished";
    }
    return "finished";
}

BoardReport parse_board_report(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }

    // Header: first three non-blank lines
    std::vector<std::string> header;
    size_t cursor = 0;
    while (cursor < lines.size() && header.size() < 3) {
        if (!trim(lines[cursor]).empty()) header.push_back(lines[cursor]);
        cursor++;
    }
    if (header.size() < 3) {
        throw ParseError("board report is missing its status/player header");
    }

    BoardReport report;
    report.status = parse_status(read_field(header[0], "status"));
    report.player1 = read_field(header[1], "player 1");
    report.player2 = read_field(header[2], "player 2");

    int row = 0;
    for (; cursor < lines.size(); ++cursor) {
        const std::string& current = lines[cursor];
        if (current.size() < 4 || current[2] != '|') continue;

        std::string cells = current.substr(3, current.size() - 4);
        cells.erase(std::remove_if(cells.begin(), cells.end(), [](unsigned char ch) {
                        return std::isspace(ch);
                    }),
                    cells.end());

        if (row >= core::Board::SIZE) {
            throw ParseError("board report has more than 8 rows");
        }
        if (cells.size() != static_cast<size_t>(core::Board::SIZE)) {
            throw ParseError("board row " + std::to_string(row + 1) + " has " +
                             std::to_string(cells.size()) + " cells");
        }
        for (int col = 0; col < core::Board::SIZE; ++col) {
            core::Piece piece;
            if (!core::piece_from_char(cells[col], piece)) {
                throw ParseError(std::string("unknown board cell '") + cells[col] + "'");
            }
            report.board.set_piece(row, col, piece);
        }
        row++;
    }

    if (row != core::Board::SIZE) {
        throw ParseError("board report has " + std::to_string(row) + " rows");
    }
    return report;
}

std::string format_board_report(const BoardReport& report) {
    std::ostringstream oss;
    oss << "status: " << status_name(report.status) << "\n";
    oss << "player 1: " << report.player1 << "\n";
    oss << "player 2: " << report.player2 << "\n";
    oss << "\n" << report.board.to_string();
    return oss.str();
}

} // namespace ledger
