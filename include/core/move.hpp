#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace core {

enum class Side {
    Red,    // player 1, moves first, men advance toward row 0
    Black   // player 2, men advance toward row 7
};

inline Side opponent(Side side) noexcept {
    return side == Side::Red ? Side::Black : Side::Red;
}

enum class Direction : uint8_t { NW, NE, SE, SW };

constexpr std::array<Direction, 4> ALL_DIRECTIONS = {
    Direction::NW, Direction::NE, Direction::SE, Direction::SW
};

inline int row_delta(Direction dir) noexcept {
    return (dir == Direction::NW || dir == Direction::NE) ? -1 : 1;
}

inline int col_delta(Direction dir) noexcept {
    return (dir == Direction::NW || dir == Direction::SW) ? -1 : 1;
}

// Wire token used by play_checkers ("NW", "NE", "SE", "SW")
const char* direction_token(Direction dir) noexcept;

struct Square {
    int8_t row, col;

    Square() : row(-1), col(-1) {}
    Square(int r, int c) : row(static_cast<int8_t>(r)), col(static_cast<int8_t>(c)) {}

    bool on_board() const noexcept {
        return row >= 0 && row < 8 && col >= 0 && col < 8;
    }

    Square step(Direction dir, int distance = 1) const noexcept {
        return Square{row + distance * row_delta(dir), col + distance * col_delta(dir)};
    }

    // Algebraic name used by the ledger: column letter then row label, e.g. "b6"
    std::string to_string() const {
        return std::string(1, static_cast<char>('a' + col)) + std::to_string(row + 1);
    }

    bool operator==(const Square& other) const noexcept {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Square& other) const noexcept {
        return !(*this == other);
    }
};

struct Move {
    enum class Kind : uint8_t { Step, Jump };

    Square origin;
    Kind kind = Kind::Step;
    std::vector<Direction> path;     // one entry for a step, one per hop for a jump
    std::vector<Square> captured;    // squares jumped over, in order

    Move() = default;

    static Move step(Square from, Direction dir) {
        Move m;
        m.origin = from;
        m.kind = Kind::Step;
        m.path.push_back(dir);
        return m;
    }

    bool is_jump() const noexcept { return kind == Kind::Jump; }

    Square destination() const noexcept;

    // Parameters that follow the slot coordinates in a play_checkers call
    std::vector<std::string> to_params() const;

    // e.g. "c6 move NE" or "a3 jump SE NE"
    std::string to_string() const;

    bool operator==(const Move& other) const noexcept {
        return origin == other.origin && kind == other.kind && path == other.path;
    }
};

} // namespace core
