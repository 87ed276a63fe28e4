#pragma once

#include "move.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace core {

enum class Piece : uint8_t {
    Empty = 0,
    RedMan,
    RedKing,
    BlackMan,
    BlackKing
};

inline bool is_king(Piece piece) noexcept {
    return piece == Piece::RedKing || piece == Piece::BlackKing;
}

inline bool belongs_to(Piece piece, Side side) noexcept {
    if (side == Side::Red) return piece == Piece::RedMan || piece == Piece::RedKing;
    return piece == Piece::BlackMan || piece == Piece::BlackKing;
}

// Ledger cell codes: '.', 'r', 'R', 'b', 'B'
char piece_to_char(Piece piece) noexcept;
bool piece_from_char(char code, Piece& out) noexcept;

class Board {
public:
    static constexpr int SIZE = 8;

    Board();  // empty board

    // Initial layout as the ledger creates it: black on rows 0-2, red on rows 5-7
    static Board standard();

    inline Piece get_piece(int row, int col) const noexcept {
        return cells_[to_index(row, col)];
    }

    inline Piece get_piece(Square sq) const noexcept {
        return get_piece(sq.row, sq.col);
    }

    inline bool is_empty(int row, int col) const noexcept {
        return get_piece(row, col) == Piece::Empty;
    }

    inline bool is_empty(Square sq) const noexcept {
        return is_empty(sq.row, sq.col);
    }

    void set_piece(int row, int col, Piece piece) noexcept;
    void set_piece(Square sq, Piece piece) noexcept { set_piece(sq.row, sq.col, piece); }
    void remove_piece(Square sq) noexcept { set_piece(sq, Piece::Empty); }

    int count(Side side) const noexcept;

    // Plays the move the way the ledger does: the piece leaves its origin,
    // each jumped piece is cleared and a man reaching row 0 or 7 is crowned.
    // Returns false and leaves the board untouched if the move does not fit.
    bool apply(const Move& move);

    // Ledger report rows, "1 | b . b . b . b . |" through row 8
    std::string to_string() const;

    bool operator==(const Board& other) const noexcept { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    std::array<Piece, SIZE * SIZE> cells_;

    static inline int to_index(int row, int col) noexcept {
        return row * SIZE + col;
    }
};

} // namespace core
