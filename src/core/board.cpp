#include "core/board.hpp"
#include <sstream>

namespace core {

char piece_to_char(Piece piece) noexcept {
    switch (piece) {
        case Piece::RedMan:    return 'r';
        case Piece::RedKing:   return 'R';
        case Piece::BlackMan:  return 'b';
        case Piece::BlackKing: return 'B';
        default:               return '.';
    }
}

bool piece_from_char(char code, Piece& out) noexcept {
    switch (code) {
        case '.': out = Piece::Empty;     return true;
        case 'r': out = Piece::RedMan;    return true;
        case 'R': out = Piece::RedKing;   return true;
        case 'b': out = Piece::BlackMan;  return true;
        case 'B': out = Piece::BlackKing; return true;
        default:  return false;
    }
}

Board::Board() {
    cells_.fill(Piece::Empty);
}

Board Board::standard() {
    Board board;
    for (int row = 0; row < SIZE; ++row) {
        for (int col = 0; col < SIZE; ++col) {
            // Pieces sit on (row + col) even squares
            if ((row + col) % 2 != 0) continue;
            if (row <= 2) {
                board.set_piece(row, col, Piece::BlackMan);
            } else if (row >= 5) {
                board.set_piece(row, col, Piece::RedMan);
            }
        }
    }
    return board;
}

void Board::set_piece(int row, int col, Piece piece) noexcept {
    if (row < 0 || row >= SIZE || col < 0 || col >= SIZE) {
        return;
    }
    cells_[to_index(row, col)] = piece;
}

int Board::count(Side side) const noexcept {
    int total = 0;
    for (Piece piece : cells_) {
        if (belongs_to(piece, side)) total++;
    }
    return total;
}

bool Board::apply(const Move& move) {
    if (!move.origin.on_board() || move.path.empty()) return false;

    Piece mover = get_piece(move.origin);
    if (mover == Piece::Empty) return false;
    Side side = belongs_to(mover, Side::Red) ? Side::Red : Side::Black;

    Board next = *this;
    Square current = move.origin;

    if (!move.is_jump()) {
        if (move.path.size() != 1) return false;
        Square target = current.step(move.path.front());
        if (!target.on_board() || !next.is_empty(target)) return false;
        next.remove_piece(current);
        current = target;
    } else {
        for (Direction dir : move.path) {
            Square over = current.step(dir);
            Square target = current.step(dir, 2);
            if (!target.on_board() || !next.is_empty(target)) return false;
            if (!belongs_to(next.get_piece(over), opponent(side))) return false;
            next.remove_piece(over);
            next.remove_piece(current);
            current = target;
        }
    }

    if (current.row == 0 || current.row == SIZE - 1) {
        if (mover == Piece::RedMan) mover = Piece::RedKing;
        if (mover == Piece::BlackMan) mover = Piece::BlackKing;
    }
    next.set_piece(current, mover);

    *this = next;
    return true;
}

std::string Board::to_string() const {
    std::ostringstream oss;
    oss << "    A B C D E F G H\n";
    oss << "  -------------------\n";
    for (int row = 0; row < SIZE; ++row) {
        oss << (row + 1) << " |";
        for (int col = 0; col < SIZE; ++col) {
            oss << ' ' << piece_to_char(get_piece(row, col));
        }
        oss << " |\n";
    }
    oss << "  -------------------\n";
    return oss.str();
}

} // namespace core
