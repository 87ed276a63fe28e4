#include "core/move_generator.hpp"
#include <algorithm>
#include <utility>

namespace core {

MoveGenerator::MoveGenerator(RuleSet rules) : rules_(rules) {
}

std::vector<Move> MoveGenerator::generate(const Board& board, Side side) const {
    std::vector<Move> moves;
    bool any_jump = false;

    for (int row = 0; row < Board::SIZE; ++row) {
        for (int col = 0; col < Board::SIZE; ++col) {
            Piece piece = board.get_piece(row, col);
            if (!belongs_to(piece, side)) continue;

            Square from{row, col};
            for (Direction dir : ALL_DIRECTIONS) {
                if (!can_travel(piece, dir)) continue;

                Square adjacent = from.step(dir);
                if (!adjacent.on_board()) continue;

                if (board.is_empty(adjacent)) {
                    moves.push_back(Move::step(from, dir));
                    continue;
                }

                Square landing = from.step(dir, 2);
                if (is_capturable(board, side, adjacent, {}) &&
                    is_landing(board, from, landing, {})) {
                    int added = extend_jump_chain(board, piece, from, landing,
                                                  {dir}, {adjacent}, moves);
                    any_jump = any_jump || added > 0;
                }
            }
        }
    }

    if (rules_.mandatory_capture && any_jump) {
        moves.erase(std::remove_if(moves.begin(), moves.end(),
                                   [](const Move& m) { return !m.is_jump(); }),
                    moves.end());
    }

    return moves;
}

bool MoveGenerator::can_travel(Piece piece, Direction dir) const noexcept {
    if (is_king(piece) || !rules_.men_move_forward_only) return true;
    if (piece == Piece::RedMan) return row_delta(dir) < 0;
    if (piece == Piece::BlackMan) return row_delta(dir) > 0;
    return false;
}

int MoveGenerator::extend_jump_chain(const Board& board, Piece piece, Square origin, Square at,
                                     std::vector<Direction> path, std::vector<Square> captured,
                                     std::vector<Move>& out) const {
    Side side = belongs_to(piece, Side::Red) ? Side::Red : Side::Black;
    int added = 0;

    // The ledger keeps the piece's rank until the chain ends, so a man
    // crowned on the last row keeps man directions for the rest of the chain.
    for (Direction dir : ALL_DIRECTIONS) {
        if (!can_travel(piece, dir)) continue;

        Square over = at.step(dir);
        Square landing = at.step(dir, 2);
        if (!is_capturable(board, side, over, captured)) continue;
        if (!is_landing(board, origin, landing, captured)) continue;

        std::vector<Direction> next_path = path;
        next_path.push_back(dir);
        std::vector<Square> next_captured = captured;
        next_captured.push_back(over);

        added += extend_jump_chain(board, piece, origin, landing,
                                   std::move(next_path), std::move(next_captured), out);
    }

    if (added > 0) {
        return added;
    }

    Move chain;
    chain.origin = origin;
    chain.kind = Move::Kind::Jump;
    chain.path = std::move(path);
    chain.captured = std::move(captured);
    out.push_back(std::move(chain));
    return 1;
}

bool MoveGenerator::is_capturable(const Board& board, Side side, Square over,
                                  const std::vector<Square>& captured) const noexcept {
    if (!over.on_board()) return false;
    if (!belongs_to(board.get_piece(over), opponent(side))) return false;
    return std::find(captured.begin(), captured.end(), over) == captured.end();
}

bool MoveGenerator::is_landing(const Board& board, Square origin, Square target,
                               const std::vector<Square>& captured) const noexcept {
    if (!target.on_board()) return false;
    // The moving piece has vacated its origin
    if (target == origin) return true;
    if (std::find(captured.begin(), captured.end(), target) != captured.end()) return true;
    return board.is_empty(target);
}

} // namespace core
