#pragma once

#include "board.hpp"
#include "move.hpp"
#include <vector>

namespace core {

// Legality switches the ledger and the bot must agree on
struct RuleSet {
    bool men_move_forward_only = true;   // kings are never restricted
    bool mandatory_capture = false;      // ledger accepts a step even when a jump exists

    static RuleSet ledger() { return RuleSet{}; }

    static RuleSet any_direction() {
        RuleSet rules;
        rules.men_move_forward_only = false;
        return rules;
    }
};

class MoveGenerator {
public:
    explicit MoveGenerator(RuleSet rules = RuleSet::ledger());
    ~MoveGenerator() = default;

    // Every legal move for `side`, in board order (row-major, then NW NE SE SW).
    // Empty when the side has no piece or every piece is blocked.
    std::vector<Move> generate(const Board& board, Side side) const;

    const RuleSet& rules() const noexcept { return rules_; }

private:
    RuleSet rules_;

    bool can_travel(Piece piece, Direction dir) const noexcept;

    // Extends a capture chain whose piece currently stands on `at`.
    // `path` and `captured` are taken by value so sibling branches never
    // share them. Emits one move per terminal chain, returns how many.
    int extend_jump_chain(const Board& board, Piece piece, Square origin, Square at,
                          std::vector<Direction> path, std::vector<Square> captured,
                          std::vector<Move>& out) const;

    bool is_capturable(const Board& board, Side side, Square over,
                       const std::vector<Square>& captured) const noexcept;

    bool is_landing(const Board& board, Square origin, Square target,
                    const std::vector<Square>& captured) const noexcept;
};

} // namespace core
