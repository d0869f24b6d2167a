#pragma once

#include <vector>

#include "board.hpp"
#include "game_state.hpp"

namespace kibitz::model {

struct Move;

class MoveGenerator {
 public:
  // Full pseudo-legal move generation (quiet moves + captures + promotions + en passant + castling).
  // Castling is only emitted when the king does not pass through check; everything else is
  // filtered by Position::doMove().
  void generatePseudoLegalMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;
};

}  // namespace kibitz::model
