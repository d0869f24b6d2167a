#pragma once
#include <vector>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"

namespace kibitz::model {

class Position {
 public:
  Position() = default;

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  // Make/Unmake. doMove() rejects (and leaves the position untouched) when the
  // mover's king would be left in check.
  bool doMove(const Move& m);
  void undoMove();

  [[nodiscard]] core::Square kingSquare(core::Color c) const;
  [[nodiscard]] bool isKingAttacked(core::Color c) const;
  [[nodiscard]] bool inCheck() const { return isKingAttacked(m_state.sideToMove); }

 private:
  Board m_board;
  GameState m_state;
  std::vector<StateInfo> m_history;

  void applyMove(const Move& m, StateInfo& st);
  void unapplyMove(const StateInfo& st);
};

}  // namespace kibitz::model
