#pragma once
#include <string>

#include "kibitz/model/analysis/game_record.hpp"
#include "kibitz/model/chess_game.hpp"

namespace kibitz::model::analysis
{

  struct ReplayedPly
  {
    int ply = 0; // 1-based
    model::Move move{};
    std::string uci;
    std::string san; // computed against the position before the move
    std::string fenAfter;
  };

  struct IllegalMoveInfo
  {
    int ply = 0;
    std::string uci; // coordinate text, or the raw token when it resolves to nothing
    std::string fenBefore;
  };

  // Owns the board for one request and advances it one recorded move at a time.
  class PositionReplayer
  {
  public:
    PositionReplayer() = default;

    bool reset(const std::string &startFen, std::string *err = nullptr);

    // Applies the next recorded move. On an illegal move the board is left as it
    // was and `illegal` describes the failure.
    bool apply(const RecordedMove &rec, ReplayedPly &out, IllegalMoveInfo &illegal);

    int pliesApplied() const { return m_ply; }
    model::ChessGame &game() { return m_game; }
    std::string fen() const { return m_game.getFen(); }

  private:
    model::ChessGame m_game;
    int m_ply = 0;
  };

} // namespace kibitz::model::analysis
