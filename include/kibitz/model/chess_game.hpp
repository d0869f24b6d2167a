#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../constants.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace kibitz::model {

class ChessGame {
 public:
  ChessGame();
  explicit ChessGame(const Position& pos);

  // Returns false (and leaves the current position untouched) on an invalid FEN.
  bool setPosition(std::string_view fen, std::string* err = nullptr);

  bool doMove(core::Square from, core::Square to,
              core::PieceType promotion = core::PieceType::None);
  bool doMove(const Move& m);
  bool doMoveUCI(std::string_view uciMove);

  bb::Piece getPiece(core::Square sq) const;
  const GameState& getGameState() const;
  const Position& getPosition() const { return m_position; }
  const std::vector<Move>& generateLegalMoves();
  std::optional<Move> getMove(core::Square from, core::Square to,
                              core::PieceType promotion = core::PieceType::None);

  bool isKingInCheck(core::Color from) const;
  core::Square getKingSquare(core::Color color) const;

  std::string getFen() const;

 private:
  MoveGenerator m_move_gen;
  Position m_position;
  std::vector<Move> m_pseudo_moves;
  std::vector<Move> m_legal_moves;
};

}  // namespace kibitz::model
