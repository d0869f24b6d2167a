#include "kibitz/model/chess_game.hpp"

#include <stdexcept>

#include "kibitz/model/fen.hpp"
#include "kibitz/model/uci_notation.hpp"

namespace kibitz::model {

// ---------------- Public API ----------------

ChessGame::ChessGame() {
  m_pseudo_moves.reserve(256);
  m_legal_moves.reserve(256);
  std::string err;
  // START_FEN is a constant; failing here means the rules layer is broken
  if (!setPosition(core::START_FEN, &err))
    throw std::logic_error("start position rejected: " + err);
}

ChessGame::ChessGame(const Position& pos) : m_position(pos) {
  m_pseudo_moves.reserve(256);
  m_legal_moves.reserve(256);
}

bool ChessGame::setPosition(std::string_view fenText, std::string* err) {
  Position loaded;
  if (!fen::parse(fenText, loaded, err)) return false;
  // full reset
  m_position = loaded;
  m_pseudo_moves.clear();
  m_legal_moves.clear();
  return true;
}

bool ChessGame::doMoveUCI(std::string_view uciMove) {
  core::Square from = core::NO_SQUARE, to = core::NO_SQUARE;
  core::PieceType promo = core::PieceType::None;
  if (!uci::parseUciMove(uciMove, from, to, promo)) return false;
  return doMove(from, to, promo);
}

std::optional<Move> ChessGame::getMove(core::Square from, core::Square to,
                                       core::PieceType promotion) {
  const auto& moves = generateLegalMoves();
  for (const auto& m : moves) {
    if (m.from() == from && m.to() == to && m.promotion() == promotion) return m;
  }
  return std::nullopt;
}

const std::vector<Move>& ChessGame::generateLegalMoves() {
  m_pseudo_moves.clear();
  m_legal_moves.clear();

  m_move_gen.generatePseudoLegalMoves(m_position.getBoard(), m_position.getState(), m_pseudo_moves);

  // Filter legality by make/unmake
  for (const auto& m : m_pseudo_moves) {
    if (m_position.doMove(m)) {
      m_position.undoMove();
      m_legal_moves.push_back(m);
    }
  }
  return m_legal_moves;
}

const GameState& ChessGame::getGameState() const {
  return m_position.getState();
}

core::Square ChessGame::getKingSquare(core::Color color) const {
  return m_position.kingSquare(color);
}

bb::Piece ChessGame::getPiece(core::Square sq) const {
  if (!core::validSquare(sq)) return bb::Piece{};
  auto opt = m_position.getBoard().getPiece(sq);
  return opt.value_or(bb::Piece{core::PieceType::None, core::Color::White});
}

bool ChessGame::doMove(core::Square from, core::Square to, core::PieceType promotion) {
  if (auto m = getMove(from, to, promotion)) return m_position.doMove(*m);
  return false;
}

bool ChessGame::doMove(const Move& m) {
  return doMove(m.from(), m.to(), m.promotion());
}

bool ChessGame::isKingInCheck(core::Color from) const {
  return m_position.isKingAttacked(from);
}

std::string ChessGame::getFen() const {
  return fen::write(m_position);
}

}  // namespace kibitz::model
