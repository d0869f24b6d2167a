#include "kibitz/model/position.hpp"

#include <array>

#include "kibitz/model/move_helper.hpp"

namespace kibitz::model {

namespace {

// Castling rights lost when a move leaves or lands on these squares.
constexpr std::array<std::uint8_t, 64> CR_CLEAR = [] {
  std::array<std::uint8_t, 64> a{};
  a[bb::E1] |= bb::Castling::WK | bb::Castling::WQ;
  a[bb::E8] |= bb::Castling::BK | bb::Castling::BQ;
  a[bb::H1] |= bb::Castling::WK;
  a[bb::A1] |= bb::Castling::WQ;
  a[bb::H8] |= bb::Castling::BK;
  a[bb::A8] |= bb::Castling::BQ;
  return a;
}();

struct RookHop {
  core::Square from, to;
};

RookHop castleRookHop(core::Color us, CastleSide side) {
  if (us == core::Color::White)
    return side == CastleSide::KingSide ? RookHop{bb::H1, bb::F1} : RookHop{bb::A1, bb::D1};
  return side == CastleSide::KingSide ? RookHop{bb::H8, bb::F8} : RookHop{bb::A8, bb::D8};
}

inline core::Square epVictimSquare(core::Color us, core::Square to) {
  return us == core::Color::White ? static_cast<core::Square>(to - 8)
                                  : static_cast<core::Square>(to + 8);
}

}  // namespace

core::Square Position::kingSquare(core::Color c) const {
  const bb::Bitboard kbb = m_board.getPieces(c, core::PieceType::King);
  if (!kbb) return core::NO_SQUARE;
  return static_cast<core::Square>(bb::ctz64(kbb));
}

bool Position::isKingAttacked(core::Color c) const {
  const core::Square ksq = kingSquare(c);
  if (ksq == core::NO_SQUARE) return false;
  return attackedBy(m_board, ksq, ~c, m_board.getAllPieces());
}

// ================== Make/Unmake ==================

bool Position::doMove(const Move& m) {
  if (m.from() == m.to()) return false;
  const core::Color us = m_state.sideToMove;
  const auto fromPiece = m_board.getPiece(m.from());
  if (!fromPiece || fromPiece->color != us) return false;

  if (m.promotion() != core::PieceType::None) {
    if (fromPiece->type != core::PieceType::Pawn) return false;
    const int toRank = bb::rank_of(m.to());
    if (toRank != (us == core::Color::White ? 7 : 0)) return false;
    switch (m.promotion()) {
      case core::PieceType::Knight:
      case core::PieceType::Bishop:
      case core::PieceType::Rook:
      case core::PieceType::Queen:
        break;
      default:
        return false;
    }
  }

  StateInfo st{};
  applyMove(m, st);

  if (isKingAttacked(us)) {
    unapplyMove(st);
    return false;
  }
  m_history.push_back(st);
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  const StateInfo st = m_history.back();
  m_history.pop_back();
  unapplyMove(st);
}

void Position::applyMove(const Move& m, StateInfo& st) {
  const core::Color us = m_state.sideToMove;
  const core::Color them = ~us;
  const bb::Piece mover = *m_board.getPiece(m.from());

  st.move = m;
  st.mover = mover;
  st.prevFullmoveNumber = m_state.fullmoveNumber;
  st.prevHalfmoveClock = m_state.halfmoveClock;
  st.prevCastlingRights = m_state.castlingRights;
  st.prevEnPassantSquare = m_state.enPassantSquare;

  const bool movingPawn = mover.type == core::PieceType::Pawn;
  const int fileDelta = bb::file_of(m.to()) - bb::file_of(m.from());

  CastleSide castle = m.castle();
  if (castle == CastleSide::None && mover.type == core::PieceType::King &&
      (fileDelta == 2 || fileDelta == -2))
    castle = fileDelta > 0 ? CastleSide::KingSide : CastleSide::QueenSide;

  // Detect en passant from the board as well as from the generator hint
  const bool isEP = m.isEnPassant() ||
                    (movingPawn && fileDelta != 0 && m.to() == m_state.enPassantSquare &&
                     !m_board.getPiece(m.to()).has_value());

  if (isEP) {
    const core::Square victim = epVictimSquare(us, m.to());
    if (auto cap = m_board.getPiece(victim)) {
      st.capturedOn = victim;
      st.captured = *cap;
      m_board.removePiece(victim);
    }
  } else if (auto cap = m_board.getPiece(m.to())) {
    st.capturedOn = m.to();
    st.captured = *cap;
    m_board.removePiece(m.to());
  }

  bb::Piece placed = mover;
  if (m.promotion() != core::PieceType::None) placed.type = m.promotion();
  m_board.removePiece(m.from());
  m_board.setPiece(m.to(), placed);

  if (castle != CastleSide::None) {
    const RookHop hop = castleRookHop(us, castle);
    m_board.movePiece(hop.from, hop.to);
  }

  // 50-move rule
  if (movingPawn || !st.captured.isNone())
    m_state.halfmoveClock = 0;
  else
    ++m_state.halfmoveClock;

  // new EP square (double push)
  m_state.enPassantSquare = core::NO_SQUARE;
  if (movingPawn) {
    const int rankDelta = bb::rank_of(m.to()) - bb::rank_of(m.from());
    if (rankDelta == 2 || rankDelta == -2)
      m_state.enPassantSquare = static_cast<core::Square>((m.from() + m.to()) / 2);
  }

  m_state.castlingRights &= ~(CR_CLEAR[m.from()] | CR_CLEAR[m.to()]);

  m_state.sideToMove = them;
  if (them == core::Color::White) ++m_state.fullmoveNumber;
}

void Position::unapplyMove(const StateInfo& st) {
  const Move& m = st.move;
  const core::Color us = st.mover.color;

  m_board.removePiece(m.to());
  m_board.setPiece(m.from(), st.mover);
  if (!st.captured.isNone()) m_board.setPiece(st.capturedOn, st.captured);

  const int fileDelta = bb::file_of(m.to()) - bb::file_of(m.from());
  if (st.mover.type == core::PieceType::King && (fileDelta == 2 || fileDelta == -2)) {
    const RookHop hop =
        castleRookHop(us, fileDelta > 0 ? CastleSide::KingSide : CastleSide::QueenSide);
    m_board.movePiece(hop.to, hop.from);
  }

  m_state.sideToMove = us;
  m_state.fullmoveNumber = st.prevFullmoveNumber;
  m_state.halfmoveClock = st.prevHalfmoveClock;
  m_state.castlingRights = st.prevCastlingRights;
  m_state.enPassantSquare = st.prevEnPassantSquare;
}

}  // namespace kibitz::model
