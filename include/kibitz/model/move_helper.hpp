#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"

namespace kibitz::model {

// ---------------- Attack query ----------------
[[nodiscard]] KIBITZ_ALWAYS_INLINE bool attackedBy(const Board& b, core::Square sq, core::Color by,
                                                  bb::Bitboard occ) noexcept {
  // Pawns of 'by' attack sq from the squares a pawn of the other colour on sq would attack.
  if (bb::pawn_attacks_from(~by, sq) & b.getPieces(by, core::PieceType::Pawn)) return true;
  if (bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight)) return true;
  if (bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King)) return true;

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);
  const bb::Bitboard bq = b.getPieces(by, core::PieceType::Bishop) | q;
  if (bq && (bb::bishop_attacks(sq, occ) & bq)) return true;
  const bb::Bitboard rq = b.getPieces(by, core::PieceType::Rook) | q;
  if (rq && (bb::rook_attacks(sq, occ) & rq)) return true;

  return false;
}

}  // namespace kibitz::model
