#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace kibitz::model {

// Piece-centric bitboards plus a square-centric mailbox kept in sync.
class Board {
 public:
  Board() { clear(); }

  void clear() noexcept {
    for (auto& byColor : m_bb) byColor.fill(0);
    m_color_occ = {0, 0};
    m_all_occ = 0;
    m_piece_on.fill(EMPTY);
  }

  void setPiece(core::Square sq, bb::Piece p) noexcept {
    removePiece(sq);
    if (p.isNone()) return;
    const bb::Bitboard mask = bb::sq_bb(sq);
    m_bb[bb::ci(p.color)][core::idx(p.type)] |= mask;
    m_color_occ[bb::ci(p.color)] |= mask;
    m_all_occ |= mask;
    m_piece_on[sq] = p;
  }

  void removePiece(core::Square sq) noexcept {
    const bb::Piece old = m_piece_on[sq];
    if (old.isNone()) return;
    const bb::Bitboard mask = bb::sq_bb(sq);
    m_bb[bb::ci(old.color)][core::idx(old.type)] &= ~mask;
    m_color_occ[bb::ci(old.color)] &= ~mask;
    m_all_occ &= ~mask;
    m_piece_on[sq] = EMPTY;
  }

  void movePiece(core::Square from, core::Square to) noexcept {
    const bb::Piece p = m_piece_on[from];
    removePiece(from);
    setPiece(to, p);
  }

  [[nodiscard]] std::optional<bb::Piece> getPiece(core::Square sq) const noexcept {
    const bb::Piece p = m_piece_on[sq];
    if (p.isNone()) return std::nullopt;
    return p;
  }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[bb::ci(c)];
  }
  [[nodiscard]] bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    if (t == core::PieceType::None) return 0;
    return m_bb[bb::ci(c)][core::idx(t)];
  }
  [[nodiscard]] bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

 private:
  static constexpr bb::Piece EMPTY{};

  // [color][pieceType 0..5]
  std::array<std::array<bb::Bitboard, 6>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;
  std::array<bb::Piece, 64> m_piece_on{};
};

}  // namespace kibitz::model
