#pragma once
#include <array>
#include <bit>
#include <cstdint>

#include "model_types.hpp"

namespace kibitz::model::bb {

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr int popcount(Bitboard b) noexcept {
  return std::popcount(b);
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr int ctz64(std::uint64_t x) noexcept {
  return static_cast<int>(std::countr_zero(x));
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE core::Square pop_lsb(Bitboard& b) noexcept {
  if (!b) return core::NO_SQUARE;
  const int idx = ctz64(b);
  b &= (b - 1);
  return static_cast<core::Square>(idx);
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard north(Bitboard b) noexcept {
  return b << 8;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard south(Bitboard b) noexcept {
  return b >> 8;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard east(Bitboard b) noexcept {
  return (b & ~FILE_H) << 1;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard west(Bitboard b) noexcept {
  return (b & ~FILE_A) >> 1;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard ne(Bitboard b) noexcept {
  return (b & ~FILE_H) << 9;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard nw(Bitboard b) noexcept {
  return (b & ~FILE_A) << 7;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard se(Bitboard b) noexcept {
  return (b & ~FILE_H) >> 7;
}
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard sw(Bitboard b) noexcept {
  return (b & ~FILE_A) >> 9;
}

namespace detail {

// Walks one direction until (and including) the first blocker.
template <Bitboard (*Step)(Bitboard)>
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard ray(Bitboard from, Bitboard occ) noexcept {
  Bitboard atk = 0;
  Bitboard r = Step(from);
  while (r) {
    atk |= r;
    if (r & occ) break;
    r = Step(r);
  }
  return atk;
}

constexpr Bitboard knight_from_sq(core::Square s) noexcept {
  const Bitboard b = sq_bb(s);
  const Bitboard l1 = (b & ~FILE_A) >> 1;
  const Bitboard l2 = (b & ~(FILE_A | FILE_B)) >> 2;
  const Bitboard r1 = (b & ~FILE_H) << 1;
  const Bitboard r2 = (b & ~(FILE_H | FILE_G)) << 2;
  return (l2 << 8) | (l2 >> 8) | (r2 << 8) | (r2 >> 8) | (l1 << 16) | (l1 >> 16) | (r1 << 16) |
         (r1 >> 16);
}

constexpr Bitboard king_from_sq(core::Square s) noexcept {
  const Bitboard b = sq_bb(s);
  return east(b) | west(b) | north(b) | south(b) | ne(b) | nw(b) | se(b) | sw(b);
}

template <Bitboard (*From)(core::Square)>
constexpr auto build_table() noexcept {
  std::array<Bitboard, 64> t{};
  for (int i = 0; i < 64; ++i) t[i] = From(static_cast<core::Square>(i));
  return t;
}

inline constexpr auto KNIGHT_ATTACKS = build_table<knight_from_sq>();
inline constexpr auto KING_ATTACKS = build_table<king_from_sq>();

}  // namespace detail

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard knight_attacks_from(core::Square s) noexcept {
  return detail::KNIGHT_ATTACKS[static_cast<int>(s)];
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard king_attacks_from(core::Square s) noexcept {
  return detail::KING_ATTACKS[static_cast<int>(s)];
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard bishop_attacks(core::Square s,
                                                                     Bitboard occ) noexcept {
  const Bitboard from = sq_bb(s);
  return detail::ray<ne>(from, occ) | detail::ray<nw>(from, occ) | detail::ray<se>(from, occ) |
         detail::ray<sw>(from, occ);
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard rook_attacks(core::Square s,
                                                                   Bitboard occ) noexcept {
  const Bitboard from = sq_bb(s);
  return detail::ray<north>(from, occ) | detail::ray<south>(from, occ) |
         detail::ray<east>(from, occ) | detail::ray<west>(from, occ);
}

[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard queen_attacks(core::Square s,
                                                                    Bitboard occ) noexcept {
  return bishop_attacks(s, occ) | rook_attacks(s, occ);
}

// Squares a pawn of colour c standing on s attacks.
[[nodiscard]] KIBITZ_ALWAYS_INLINE constexpr Bitboard pawn_attacks_from(core::Color c,
                                                                        core::Square s) noexcept {
  const Bitboard b = sq_bb(s);
  return c == core::Color::White ? (nw(b) | ne(b)) : (sw(b) | se(b));
}

}  // namespace kibitz::model::bb
