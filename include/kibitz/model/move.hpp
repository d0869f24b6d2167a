#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"

namespace kibitz::model {

enum class CastleSide : std::uint8_t { None = 0, KingSide = 1, QueenSide = 2 };

// from:6 | to:6 | promotion:4 | capture:1 | ep:1 | castle:2
struct Move {
  std::uint32_t raw{0};

  static constexpr std::uint32_t FROM_SHIFT = 0;
  static constexpr std::uint32_t TO_SHIFT = 6;
  static constexpr std::uint32_t PROMO_SHIFT = 12;
  static constexpr std::uint32_t CAP_SHIFT = 16;
  static constexpr std::uint32_t EP_SHIFT = 17;
  static constexpr std::uint32_t CASTLE_SHIFT = 18;

  static constexpr std::uint32_t CAP_MASK = 0x01u << CAP_SHIFT;
  static constexpr std::uint32_t EP_MASK = 0x01u << EP_SHIFT;
  static constexpr std::uint32_t CASTLE_MASK = 0x03u << CASTLE_SHIFT;

  // from/to/promotion identify a move; the rest are generator hints
  static constexpr std::uint32_t IDENTITY_MASK = 0xFFFFu;

  constexpr Move() noexcept = default;

  constexpr Move(core::Square f, core::Square t, core::PieceType promo = core::PieceType::None,
                 bool isCap = false, bool isEP = false, CastleSide cs = CastleSide::None) noexcept
      : raw((static_cast<std::uint32_t>(f) & 0x3Fu) << FROM_SHIFT |
            (static_cast<std::uint32_t>(t) & 0x3Fu) << TO_SHIFT |
            (static_cast<std::uint32_t>(promo) & 0x0Fu) << PROMO_SHIFT |
            (isCap ? CAP_MASK : 0u) | (isEP ? EP_MASK : 0u) |
            (static_cast<std::uint32_t>(cs) & 0x03u) << CASTLE_SHIFT) {}

  [[nodiscard]] constexpr core::Square from() const noexcept {
    return static_cast<core::Square>((raw >> FROM_SHIFT) & 0x3Fu);
  }
  [[nodiscard]] constexpr core::Square to() const noexcept {
    return static_cast<core::Square>((raw >> TO_SHIFT) & 0x3Fu);
  }
  [[nodiscard]] constexpr core::PieceType promotion() const noexcept {
    return static_cast<core::PieceType>((raw >> PROMO_SHIFT) & 0x0Fu);
  }
  [[nodiscard]] constexpr bool isCapture() const noexcept { return (raw & CAP_MASK) != 0; }
  [[nodiscard]] constexpr bool isEnPassant() const noexcept { return (raw & EP_MASK) != 0; }
  [[nodiscard]] constexpr CastleSide castle() const noexcept {
    return static_cast<CastleSide>((raw >> CASTLE_SHIFT) & 0x03u);
  }
  [[nodiscard]] constexpr bool isNull() const noexcept { return raw == 0; }

  friend constexpr bool operator==(const Move& a, const Move& b) noexcept {
    return (a.raw & IDENTITY_MASK) == (b.raw & IDENTITY_MASK);
  }
  friend constexpr bool operator!=(const Move& a, const Move& b) noexcept { return !(a == b); }
};

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");
static_assert(sizeof(Move) == 4, "Move should be tightly packed to 4 bytes");

}  // namespace kibitz::model
