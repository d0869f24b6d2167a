#pragma once

#include "kibitz/chess_types.hpp"
#include "kibitz/constants.hpp"

namespace kibitz::engine {

// Raw UCI score, relative to the side to move.
struct UciScore {
  bool mate = false;
  int value = 0;  // centipawns, or moves to mate (negative: side to move gets mated)
};

// Converts to White's perspective. Forced mate becomes +/-MATE_SENTINEL_CP.
// "mate 0" means the side to move is already mated.
constexpr int normalizeScore(const UciScore& s, core::Color sideToMove) noexcept {
  int stm;
  if (s.mate)
    stm = s.value > 0 ? core::MATE_SENTINEL_CP : -core::MATE_SENTINEL_CP;
  else
    stm = s.value;
  return sideToMove == core::Color::White ? stm : -stm;
}

}  // namespace kibitz::engine
