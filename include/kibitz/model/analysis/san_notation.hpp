#pragma once
#include <string>
#include <string_view>

#include "kibitz/model/move.hpp"
#include "kibitz/model/position.hpp"

namespace kibitz::model::notation
{

  // SAN for a legal move, with disambiguation and a check/mate suffix.
  // Returns an empty string when the move is not legal in `pos`.
  std::string toSan(const model::Position &pos, const model::Move &mv);

  // Finds the legal move a SAN (or coordinate) token denotes in the given position.
  // Tolerates annotation glyphs, "0-0", a missing '=' before the promotion piece and
  // over-disambiguation.
  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out);

} // namespace kibitz::model::notation
