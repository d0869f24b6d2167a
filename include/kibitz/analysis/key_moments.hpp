#pragma once

#include <cstddef>
#include <vector>

#include "kibitz/analysis/analysis_types.hpp"
#include "kibitz/constants.hpp"

namespace kibitz::analysis
{

  // Plies with the largest evaluation swing against the previous ply, largest first.
  // A ply is a candidate only when it and its predecessor both have an evaluation.
  // Equal swings keep ply order.
  std::vector<KeyMoment> selectKeyMoments(const std::vector<PlyRecord> &plies,
                                          std::size_t limit = core::KEY_MOMENT_LIMIT);

} // namespace kibitz::analysis
