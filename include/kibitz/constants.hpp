#pragma once

#include <string>
#include <string_view>

namespace kibitz::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // Forced mate is reported as this many centipawns, signed towards the mating side.
  constexpr int MATE_SENTINEL_CP = 100000;

  // Resource bound on engine lines per ply, not a user ceiling.
  constexpr int MIN_ANALYSIS_LINES = 1;
  constexpr int MAX_ANALYSIS_LINES = 3;

  constexpr int KEY_MOMENT_LIMIT = 5;

  // Request defaults
  constexpr int DEFAULT_DEPTH = 12;
  constexpr int DEFAULT_LINE_COUNT = 2;
  constexpr double DEFAULT_TIME_BUDGET_SECONDS = 0.05;

  // ------------------ Version ------------------
  inline constexpr std::string_view KIBITZ_VERSION{"kibitz 1.0"};
}
