#pragma once
#include <optional>
#include <string>

#include "kibitz/constants.hpp"

namespace kibitz::app {

struct Options {
  // Mode
  bool serve = false;
  int workers = 1;

  // One-shot request
  std::string pgnPath;  // "-" reads stdin
  std::optional<std::string> fen;
  int depth = core::DEFAULT_DEPTH;
  int multipv = core::DEFAULT_LINE_COUNT;
  double timeSec = core::DEFAULT_TIME_BUDGET_SECONDS;

  // Output
  bool pretty = false;

  // Engine
  std::string enginePath;  // empty => autodetect
  std::optional<int> threads;
  std::optional<int> hashMb;
  int engineTimeoutMs = 30000;  // 0 => wait forever
};

// Exits with a usage message on malformed or missing arguments.
Options parse_args(int argc, char** argv);

}  // namespace kibitz::app
