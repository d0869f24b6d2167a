#pragma once
#include <optional>
#include <string>
#include <vector>

#include "kibitz/engine/score.hpp"

namespace kibitz::engine::uci
{

  // Fields of one "info ..." line that matter for analysis.
  struct UciInfo
  {
    std::optional<int> depth;
    int multipv = 1;
    std::optional<UciScore> score;
    bool bound = false; // score is a lowerbound/upperbound
    bool hasPv = false;
    std::vector<std::string> pv;
  };

  // False for anything that is not an info line, and for "info string ...".
  bool parseInfoLine(const std::string &line, UciInfo &out);

  // Move from "bestmove <move> [ponder <move>]"; empty when the engine had none.
  bool parseBestmoveLine(const std::string &line, std::string &move);

} // namespace kibitz::engine::uci
