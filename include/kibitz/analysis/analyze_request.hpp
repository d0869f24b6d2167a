#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "kibitz/analysis/analysis_types.hpp"

namespace kibitz::analysis
{

  // Reads an AnalyzeRequest from a JSON object. Missing fields take their defaults;
  // "pgn", "initial_fen", "multipv" and "time_sec" are accepted as aliases.
  // Returns false with a message in `err` when the object is not a usable request.
  bool parseAnalyzeRequest(const nlohmann::json &j, AnalyzeRequest &out, std::string *err = nullptr);

} // namespace kibitz::analysis
