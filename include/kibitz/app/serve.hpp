#pragma once
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "kibitz/analysis/analysis_service.hpp"

namespace kibitz::app {

// Handles one request line: parse, analyse, serialise. A line that is not a
// valid request yields an INVALID_REQUEST envelope. A request "id" is echoed.
nlohmann::json handle_request_line(analysis::AnalysisService& service, const std::string& line);

// JSON-lines loop: requests from `in`, envelopes to `out` in request order.
// Up to `workers` requests are analysed at once. Blank lines are ignored.
// Returns the number of requests answered.
int run_serve(analysis::AnalysisService& service, std::istream& in, std::ostream& out, int workers,
              bool pretty);

}  // namespace kibitz::app
