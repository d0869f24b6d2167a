#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kibitz::engine {

// Either or both may be set; an engine that gets both stops at whichever comes first.
struct SearchLimits {
  std::optional<int> depth;
  std::optional<int> movetimeMs;
};

// One ranked line as reported by the engine.
struct EngineLine {
  int multipv = 1;               // 1 = principal line
  std::vector<std::string> pv;   // coordinate moves, may be empty
  std::optional<int> evalCp;     // White's perspective, mate mapped to the sentinel
  int depth = 0;
};

// Analysis capability for one session. Implementations own whatever process or
// state backs the session and release it in their destructor.
class AnalysisEngine {
 public:
  virtual ~AnalysisEngine() = default;

  // Up to `lineCount` lines for the position, ordered by multipv. Throws
  // std::runtime_error when the engine fails or stops answering.
  virtual std::vector<EngineLine> analyze(const std::string& fen, const SearchLimits& limits,
                                          int lineCount) = 0;
};

// Hands out one AnalysisEngine per request.
class EngineProvider {
 public:
  virtual ~EngineProvider() = default;
  virtual std::unique_ptr<AnalysisEngine> open() = 0;
};

}  // namespace kibitz::engine
