#pragma once

#include <vector>

#include "kibitz/analysis/analysis_types.hpp"
#include "kibitz/engine/analysis_engine.hpp"
#include "kibitz/model/analysis/replayer.hpp"
#include "kibitz/model/chess_game.hpp"

namespace kibitz::analysis
{

  int clampLineCount(int requested);

  // Search limits for a request: non-positive depth or time means "no such limit".
  engine::SearchLimits limitsFor(const AnalyzeRequest &req);

  // Turns one replayed ply into a PlyRecord, asking the engine about the position
  // reached after the move.
  class PlyAnalyzer
  {
  public:
    PlyAnalyzer(engine::AnalysisEngine &engine, engine::SearchLimits limits, int lineCount);

    // `after` must hold the position reached by `ply`. Engine failures propagate.
    PlyRecord analyze(const model::analysis::ReplayedPly &ply, model::ChessGame &after);

    int lineCount() const { return m_lineCount; }
    int engineCalls() const { return m_engineCalls; }

  private:
    std::vector<CandidateLine> normalize(const std::vector<engine::EngineLine> &lines,
                                         model::ChessGame &after) const;

    engine::AnalysisEngine &m_engine;
    engine::SearchLimits m_limits;
    int m_lineCount;
    int m_engineCalls = 0;
  };

} // namespace kibitz::analysis
