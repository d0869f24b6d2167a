#include "kibitz/analysis/ply_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

#include "kibitz/constants.hpp"
#include "kibitz/model/analysis/san_notation.hpp"
#include "kibitz/model/uci_notation.hpp"

namespace kibitz::analysis
{

  int clampLineCount(int requested)
  {
    return std::clamp(requested, core::MIN_ANALYSIS_LINES, core::MAX_ANALYSIS_LINES);
  }

  engine::SearchLimits limitsFor(const AnalyzeRequest &req)
  {
    engine::SearchLimits lim;
    if (req.depth > 0)
      lim.depth = req.depth;
    if (req.timeBudgetSeconds > 0.0)
    {
      // at least one millisecond so a tiny budget still reaches the engine as a limit
      const long ms = std::lround(req.timeBudgetSeconds * 1000.0);
      lim.movetimeMs = static_cast<int>(std::clamp<long>(ms, 1, 24L * 3600 * 1000));
    }
    return lim;
  }

  PlyAnalyzer::PlyAnalyzer(engine::AnalysisEngine &engine, engine::SearchLimits limits, int lineCount)
      : m_engine(engine), m_limits(limits), m_lineCount(clampLineCount(lineCount))
  {
  }

  PlyRecord PlyAnalyzer::analyze(const model::analysis::ReplayedPly &ply, model::ChessGame &after)
  {
    PlyRecord rec;
    rec.ply = ply.ply;
    rec.playedUci = ply.uci;
    rec.playedSan = ply.san;
    rec.fenAfter = ply.fenAfter;

    // mate or stalemate: nothing to search
    if (after.generateLegalMoves().empty())
      return rec;

    ++m_engineCalls;
    const auto lines = m_engine.analyze(ply.fenAfter, m_limits, m_lineCount);
    rec.pvs = normalize(lines, after);

    if (!rec.pvs.empty() && rec.pvs.front().rank == 1)
      rec.evalCp = rec.pvs.front().evalCp;
    return rec;
  }

  std::vector<CandidateLine> PlyAnalyzer::normalize(const std::vector<engine::EngineLine> &lines,
                                                    model::ChessGame &after) const
  {
    std::vector<CandidateLine> out;
    std::set<int> seenRanks;

    for (const auto &line : lines)
    {
      if (line.pv.empty() || line.multipv < 1)
        continue;
      if (seenRanks.count(line.multipv))
        continue;

      core::Square from = core::NO_SQUARE, to = core::NO_SQUARE;
      core::PieceType promo = core::PieceType::None;
      if (!model::uci::parseUciMove(line.pv.front(), from, to, promo))
        continue;
      const auto mv = after.getMove(from, to, promo);
      if (!mv)
      {
#if KIBITZ_LOG
        std::cerr << "[Analyzer] dropping line " << line.multipv << ": " << line.pv.front()
                  << " is not legal in " << after.getFen() << "\n";
#endif
        continue;
      }

      CandidateLine c;
      c.rank = line.multipv;
      c.uci = model::uci::moveToUci(*mv);
      c.san = model::notation::toSan(after.getPosition(), *mv);
      c.evalCp = line.evalCp;
      seenRanks.insert(c.rank);
      out.push_back(std::move(c));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const CandidateLine &a, const CandidateLine &b) { return a.rank < b.rank; });
    return out;
  }

} // namespace kibitz::analysis
