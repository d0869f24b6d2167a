#include "kibitz/analysis/analysis_service.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

#include "kibitz/analysis/key_moments.hpp"
#include "kibitz/analysis/ply_analyzer.hpp"
#include "kibitz/analysis/result_envelope.hpp"
#include "kibitz/model/analysis/pgn_reader.hpp"
#include "kibitz/model/analysis/replayer.hpp"

namespace kibitz::analysis
{
  namespace
  {
    AnalysisError decodeError(ErrorCode code, std::string message)
    {
      AnalysisError e;
      e.code = code;
      e.message = std::move(message);
      return e;
    }

    // Key moments over a partial run; never lets a failure out of an error path.
    std::vector<KeyMoment> keyMomentsOrEmpty(const std::vector<PlyRecord> &plies) noexcept
    {
      try
      {
        return selectKeyMoments(plies);
      }
      catch (const std::exception &e)
      {
        std::cerr << "[Service] key moments unavailable: " << e.what() << "\n";
        return {};
      }
    }
  } // namespace

  ResultEnvelope AnalysisService::analyze(const AnalyzeRequest &req) noexcept
  {
    const char *stage = "decode";
    std::vector<PlyRecord> perPly;

    try
    {
      model::analysis::GameRecord game;
      std::string err;
      switch (model::analysis::decodeGame(req.record, req.initialPosition, game, &err))
      {
      case model::analysis::DecodeStatus::InvalidRecord:
        return makeFailure(decodeError(ErrorCode::InvalidPgn, "Could not parse PGN: " + err));
      case model::analysis::DecodeStatus::InvalidStartPosition:
        return makeFailure(decodeError(ErrorCode::InvalidFen, "Invalid FEN: " + err));
      case model::analysis::DecodeStatus::Ok:
        break;
      }

      stage = "replay";
      model::analysis::PositionReplayer replayer;
      if (!replayer.reset(game.startFen, &err))
        return makeFailure(decodeError(ErrorCode::InvalidFen, "Invalid FEN: " + err));

#if KIBITZ_LOG
      std::cerr << "[Service] analysing " << game.moves.size() << " plies from " << game.startFen
                << "\n";
#endif

      // opened lazily: a record whose first move is illegal never starts an engine
      std::unique_ptr<engine::AnalysisEngine> session;
      std::optional<PlyAnalyzer> analyzer;
      const engine::SearchLimits limits = limitsFor(req);

      perPly.reserve(game.moves.size());
      for (const auto &rec : game.moves)
      {
        stage = "replay";
        model::analysis::ReplayedPly ply;
        model::analysis::IllegalMoveInfo illegal;
        if (!replayer.apply(rec, ply, illegal))
        {
          FirstIllegalMove where{illegal.ply, illegal.uci, illegal.fenBefore};
          auto moments = keyMomentsOrEmpty(perPly);
          return makeIllegalMove(std::move(where), std::move(perPly), std::move(moments));
        }

        if (!session)
        {
          stage = "engine_start";
          session = m_provider.open();
          if (!session)
            throw std::runtime_error("engine provider returned no session");
          analyzer.emplace(*session, limits, req.lineCount);
        }

        stage = "analysis";
        perPly.push_back(analyzer->analyze(ply, replayer.game()));
      }

      stage = "key_moments";
      auto moments = selectKeyMoments(perPly);
      return makeSuccess(std::move(perPly), std::move(moments));
    }
    catch (const std::exception &e)
    {
      std::cerr << "[Service] " << stage << " failed after " << perPly.size()
                << " plies: " << e.what() << "\n";
      const int done = static_cast<int>(perPly.size());
      auto moments = keyMomentsOrEmpty(perPly);
      return makeInternalError(e.what(), InternalFailure{stage, done}, std::move(perPly),
                               std::move(moments));
    }
    catch (...)
    {
      std::cerr << "[Service] " << stage << " failed with an unknown exception\n";
      const int done = static_cast<int>(perPly.size());
      return makeInternalError("unknown error", InternalFailure{stage, done}, std::move(perPly), {});
    }
  }

} // namespace kibitz::analysis
