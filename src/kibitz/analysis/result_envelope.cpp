#include "kibitz/analysis/result_envelope.hpp"

#include <utility>

namespace kibitz::analysis
{
  namespace
  {
    nlohmann::json optionalInt(const std::optional<int> &v)
    {
      return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    }
  } // namespace

  const char *errorCodeName(ErrorCode code)
  {
    switch (code)
    {
    case ErrorCode::InvalidPgn:
      return "INVALID_PGN";
    case ErrorCode::InvalidFen:
      return "INVALID_FEN";
    case ErrorCode::IllegalMove:
      return "ILLEGAL_MOVE";
    case ErrorCode::InvalidRequest:
      return "INVALID_REQUEST";
    case ErrorCode::InternalError:
    default:
      return "INTERNAL_ERROR";
    }
  }

  ResultEnvelope makeSuccess(std::vector<PlyRecord> perPly, std::vector<KeyMoment> keyMoments)
  {
    ResultEnvelope r;
    r.status = Status::Ok;
    r.legal = true;
    r.perPly = std::move(perPly);
    r.keyMoments = std::move(keyMoments);
    return r;
  }

  ResultEnvelope makeFailure(AnalysisError error, std::vector<PlyRecord> perPly,
                             std::vector<KeyMoment> keyMoments)
  {
    ResultEnvelope r;
    r.status = Status::Error;
    r.legal = false;
    r.perPly = std::move(perPly);
    r.keyMoments = std::move(keyMoments);
    r.error = std::move(error);
    return r;
  }

  ResultEnvelope makeIllegalMove(FirstIllegalMove where, std::vector<PlyRecord> perPly,
                                 std::vector<KeyMoment> keyMoments)
  {
    AnalysisError e;
    e.code = ErrorCode::IllegalMove;
    e.message = "Move is not legal from reconstructed position.";
    e.firstIllegalMove = std::move(where);
    return makeFailure(std::move(e), std::move(perPly), std::move(keyMoments));
  }

  ResultEnvelope makeInternalError(std::string message, InternalFailure where,
                                   std::vector<PlyRecord> perPly,
                                   std::vector<KeyMoment> keyMoments)
  {
    AnalysisError e;
    e.code = ErrorCode::InternalError;
    e.message = std::move(message);
    e.internal = std::move(where);
    return makeFailure(std::move(e), std::move(perPly), std::move(keyMoments));
  }

  // ---- JSON ----

  void to_json(nlohmann::json &j, const CandidateLine &c)
  {
    j = nlohmann::json{{"rank", c.rank}, {"uci", c.uci}, {"san", c.san}, {"eval_cp", optionalInt(c.evalCp)}};
  }

  void to_json(nlohmann::json &j, const PlyRecord &p)
  {
    j = nlohmann::json{{"ply", p.ply},
                       {"played_uci", p.playedUci},
                       {"played_san", p.playedSan},
                       {"fen_after", p.fenAfter},
                       {"eval_cp", optionalInt(p.evalCp)},
                       {"pvs", p.pvs}};
  }

  void to_json(nlohmann::json &j, const KeyMoment &k)
  {
    j = nlohmann::json{
        {"ply", k.ply}, {"played_san", k.playedSan}, {"eval_cp", k.evalCp}, {"swing", k.swing}};
  }

  void to_json(nlohmann::json &j, const AnalysisError &e)
  {
    nlohmann::json details = nlohmann::json::object();
    if (e.firstIllegalMove)
    {
      details["first_illegal_move"] = {{"ply", e.firstIllegalMove->ply},
                                       {"uci", e.firstIllegalMove->uci},
                                       {"fen_before", e.firstIllegalMove->fenBefore}};
    }
    if (e.internal)
    {
      details["stage"] = e.internal->stage;
      details["completed_plies"] = e.internal->completedPlies;
    }
    j = nlohmann::json{{"code", errorCodeName(e.code)}, {"message", e.message}, {"details", details}};
  }

  void to_json(nlohmann::json &j, const ResultEnvelope &r)
  {
    j = nlohmann::json{{"status", r.status == Status::Ok ? "ok" : "error"},
                       {"legal", r.legal},
                       {"per_ply", r.perPly},
                       {"key_moments", r.keyMoments},
                       {"error", r.error ? nlohmann::json(*r.error) : nlohmann::json(nullptr)}};
  }

} // namespace kibitz::analysis
