#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kibitz/constants.hpp"

namespace kibitz::analysis
{

  struct AnalyzeRequest
  {
    std::string record;                         // PGN text
    std::optional<std::string> initialPosition; // FEN override
    int depth = core::DEFAULT_DEPTH;
    int lineCount = core::DEFAULT_LINE_COUNT;
    double timeBudgetSeconds = core::DEFAULT_TIME_BUDGET_SECONDS;
  };

  struct CandidateLine
  {
    int rank = 1; // 1 = principal line
    std::string uci;
    std::string san;
    std::optional<int> evalCp;
  };

  struct PlyRecord
  {
    int ply = 0; // 1-based
    std::string playedUci;
    std::string playedSan;
    std::string fenAfter;
    std::optional<int> evalCp; // principal line only
    std::vector<CandidateLine> pvs; // ascending rank
  };

  struct KeyMoment
  {
    int ply = 0;
    std::string playedSan;
    int evalCp = 0;
    int swing = 0; // |eval(ply) - eval(ply - 1)|
  };

  enum class ErrorCode
  {
    InvalidPgn,
    InvalidFen,
    IllegalMove,
    InternalError,
    InvalidRequest // transport only: the request itself could not be read
  };

  const char *errorCodeName(ErrorCode code);

  struct FirstIllegalMove
  {
    int ply = 0;
    std::string uci;
    std::string fenBefore;
  };

  struct InternalFailure
  {
    std::string stage;
    int completedPlies = 0;
  };

  struct AnalysisError
  {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    std::optional<FirstIllegalMove> firstIllegalMove; // ILLEGAL_MOVE
    std::optional<InternalFailure> internal;          // INTERNAL_ERROR
  };

  enum class Status
  {
    Ok,
    Error
  };

  struct ResultEnvelope
  {
    Status status = Status::Ok;
    bool legal = true;
    std::vector<PlyRecord> perPly;
    std::vector<KeyMoment> keyMoments;
    std::optional<AnalysisError> error;
  };

} // namespace kibitz::analysis
