#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kibitz/analysis/analysis_types.hpp"

namespace kibitz::analysis
{

  ResultEnvelope makeSuccess(std::vector<PlyRecord> perPly, std::vector<KeyMoment> keyMoments);

  // Every error envelope has legal = false. Partial results are kept as given.
  ResultEnvelope makeFailure(AnalysisError error, std::vector<PlyRecord> perPly = {},
                             std::vector<KeyMoment> keyMoments = {});

  ResultEnvelope makeIllegalMove(FirstIllegalMove where, std::vector<PlyRecord> perPly,
                                 std::vector<KeyMoment> keyMoments);

  ResultEnvelope makeInternalError(std::string message, InternalFailure where,
                                   std::vector<PlyRecord> perPly,
                                   std::vector<KeyMoment> keyMoments);

  // JSON with the wire field names (status, legal, per_ply, key_moments, error).
  void to_json(nlohmann::json &j, const CandidateLine &c);
  void to_json(nlohmann::json &j, const PlyRecord &p);
  void to_json(nlohmann::json &j, const KeyMoment &k);
  void to_json(nlohmann::json &j, const AnalysisError &e);
  void to_json(nlohmann::json &j, const ResultEnvelope &r);

} // namespace kibitz::analysis
