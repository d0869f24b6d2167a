#pragma once

#include "kibitz/analysis/analysis_types.hpp"
#include "kibitz/engine/analysis_engine.hpp"

namespace kibitz::analysis
{

  // Runs the whole pipeline for one request: decode, replay, per-ply engine
  // analysis, key moments. Every outcome, including engine failures, comes back
  // as an envelope. One engine session is opened per request, and only once
  // there is a legal position to analyse.
  //
  // Thread-safe as long as the provider is: the service itself holds no
  // per-request state.
  class AnalysisService
  {
  public:
    explicit AnalysisService(engine::EngineProvider &provider) : m_provider(provider) {}

    ResultEnvelope analyze(const AnalyzeRequest &req) noexcept;

  private:
    engine::EngineProvider &m_provider;
  };

} // namespace kibitz::analysis
