#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kibitz/engine/analysis_engine.hpp"
#include "kibitz/engine/uci/uci_engine_process.hpp"

namespace kibitz::engine::uci
{

  struct UciEngineSettings
  {
    std::string path;
    std::optional<int> threads; // applied only if the engine advertises "Threads"
    std::optional<int> hashMb;  // applied only if the engine advertises "Hash"
    std::chrono::milliseconds handshakeTimeout{5000};
    // Budget for one search on top of its movetime; zero waits forever.
    std::chrono::milliseconds replyTimeout{30000};
  };

  // One engine process per instance. Construction starts the process and runs the
  // handshake (throws std::runtime_error on failure); destruction quits it.
  class UciAnalysisEngine final : public AnalysisEngine
  {
  public:
    explicit UciAnalysisEngine(UciEngineSettings settings);
    ~UciAnalysisEngine() override;

    UciAnalysisEngine(const UciAnalysisEngine &) = delete;
    UciAnalysisEngine &operator=(const UciAnalysisEngine &) = delete;

    std::vector<EngineLine> analyze(const std::string &fen, const SearchLimits &limits,
                                    int lineCount) override;

    const UciEngineProcess::Id &id() const { return m_id; }
    const std::vector<UciOption> &options() const { return m_options; }
    int configuredLines() const { return m_lines; }

  private:
    int applyLineCount(int requested);
    void applyTuning();

    UciEngineSettings m_settings;
    UciEngineProcess m_proc;
    UciEngineProcess::Id m_id;
    std::vector<UciOption> m_options;
    int m_lines = 1; // MultiPV currently in effect
    bool m_linesSent = false;
  };

  class UciEngineProvider final : public EngineProvider
  {
  public:
    explicit UciEngineProvider(UciEngineSettings settings) : m_settings(std::move(settings)) {}

    std::unique_ptr<AnalysisEngine> open() override;

  private:
    UciEngineSettings m_settings;
  };

} // namespace kibitz::engine::uci
