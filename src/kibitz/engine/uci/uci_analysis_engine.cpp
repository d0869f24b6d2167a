#include "kibitz/engine/uci/uci_analysis_engine.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

#include "kibitz/engine/score.hpp"
#include "kibitz/engine/uci/uci_info.hpp"

namespace kibitz::engine::uci
{
  namespace
  {
    core::Color sideToMoveOf(const std::string &fen)
    {
      const auto sp = fen.find(' ');
      if (sp != std::string::npos && sp + 1 < fen.size() && fen[sp + 1] == 'b')
        return core::Color::Black;
      return core::Color::White;
    }

    // How long to wait for "stop" to produce a bestmove before giving up on the engine.
    constexpr std::chrono::milliseconds kStopGrace{1000};
  } // namespace

  UciAnalysisEngine::UciAnalysisEngine(UciEngineSettings settings) : m_settings(std::move(settings))
  {
    if (m_settings.path.empty())
      throw std::runtime_error("UCI engine path is empty");
    if (!m_proc.start(m_settings.path))
      throw std::runtime_error("failed to start UCI engine: " + m_settings.path);
    if (!m_proc.uciHandshake(m_id, m_options, m_settings.handshakeTimeout))
    {
      m_proc.stop();
      throw std::runtime_error("UCI handshake failed: " + m_settings.path);
    }
    applyTuning();
    m_proc.newGame();
    if (!m_proc.isReady(m_settings.handshakeTimeout))
    {
      m_proc.stop();
      throw std::runtime_error("UCI engine not ready after setup: " + m_settings.path);
    }

#if KIBITZ_LOG
    std::cerr << "[UciEngine] started " << (m_id.name.empty() ? m_settings.path : m_id.name)
              << " (" << m_options.size() << " options)\n";
#endif
  }

  UciAnalysisEngine::~UciAnalysisEngine()
  {
    m_proc.stop();
  }

  void UciAnalysisEngine::applyTuning()
  {
    auto applySpin = [&](const char *name, const std::optional<int> &want)
    {
      if (!want)
        return;
      const UciOption *opt = findOption(m_options, name);
      if (!opt || opt->type != UciOption::Type::Spin)
      {
#if KIBITZ_LOG
        std::cerr << "[UciEngine] option " << name << " not supported, skipped\n";
#endif
        return;
      }
      int v = *want;
      if (opt->max > opt->min)
        v = std::clamp(v, opt->min, opt->max);
      m_proc.setOption(opt->name, v);
    };
    applySpin("Threads", m_settings.threads);
    applySpin("Hash", m_settings.hashMb);
  }

  int UciAnalysisEngine::applyLineCount(int requested)
  {
    requested = std::max(1, requested);
    const UciOption *opt = findOption(m_options, "MultiPV");
    if (!opt || opt->type != UciOption::Type::Spin)
    {
      // engine without MultiPV: one line is all it can deliver
      m_lines = 1;
      return m_lines;
    }

    int want = requested;
    if (opt->max >= std::max(1, opt->min))
      want = std::clamp(requested, std::max(1, opt->min), opt->max);

    if (!m_linesSent || want != m_lines)
    {
      m_proc.setOption(opt->name, want);
      if (!m_proc.isReady(m_settings.handshakeTimeout))
        throw std::runtime_error("UCI engine did not acknowledge MultiPV");
      m_lines = want;
      m_linesSent = true;
    }
    return m_lines;
  }

  std::vector<EngineLine> UciAnalysisEngine::analyze(const std::string &fen,
                                                     const SearchLimits &limits, int lineCount)
  {
    if (m_proc.outputClosed())
      throw std::runtime_error("UCI engine is no longer running");

    const int lines = applyLineCount(lineCount);
    const core::Color stm = sideToMoveOf(fen);

    m_proc.position(fen);
    m_proc.go(limits);

    auto deadline = UciEngineProcess::Clock::time_point::max();
    if (m_settings.replyTimeout.count() > 0)
      deadline = UciEngineProcess::Clock::now() + m_settings.replyTimeout +
                 std::chrono::milliseconds(limits.movetimeMs.value_or(0));

    std::map<int, EngineLine> byRank; // latest info per multipv wins
    std::string line;
    for (;;)
    {
      if (!m_proc.readLine(line, deadline))
      {
        if (m_proc.outputClosed())
          throw std::runtime_error("UCI engine exited during search");

        m_proc.stopSearch();
        const auto graceEnd = UciEngineProcess::Clock::now() + kStopGrace;
        std::string best;
        while (m_proc.readLine(line, graceEnd))
          if (parseBestmoveLine(line, best))
            break;
        std::cerr << "[UciEngine] no reply within " << m_settings.replyTimeout.count()
                  << "ms, search stopped\n";
        throw std::runtime_error("UCI engine did not reply in time");
      }

      std::string best;
      if (parseBestmoveLine(line, best))
        break;

      UciInfo info;
      if (!parseInfoLine(line, info))
        continue;
      if (!info.score && !info.hasPv)
        continue;

      EngineLine &el = byRank[info.multipv];
      el.multipv = info.multipv;
      if (info.depth)
        el.depth = *info.depth;
      if (info.score)
        el.evalCp = normalizeScore(*info.score, stm);
      if (info.hasPv)
        el.pv = std::move(info.pv);
    }

    std::vector<EngineLine> out;
    out.reserve(byRank.size());
    for (auto &[rank, el] : byRank)
    {
      if (rank > lines)
        continue;
      out.push_back(std::move(el));
    }
    return out;
  }

  std::unique_ptr<AnalysisEngine> UciEngineProvider::open()
  {
    return std::make_unique<UciAnalysisEngine>(m_settings);
  }

} // namespace kibitz::engine::uci
