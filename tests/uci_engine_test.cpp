#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "kibitz/analysis/analysis_service.hpp"
#include "kibitz/engine/engine_locator.hpp"
#include "kibitz/engine/uci/uci_analysis_engine.hpp"
#include "kibitz/engine/uci/uci_engine_process.hpp"

using namespace kibitz;

static std::string dataPath(const char *name)
{
  return std::string(KIBITZ_TEST_DATA_DIR) + "/" + name;
}

int main()
{
  // option line parsing
  {
    engine::uci::UciOption opt;
    assert(engine::uci::UciEngineProcess::parseUciOptionLine(
        "option name MultiPV type spin default 1 min 1 max 500", opt));
    assert(opt.name == "MultiPV");
    assert(opt.type == engine::uci::UciOption::Type::Spin);
    assert(opt.min == 1 && opt.max == 500);

    assert(engine::uci::UciEngineProcess::parseUciOptionLine(
        "option name Skill Level type spin default 20 min 0 max 20", opt));
    assert(opt.name == "Skill Level");
    assert(!engine::uci::UciEngineProcess::parseUciOptionLine("id name Foo", opt));
  }

  // Handshake, MultiPV, score normalisation
  {
    engine::uci::UciEngineSettings settings;
    settings.path = dataPath("fake_uci_engine.sh");
    settings.threads = 64; // clamped to the advertised max
    settings.hashMb = 32;
    engine::uci::UciAnalysisEngine eng(settings);

    assert(eng.id().name == "FakeFish 1.0");
    assert(eng.id().author == "kibitz tests");
    assert(engine::uci::findOption(eng.options(), "multipv"));
    assert(engine::uci::findOption(eng.options(), "Threads"));

    const std::string fen = core::START_FEN;
    auto lines = eng.analyze(fen, engine::SearchLimits{5, 20}, 2);
    assert(eng.configuredLines() == 2);
    assert(lines.size() == 2);
    assert(lines[0].multipv == 1);
    assert(lines[0].depth == 5);
    assert(lines[0].evalCp && *lines[0].evalCp == 31);
    assert((lines[0].pv == std::vector<std::string>{"e2e4", "e7e5"}));
    assert(lines[1].multipv == 2);
    assert(lines[1].evalCp && *lines[1].evalCp == -core::MATE_SENTINEL_CP);
    assert(lines[1].pv.front() == "d2d4");

    // Black to move: the same raw scores flip sign
    lines = eng.analyze("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1",
                        engine::SearchLimits{5, std::nullopt}, 2);
    assert(*lines[0].evalCp == -31);
    assert(*lines[1].evalCp == core::MATE_SENTINEL_CP);

    // Fewer lines requested than the engine was running with
    lines = eng.analyze(fen, engine::SearchLimits{}, 1);
    assert(eng.configuredLines() == 1);
    assert(lines.size() == 1);
    assert(*lines[0].evalCp == 31);
  }

  // Engine without MultiPV delivers a single line
  {
    engine::uci::UciEngineSettings settings;
    settings.path = dataPath("fake_uci_engine_single.sh");
    engine::uci::UciAnalysisEngine eng(settings);
    assert(eng.id().name == "SingleLine");

    const auto lines = eng.analyze(core::START_FEN, engine::SearchLimits{3, 10}, 3);
    assert(eng.configuredLines() == 1);
    assert(lines.size() == 1);
    assert(lines[0].multipv == 1);
    assert(*lines[0].evalCp == -12);
    assert(lines[0].pv.front() == "g1f3");
  }

  // A silent engine turns into an error after the reply timeout
  {
    engine::uci::UciEngineSettings settings;
    settings.path = dataPath("fake_uci_engine_silent.sh");
    settings.replyTimeout = std::chrono::milliseconds(200);
    engine::uci::UciAnalysisEngine eng(settings);

    bool threw = false;
    try
    {
      (void)eng.analyze(core::START_FEN, engine::SearchLimits{std::nullopt, 10}, 1);
    }
    catch (const std::runtime_error &)
    {
      threw = true;
    }
    assert(threw);
  }

  // Missing binary
  {
    engine::uci::UciEngineSettings settings;
    settings.path = dataPath("no_such_engine");
    bool threw = false;
    try
    {
      engine::uci::UciAnalysisEngine eng(settings);
    }
    catch (const std::runtime_error &)
    {
      threw = true;
    }
    assert(threw);
  }

  // Engines spawned side by side keep none of each other's pipes: every
  // session sees EOF from its own engine while the others are still alive.
  {
    constexpr int kSessions = 8;
    std::vector<std::unique_ptr<engine::uci::UciEngineProcess>> workers, keepers;
    for (int i = 0; i < kSessions; ++i)
    {
      workers.push_back(std::make_unique<engine::uci::UciEngineProcess>());
      keepers.push_back(std::make_unique<engine::uci::UciEngineProcess>());
    }

    std::vector<std::thread> spawners;
    std::atomic<int> started{0};
    for (int i = 0; i < kSessions; ++i)
    {
      spawners.emplace_back([&, i]
                            {
        if (workers[i]->start(dataPath("fake_uci_engine.sh")))
          ++started;
        if (keepers[i]->start(dataPath("fake_uci_engine_silent.sh")))
          ++started; });
    }
    for (auto &t : spawners)
      t.join();
    assert(started == 2 * kSessions);

    for (auto &w : workers)
    {
      assert(w->running());
      engine::uci::UciEngineProcess::Id id;
      std::vector<engine::uci::UciOption> opts;
      assert(w->uciHandshake(id, opts, std::chrono::milliseconds(2000)));

      const auto t0 = std::chrono::steady_clock::now();
      w->stop();
      assert(!w->running());
      assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
    }
    for (auto &k : keepers)
    {
      assert(k->running());
      k->stop();
      assert(!k->running());
    }
  }

  // Whole pipeline over a real process
  {
    engine::uci::UciEngineSettings settings;
    settings.path = dataPath("fake_uci_engine.sh");
    engine::uci::UciEngineProvider provider(settings);
    analysis::AnalysisService service(provider);

    analysis::AnalyzeRequest req;
    req.record = "1. d4 *";
    const auto r = service.analyze(req);
    assert(r.status == analysis::Status::Ok);
    assert(r.perPly.size() == 1);
    // e2e4 / d2d4 are not Black moves; every line is dropped
    assert(r.perPly[0].pvs.empty());
    assert(!r.perPly[0].evalCp);

    req.record = "[FEN \"rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR b KQkq - 0 1\"]\n1... Nf6 *";
    const auto r2 = service.analyze(req);
    assert(r2.status == analysis::Status::Ok);
    assert(r2.perPly.size() == 1);
    assert(r2.perPly[0].pvs.size() == 2);
    assert(r2.perPly[0].pvs[0].san == "e4");
    assert(r2.perPly[0].pvs[1].san == "d4");
    assert(*r2.perPly[0].evalCp == 31);
  }

  // Engine discovery
  {
    const std::string script = dataPath("fake_uci_engine.sh");
    const auto found = engine::locate_engine(script, nullptr);
    assert(found && found->string() == script);
    assert(!engine::locate_engine(dataPath("no_such_engine"), nullptr));

    const auto inDir = engine::find_stockfish_in_dir(KIBITZ_TEST_DATA_DIR);
    assert(!inDir);
  }

  std::cout << "uci_engine_test passed\n";
  return 0;
}
