#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "kibitz/analysis/analysis_service.hpp"
#include "kibitz/analysis/result_envelope.hpp"
#include "kibitz/app/options.hpp"
#include "kibitz/app/serve.hpp"
#include "kibitz/engine/engine_locator.hpp"
#include "kibitz/engine/uci/uci_analysis_engine.hpp"

namespace
{
  std::string readAll(const std::string &path)
  {
    if (path == "-")
      return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());

    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw std::runtime_error("cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
} // namespace

int main(int argc, char **argv)
{
  using namespace kibitz;

  try
  {
    const app::Options opts = app::parse_args(argc, argv);

    const auto enginePath = engine::locate_engine(opts.enginePath, argc > 0 ? argv[0] : nullptr);
    if (!enginePath)
    {
      throw std::runtime_error(
          "UCI engine not found. Pass --engine <path>, set KIBITZ_ENGINE or install stockfish.");
    }

    engine::uci::UciEngineSettings settings;
    settings.path = enginePath->string();
    settings.threads = opts.threads;
    settings.hashMb = opts.hashMb;
    settings.replyTimeout = std::chrono::milliseconds(opts.engineTimeoutMs);

#if KIBITZ_LOG
    std::cerr << "[Main] engine " << settings.path << "\n";
#endif

    engine::uci::UciEngineProvider provider(settings);
    analysis::AnalysisService service(provider);

    if (opts.serve)
    {
      const int answered = app::run_serve(service, std::cin, std::cout, opts.workers, opts.pretty);
#if KIBITZ_LOG
      std::cerr << "[Main] answered " << answered << " requests\n";
#else
      (void)answered;
#endif
      return 0;
    }

    analysis::AnalyzeRequest req;
    req.record = readAll(opts.pgnPath);
    req.initialPosition = opts.fen;
    req.depth = opts.depth;
    req.lineCount = opts.multipv;
    req.timeBudgetSeconds = opts.timeSec;

    const analysis::ResultEnvelope result = service.analyze(req);
    std::cout << nlohmann::json(result).dump(opts.pretty ? 2 : -1) << "\n";
    return result.status == analysis::Status::Ok ? 0 : 1;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << "\n";
    return 2;
  }
}
