#include "kibitz/app/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace kibitz::app {

[[noreturn]] static void usage_and_exit(int code) {
  std::cerr
      << "Usage: kibitz --pgn <file|-> [options]\n"
         "       kibitz --serve [--workers N] [options]\n"
         "Request:\n"
         "  --pgn <file|->            Game record to analyse (- reads stdin)\n"
         "  --fen <FEN>               Starting position override\n"
         "  --depth <D>               Search depth per ply (default 12, 0 => none)\n"
         "  --multipv <N>             Lines per ply, 1..3 (default 2)\n"
         "  --time <sec>              Time budget per ply in seconds (default 0.05)\n"
         "Serve:\n"
         "  --serve                   Read one JSON request per line from stdin\n"
         "  --workers <N>             Concurrent requests (default hw threads)\n"
         "Engine:\n"
         "  --engine <path>           UCI engine binary (default autodetect)\n"
         "  --threads <N>             Engine Threads option, if supported\n"
         "  --hash <MB>               Engine Hash option, if supported\n"
         "  --engine-timeout <ms>     Reply timeout per search (default 30000, 0 => off)\n"
         "Output:\n"
         "  --pretty                  Indent JSON output\n"
         "  --version                 Print version and exit\n";
  std::exit(code);
}

Options parse_args(int argc, char** argv) {
  Options o;
  o.workers = std::max(1u, std::thread::hardware_concurrency());

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(2);
    }
    return argv[++i];
  };

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];

      if (arg == "--pgn") {
        o.pgnPath = require_value(i, "--pgn");
      } else if (arg == "--fen") {
        o.fen = require_value(i, "--fen");
      } else if (arg == "--depth") {
        o.depth = std::stoi(require_value(i, "--depth"));
      } else if (arg == "--multipv") {
        o.multipv = std::stoi(require_value(i, "--multipv"));
      } else if (arg == "--time") {
        o.timeSec = std::stod(require_value(i, "--time"));
      } else if (arg == "--serve") {
        o.serve = true;
      } else if (arg == "--workers") {
        o.workers = std::stoi(require_value(i, "--workers"));
      } else if (arg == "--engine") {
        o.enginePath = require_value(i, "--engine");
      } else if (arg == "--threads") {
        o.threads = std::stoi(require_value(i, "--threads"));
      } else if (arg == "--hash") {
        o.hashMb = std::stoi(require_value(i, "--hash"));
      } else if (arg == "--engine-timeout") {
        o.engineTimeoutMs = std::stoi(require_value(i, "--engine-timeout"));
      } else if (arg == "--pretty") {
        o.pretty = true;
      } else if (arg == "--version") {
        std::cout << core::KIBITZ_VERSION << "\n";
        std::exit(0);
      } else if (arg == "--help" || arg == "-h") {
        usage_and_exit(0);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        usage_and_exit(2);
      }
    }
  } catch (const std::logic_error& e) {
    // std::stoi / std::stod: invalid_argument, out_of_range
    std::cerr << "Bad numeric value: " << e.what() << "\n";
    usage_and_exit(2);
  }

  if (!o.serve && o.pgnPath.empty()) {
    std::cerr << "Nothing to do: pass --pgn <file|-> or --serve.\n";
    usage_and_exit(2);
  }
  if (o.serve && !o.pgnPath.empty()) {
    std::cerr << "--pgn and --serve are mutually exclusive.\n";
    usage_and_exit(2);
  }

  // Normalize
  o.workers = std::clamp(o.workers, 1, 64);
  o.depth = std::max(0, o.depth);
  o.multipv = std::clamp(o.multipv, core::MIN_ANALYSIS_LINES, core::MAX_ANALYSIS_LINES);
  o.timeSec = std::max(0.0, o.timeSec);
  o.engineTimeoutMs = std::max(0, o.engineTimeoutMs);
  if (o.threads) o.threads = std::max(1, *o.threads);
  if (o.hashMb) o.hashMb = std::max(1, *o.hashMb);
  return o;
}

}  // namespace kibitz::app
