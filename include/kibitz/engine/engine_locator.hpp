#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kibitz::engine {

namespace fs = std::filesystem;

// Directory holding the running executable (falls back to argv[0], then the cwd).
fs::path executable_dir(const char* argv0);

// "stockfish" (or any file whose name starts with it) directly inside `dir`.
std::optional<fs::path> find_stockfish_in_dir(const fs::path& dir);

// Resolves the engine binary: an explicit path (or bare name looked up on PATH),
// then $KIBITZ_ENGINE, then next to the executable, /usr/games, /usr/local/bin,
// /usr/bin, and finally every PATH entry.
std::optional<fs::path> locate_engine(const std::string& explicitPath, const char* argv0);

}  // namespace kibitz::engine
