#include "kibitz/engine/engine_locator.hpp"

#include <array>
#include <cstdlib>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace kibitz::engine {

namespace {

bool is_executable_file(const fs::path& p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return false;
  return ::access(p.c_str(), X_OK) == 0;
}

std::vector<fs::path> path_entries() {
  std::vector<fs::path> out;
  const char* env = std::getenv("PATH");
  if (!env) return out;
  std::string_view sv{env};
  while (!sv.empty()) {
    const auto colon = sv.find(':');
    const auto part = sv.substr(0, colon);
    if (!part.empty()) out.emplace_back(std::string(part));
    if (colon == std::string_view::npos) break;
    sv.remove_prefix(colon + 1);
  }
  return out;
}

std::optional<fs::path> find_on_path(const std::string& name) {
  for (const auto& dir : path_entries()) {
    const fs::path candidate = dir / name;
    if (is_executable_file(candidate)) return candidate;
  }
  return std::nullopt;
}

}  // namespace

fs::path executable_dir(const char* argv0) {
  fs::path exePath;
  std::error_code ec;
  exePath = fs::read_symlink("/proc/self/exe", ec);
  if (ec && argv0 && *argv0) exePath = fs::absolute(fs::path(argv0), ec);
  if (ec) exePath.clear();
  if (exePath.empty()) return fs::current_path(ec);
  fs::path exeDir = exePath.has_filename() ? exePath.parent_path() : exePath;
  if (exeDir.empty()) exeDir = fs::current_path(ec);
  return exeDir;
}

std::optional<fs::path> find_stockfish_in_dir(const fs::path& dir) {
  if (dir.empty()) return std::nullopt;
  std::error_code ec;
  if (!fs::exists(dir, ec)) return std::nullopt;

  const fs::path exact = dir / "stockfish";
  if (is_executable_file(exact)) return exact;

  for (fs::directory_iterator it{dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.rfind("stockfish", 0) == 0 && is_executable_file(it->path())) return it->path();
  }
  return std::nullopt;
}

std::optional<fs::path> locate_engine(const std::string& explicitPath, const char* argv0) {
  if (!explicitPath.empty()) {
    if (explicitPath.find('/') == std::string::npos) {
      if (is_executable_file(explicitPath)) return fs::path(explicitPath);
      return find_on_path(explicitPath);
    }
    if (is_executable_file(explicitPath)) return fs::path(explicitPath);
    return std::nullopt;
  }

  if (const char* env = std::getenv("KIBITZ_ENGINE"); env && *env) {
    return locate_engine(env, argv0);
  }

  const std::array<fs::path, 4> dirs = {executable_dir(argv0), fs::path("/usr/games"),
                                        fs::path("/usr/local/bin"), fs::path("/usr/bin")};
  for (const auto& dir : dirs) {
    if (auto found = find_stockfish_in_dir(dir)) return found;
  }
  return find_on_path("stockfish");
}

}  // namespace kibitz::engine
