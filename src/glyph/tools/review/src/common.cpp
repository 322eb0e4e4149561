#include "glyph/tools/review/common.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace glyph::tools::review {

namespace {

std::optional<fs::path> env_path(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return std::nullopt;
  return fs::path(v);
}

fs::path executable_dir(const char* argv0) {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    if (!argv0 || !*argv0) return {};
    ec.clear();
    exe = fs::absolute(fs::path(argv0), ec);
    if (ec) return {};
  }
  return exe.parent_path();
}

bool is_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

}  // namespace

std::optional<fs::path> find_engine_in_dir(const fs::path& dir) {
  std::error_code ec;
  if (dir.empty() || !fs::is_directory(dir, ec)) return std::nullopt;

  if (is_file(dir / "stockfish")) return dir / "stockfish";

  for (fs::directory_iterator it{dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
    std::error_code fe, le;
    if (!it->is_regular_file(fe) && !it->is_symlink(le)) continue;
    if (it->path().filename().string().rfind("stockfish", 0) == 0) return it->path();
  }
  return std::nullopt;
}

DefaultPaths compute_default_paths(const char* argv0) {
  DefaultPaths d;
  d.stockfish = env_path("STOCKFISH_PATH");
  d.book = env_path("BOOK_PATH");

  const fs::path here = executable_dir(argv0);
  if (!d.stockfish) d.stockfish = find_engine_in_dir(here);
  if (!d.stockfish && is_file(kSystemStockfish)) d.stockfish = fs::path(kSystemStockfish);
  if (!d.book && !here.empty() && is_file(here / kBookFileName)) d.book = here / kBookFileName;
  return d;
}

std::string read_input(const std::string& path) {
  if (path == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open input: " + path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace glyph::tools::review
