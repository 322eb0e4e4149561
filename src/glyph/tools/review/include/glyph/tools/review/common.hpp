#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace glyph::tools::review {

namespace fs = std::filesystem;

// Where the engine binary and the opening table come from when no flag names them.
// Environment first, then the executable's directory, then the system engine.
struct DefaultPaths {
  std::optional<fs::path> stockfish;
  std::optional<fs::path> book;
};

inline constexpr const char* kSystemStockfish = "/usr/games/stockfish";
inline constexpr const char* kBookFileName = "openings.tsv";

// First regular file (or link) in 'dir' whose name starts with "stockfish".
std::optional<fs::path> find_engine_in_dir(const fs::path& dir);

DefaultPaths compute_default_paths(const char* argv0);

// Whole file, or stdin for "-". Throws std::runtime_error if the file cannot be read.
std::string read_input(const std::string& path);

}  // namespace glyph::tools::review
