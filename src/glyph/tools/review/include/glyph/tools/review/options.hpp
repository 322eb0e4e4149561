#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "glyph/engine/config.hpp"
#include "glyph/log.hpp"
#include "glyph/review/config.hpp"
#include "glyph/tools/review/common.hpp"

namespace glyph::tools::review {

enum class OutputFormat { Text, Tsv };

struct Options {
  std::string input;  // PGN file, "-" for stdin

  std::string stockfishPath;
  std::optional<std::string> bookPath;

  // Engine
  int depth = 18;
  int hashMb = 64;
  int timeoutMs = 60000;
  std::optional<int> skillLevel;
  std::optional<int> elo;
  std::size_t workers = 0;  // 0 => hardware concurrency

  int bookPlies = 10;

  // Output
  bool reviewOnly = false;
  OutputFormat format = OutputFormat::Text;
  log::Level verbosity = log::Level::Normal;

  engine::EvalEngineConfig engineConfig() const;
  glyph::review::AnalyzerConfig analyzerConfig() const;
};

Options parse_args(int argc, char** argv, const DefaultPaths& defaults);

}  // namespace glyph::tools::review
