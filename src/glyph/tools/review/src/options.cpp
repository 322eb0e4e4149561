#include "glyph/tools/review/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace glyph::tools::review {

[[noreturn]] static void usage_and_exit(const DefaultPaths& d) {
  std::cerr
      << "Usage: glyph_review [options] <game.pgn | ->\n"
         "Options:\n"
         "  --stockfish <path>   Engine executable (default "
      << (d.stockfish ? d.stockfish->string() : std::string(kSystemStockfish))
      << ")\n"
         "  --book <file>        Extra opening lines, TSV: ECO<TAB>Name<TAB>SAN moves (default "
      << (d.book ? d.book->string() : std::string("none"))
      << ")\n"
         "  --depth <D>          Search depth (default 18)\n"
         "  --hash <MB>          Engine hash per instance (default 64)\n"
         "  --workers <N>        Max parallel engines (default hw threads)\n"
         "  --timeout <ms>       Per-position engine timeout (default 60000)\n"
         "  --skill <0..20>      Stockfish Skill Level (optional)\n"
         "  --elo <E>            UCI_LimitStrength with UCI_Elo=E (optional)\n"
         "  --book-plies <N>     Plies eligible for book detection (default 10)\n"
         "  --review-only        Print only inaccuracies, mistakes, blunders and brilliancies\n"
         "  --format text|tsv    Output format (default text)\n"
         "  --quiet              No warnings\n"
         "  --verbose            Progress and engine details\n"
         "\nEnvironment: STOCKFISH_PATH, BOOK_PATH\n";
  std::exit(1);
}

engine::EvalEngineConfig Options::engineConfig() const {
  engine::EvalEngineConfig c;
  c.path = stockfishPath;
  c.depth = depth;
  c.hashMb = hashMb;
  c.skillLevel = skillLevel;
  c.elo = elo;
  c.searchTimeoutMs = timeoutMs;
  return c;
}

glyph::review::AnalyzerConfig Options::analyzerConfig() const {
  glyph::review::AnalyzerConfig c;
  c.depth = depth;
  c.maxWorkers = workers;
  c.classifier.bookPlyLimit = bookPlies;
  return c;
}

Options parse_args(int argc, char** argv, const DefaultPaths& defaults) {
  Options o;
  o.stockfishPath = defaults.stockfish ? defaults.stockfish->string() : std::string(kSystemStockfish);
  if (defaults.book) o.bookPath = defaults.book->string();

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(defaults);
    }
    return argv[++i];
  };

  auto require_int = [&](int& i, const char* name) -> int {
    const std::string v = require_value(i, name);
    try {
      return std::stoi(v);
    } catch (const std::exception&) {
      std::cerr << "Invalid number for " << name << ": " << v << "\n";
      usage_and_exit(defaults);
    }
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--stockfish") {
      o.stockfishPath = require_value(i, "--stockfish");
    } else if (arg == "--book") {
      o.bookPath = require_value(i, "--book");
    } else if (arg == "--depth") {
      o.depth = std::max(1, require_int(i, "--depth"));
    } else if (arg == "--hash") {
      o.hashMb = std::max(1, require_int(i, "--hash"));
    } else if (arg == "--workers") {
      o.workers = static_cast<std::size_t>(std::max(1, require_int(i, "--workers")));
    } else if (arg == "--timeout") {
      o.timeoutMs = std::max(1, require_int(i, "--timeout"));
    } else if (arg == "--skill") {
      o.skillLevel = std::clamp(require_int(i, "--skill"), 0, 20);
    } else if (arg == "--elo") {
      o.elo = require_int(i, "--elo");
    } else if (arg == "--book-plies") {
      o.bookPlies = std::max(0, require_int(i, "--book-plies"));
    } else if (arg == "--review-only") {
      o.reviewOnly = true;
    } else if (arg == "--format") {
      const std::string f = require_value(i, "--format");
      if (f == "text") {
        o.format = OutputFormat::Text;
      } else if (f == "tsv") {
        o.format = OutputFormat::Tsv;
      } else {
        std::cerr << "Unknown format: " << f << "\n";
        usage_and_exit(defaults);
      }
    } else if (arg == "--quiet") {
      o.verbosity = log::Level::Quiet;
    } else if (arg == "--verbose") {
      o.verbosity = log::Level::Verbose;
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(defaults);
    } else if (arg == "-" || arg.rfind("--", 0) != 0) {
      if (!o.input.empty()) {
        std::cerr << "Only one input file is accepted\n";
        usage_and_exit(defaults);
      }
      o.input = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(defaults);
    }
  }

  if (o.input.empty()) usage_and_exit(defaults);
  return o;
}

}  // namespace glyph::tools::review
