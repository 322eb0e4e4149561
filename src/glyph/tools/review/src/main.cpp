#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "glyph/constants.hpp"
#include "glyph/log.hpp"
#include "glyph/model/analysis/opening_book.hpp"
#include "glyph/model/analysis/pgn_reader.hpp"
#include "glyph/review/game_analyzer.hpp"
#include "glyph/review/game_summary.hpp"
#include "glyph/review/report_writer.hpp"
#include "glyph/review/uci_evaluator.hpp"
#include "glyph/tools/review/common.hpp"
#include "glyph/tools/review/options.hpp"

namespace
{
  // set from the SIGINT handler; std::atomic<bool> is lock-free here
  std::atomic<bool> *g_stop = nullptr;

  void on_sigint(int)
  {
    if (g_stop)
      g_stop->store(true);
  }
}

int main(int argc, char **argv)
{
  using namespace glyph::tools::review;
  namespace rv = glyph::review;
  namespace an = glyph::model::analysis;

  auto stop = std::make_shared<std::atomic<bool>>(false);
  try
  {
    const DefaultPaths defaults = compute_default_paths(argc > 0 ? argv[0] : nullptr);
    const Options opts = parse_args(argc, argv, defaults);
    glyph::log::set_level(opts.verbosity);

    an::OpeningBook book = an::OpeningBook::builtin();
    if (opts.bookPath)
    {
      std::string err;
      if (!book.loadFromTsvFile(*opts.bookPath, &err))
        glyph::log::warn("OpeningBook", err + ", using built-in lines only");
    }

    const std::vector<std::string> games = an::splitPgnGames(read_input(opts.input));
    if (games.empty())
      throw std::runtime_error("No games found in " + opts.input);

    glyph::log::info("Review", std::string(glyph::core::GLYPH_VERSION) + ", engine " + opts.stockfishPath +
                                   ", depth " + std::to_string(opts.depth));

    g_stop = stop.get();
    std::signal(SIGINT, on_sigint);

    const rv::GameAnalyzer analyzer(opts.analyzerConfig(), rv::UciEvaluator::factory(opts.engineConfig()), &book);

    if (opts.format == OutputFormat::Tsv)
      rv::writeTsvHeader(std::cout);

    int failures = 0;
    for (std::size_t g = 0; g < games.size(); ++g)
    {
      const int gameNo = static_cast<int>(g) + 1;

      an::GameRecord rec;
      std::string err;
      if (!an::parsePgnToRecord(games[g], rec, &err))
      {
        std::cerr << "Error: game " << gameNo << ": " << err << "\n";
        ++failures;
        continue;
      }

      glyph::log::info("Review", "game " + std::to_string(gameNo) + ": " + std::to_string(rec.plies.size()) +
                                     " plies");

      rv::GameAnalysis analysis;
      try
      {
        analysis = analyzer.analyze(rec, stop);
      }
      catch (const rv::ParseError &e)
      {
        std::cerr << "Error: game " << gameNo << ": " << e.what() << "\n";
        ++failures;
        continue;
      }

      if (opts.format == OutputFormat::Tsv)
      {
        rv::writeTsvRows(std::cout, gameNo,
                         opts.reviewOnly ? rv::movesNeedingReview(analysis.entries) : analysis.entries);
      }
      else
      {
        if (g > 0)
          std::cout << "\n";
        const rv::GameReport report = rv::summarize(analysis.entries, analysis.openingName);
        rv::writeTextReport(std::cout, rec, analysis, report, opts.reviewOnly);
      }
      std::cout.flush();
    }

    g_stop = nullptr;
    return failures == 0 ? 0 : 1;
  }
  catch (const glyph::review::AnalysisCancelled &)
  {
    std::cerr << "Interrupted.\n";
    return 130;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
