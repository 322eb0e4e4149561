#pragma once
#include <string>
#include <vector>

#include "glyph/model/analysis/game_record.hpp"
#include "glyph/model/analysis/opening_book.hpp"
#include "glyph/review/config.hpp"
#include "glyph/review/evaluation_scheduler.hpp"
#include "glyph/review/evaluator.hpp"
#include "glyph/review/position_enumerator.hpp"
#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  struct GameAnalysis
  {
    std::vector<AnalysisEntry> entries; // ply order
    std::string openingEco;
    std::string openingName; // deepest named book position reached, empty if none
    ScheduleStats stats;
  };

  // One game's pipeline: evaluate every position in parallel, then classify move by move.
  // Each analyze() call owns its cache and its evaluators; nothing is shared across games.
  class GameAnalyzer
  {
  public:
    GameAnalyzer(AnalyzerConfig cfg, EvaluatorFactory factory, const model::analysis::OpeningBook *book)
        : m_cfg(std::move(cfg)), m_factory(std::move(factory)), m_book(book) {}

    // Throws AnalysisCancelled if 'stop' fires while positions are evaluated.
    GameAnalysis analyze(const Game &game, const StopFlag &stop = nullptr) const;

    // Throws ParseError for an unreadable start position or an illegal move.
    GameAnalysis analyze(const model::analysis::GameRecord &rec, const StopFlag &stop = nullptr) const;

  private:
    AnalyzerConfig m_cfg;
    EvaluatorFactory m_factory;
    const model::analysis::OpeningBook *m_book;
  };
} // namespace glyph::review
