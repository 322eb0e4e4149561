#pragma once
#include <ostream>
#include <vector>

#include "glyph/model/analysis/game_record.hpp"
#include "glyph/review/game_analyzer.hpp"
#include "glyph/review/game_summary.hpp"

namespace glyph::review
{
  // Human-readable: header tags, one line per move (or only moves needing review), summary.
  void writeTextReport(std::ostream &os, const model::analysis::GameRecord &rec, const GameAnalysis &analysis,
                       const GameReport &report, bool reviewOnly);

  void writeTsvHeader(std::ostream &os);

  // One row per move, prefixed by the 1-based game number.
  void writeTsvRows(std::ostream &os, int gameNo, const std::vector<AnalysisEntry> &entries);
} // namespace glyph::review
