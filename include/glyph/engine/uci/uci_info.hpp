#pragma once
#include <optional>
#include <string>
#include <vector>

namespace glyph::engine::uci {

// One "info ..." line reduced to the fields score evaluation needs.
struct InfoLine {
  int depth = -1;
  bool hasScore = false;
  bool isMate = false;
  bool isBound = false;  // lowerbound/upperbound: not an exact score
  int value = 0;         // centipawns or mate distance, side-to-move POV
  std::string pvFirst;
};

bool parseInfoLine(const std::string& line, InfoLine& out);

// Mate distance to a centipawn-like score. "mate 0" means the side to move is mated.
int mateToScore(int mateIn);

struct SearchResult {
  std::optional<int> score;        // side-to-move POV, mate mapped through mateToScore
  std::optional<std::string> bestmove;  // UCI text; empty for "bestmove (none)"
  int depth = -1;
};

// Deepest exact score among the info lines; later lines win ties.
SearchResult summarizeSearch(const std::vector<std::string>& infoLines, const std::string& bestmoveLine);

}  // namespace glyph::engine::uci
