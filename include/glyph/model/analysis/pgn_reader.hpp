#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "glyph/model/analysis/game_record.hpp"

namespace glyph::model::analysis
{
  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err = nullptr);

  // Splits a multi-game PGN file into one text block per game. A new game starts at a
  // tag section that follows movetext.
  std::vector<std::string> splitPgnGames(std::string_view text);
}
