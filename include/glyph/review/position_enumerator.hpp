#pragma once
#include <string>
#include <vector>

#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"

namespace glyph::review
{
  // A game as the analyzer sees it: positions[i] is the position before moves[i].
  struct Game
  {
    std::vector<model::Move> moves;
    std::vector<model::Position> positions; // moves.size() + 1
  };

  // Replays SAN or UCI tokens from 'start'. Throws ParseError naming the 1-based ply.
  Game enumeratePositions(const model::Position &start, const std::vector<std::string> &tokens);

  // Same for moves that were already resolved, e.g. by the PGN reader.
  Game enumeratePositions(const model::Position &start, const std::vector<model::Move> &moves);
} // namespace glyph::review
