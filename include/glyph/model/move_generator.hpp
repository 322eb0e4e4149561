#pragma once

#include <vector>

#include "glyph/model/board.hpp"
#include "glyph/model/game_state.hpp"
#include "glyph/model/move.hpp"

namespace glyph::model {

class Position;

class MoveGenerator {
 public:
  // Quiet moves, captures, promotions, en passant and castling. Castling is checked for
  // path emptiness and transit squares; everything else is verified by Position::doMove().
  void generatePseudoLegalMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;

  // Pseudo-legal moves filtered through doMove() on a scratch copy.
  void generateLegalMoves(const Position& pos, std::vector<Move>& out) const;
};

}  // namespace glyph::model
