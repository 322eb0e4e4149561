#pragma once
#include <string>

#include "glyph/chess_types.hpp"
#include "glyph/model/core/model_types.hpp"
#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"

namespace glyph::review
{
  // Value of a piece when it is the one doing the capturing: a king never counts as cheap.
  constexpr int KING_ATTACKER_VALUE = 100;

  int attackerValue(core::PieceType pt);

  // Value that arrives on the destination square (the promoted piece for promotions).
  int movedValue(const model::Position &before, const model::Move &m);

  // Value of whatever 'm' captures; a pawn for en passant, 0 for quiet moves.
  int capturedValue(const model::Position &before, const model::Move &m);

  struct SquareControl
  {
    model::bb::Bitboard attackers = 0; // pieces of the side not owning the square
    model::bb::Bitboard defenders = 0; // pieces of the owner
    int minAttacker = 0;               // attackerValue of the cheapest attacker, 0 if none
    core::Square minAttackerSq = core::NO_SQUARE;
  };

  // Attack and defence of 'sq' in 'pos', seen from the side 'owner'.
  SquareControl squareControl(const model::Position &pos, core::Square sq, core::Color owner);

  // The moved piece is attacked and undefended on its destination and is worth more than it took.
  bool hangsMovedPiece(const model::Position &before, const model::Move &m, const model::Position &after);

  // "knight on f3"
  std::string describePiece(const model::Position &pos, core::Square sq);
} // namespace glyph::review
