#include "glyph/review/material.hpp"

#include "glyph/model/core/bitboard.hpp"
#include "glyph/model/rules.hpp"

namespace glyph::review
{
  int attackerValue(core::PieceType pt)
  {
    return pt == core::PieceType::King ? KING_ATTACKER_VALUE : core::materialValue(pt);
  }

  int movedValue(const model::Position &before, const model::Move &m)
  {
    if (m.promotion() != core::PieceType::None && m.promotion() != core::PieceType::Pawn)
      return core::materialValue(m.promotion());
    const auto p = model::rules::pieceAt(before, m.from());
    return p ? core::materialValue(p->type) : 0;
  }

  int capturedValue(const model::Position &before, const model::Move &m)
  {
    if (m.isEnPassant())
      return core::materialValue(core::PieceType::Pawn);
    const auto p = model::rules::pieceAt(before, m.to());
    if (!p || p->color == before.sideToMove())
      return 0;
    return core::materialValue(p->type);
  }

  SquareControl squareControl(const model::Position &pos, core::Square sq, core::Color owner)
  {
    SquareControl c;
    c.attackers = model::rules::attackers(pos, sq, ~owner);
    c.defenders = model::rules::attackers(pos, sq, owner);

    model::bb::Bitboard a = c.attackers;
    while (a)
    {
      const core::Square s = model::bb::pop_lsb(a);
      const auto p = model::rules::pieceAt(pos, s);
      if (!p)
        continue;
      const int v = attackerValue(p->type);
      if (c.minAttackerSq == core::NO_SQUARE || v < c.minAttacker)
      {
        c.minAttacker = v;
        c.minAttackerSq = s;
      }
    }
    return c;
  }

  bool hangsMovedPiece(const model::Position &before, const model::Move &m, const model::Position &after)
  {
    const SquareControl c = squareControl(after, m.to(), before.sideToMove());
    return c.attackers != 0 && c.defenders == 0 && movedValue(before, m) - capturedValue(before, m) > 0;
  }

  std::string describePiece(const model::Position &pos, core::Square sq)
  {
    const auto p = model::rules::pieceAt(pos, sq);
    const std::string name = model::rules::pieceName(p ? p->type : core::PieceType::None);
    return name + " on " + model::rules::squareName(sq);
  }
} // namespace glyph::review
