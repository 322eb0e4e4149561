#include "glyph/review/sacrifice_detector.hpp"

#include "glyph/model/rules.hpp"
#include "glyph/review/material.hpp"

namespace glyph::review
{
  bool isSacrifice(const model::Position &before, const model::Move &m)
  {
    const int own = movedValue(before, m);
    const int captured = capturedValue(before, m);

    const auto after = model::rules::applyMove(before, m);
    if (!after)
      return false;

    const SquareControl c = squareControl(*after, m.to(), before.sideToMove());
    if (!c.attackers)
      return false;

    // even trade
    if (c.minAttacker == own && captured == 0)
      return false;

    const bool defended = c.defenders != 0;

    if (!defended && captured == 0 && own >= 3)
      return true;
    if (c.minAttacker < own && own - c.minAttacker - captured >= 2)
      return true;
    if (captured > 0 && captured - own <= -2 && !defended)
      return true;
    return false;
  }
} // namespace glyph::review
