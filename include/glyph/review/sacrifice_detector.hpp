#pragma once
#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"

namespace glyph::review
{
  // True if 'm' deliberately leaves material en prise: an undefended piece of minor value
  // or more, a piece that a cheaper attacker wins, or a capture that gives back more than it
  // took. Even trades never count.
  bool isSacrifice(const model::Position &before, const model::Move &m);
} // namespace glyph::review
