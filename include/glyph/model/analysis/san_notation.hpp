#pragma once

#include <string>
#include <string_view>

#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"

namespace glyph::model::notation
{
  // Standard Algebraic Notation for a legal move, with '+'/'#' suffix. Empty if illegal.
  std::string toSan(const model::Position &pos, const model::Move &mv);

  // Accepts SAN (annotations like "!?" and check marks are ignored), "0-0" castling and
  // coordinate moves such as "e2e4".
  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out);
}
