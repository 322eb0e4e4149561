#pragma once
#include <optional>

#include "glyph/chess_types.hpp"
#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"
#include "glyph/review/config.hpp"

namespace glyph::review
{
  // A moderately costly move played when the mover was already better, or when the engine's
  // choice won material. Moves that hang the moved piece are mistakes, not misses.
  bool isMiss(const model::Position &before, const std::optional<model::Move> &bestMove,
              const model::Move &played, std::optional<int> evalBefore, std::optional<int> evalAfter,
              core::Color side, const ClassifierConfig &cfg = {});
} // namespace glyph::review
