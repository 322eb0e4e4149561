#pragma once
#include <optional>

#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"
#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  // Tactical flaw of a played move, first match wins:
  // allows mate, walks into check, hangs the moved piece, bad trade,
  // leaves another piece hanging, misses a free capture.
  std::optional<ProblemDiagnosis> diagnose(const model::Position &before, const model::Move &m,
                                           const model::Position &after);
} // namespace glyph::review
