#include "glyph/review/miss_detector.hpp"

#include "glyph/model/rules.hpp"
#include "glyph/review/material.hpp"

namespace glyph::review
{
  bool isMiss(const model::Position &before, const std::optional<model::Move> &bestMove,
              const model::Move &played, std::optional<int> evalBefore, std::optional<int> evalAfter,
              core::Color side, const ClassifierConfig &cfg)
  {
    if (!evalBefore || !evalAfter)
      return false;

    const int sign = side == core::Color::White ? 1 : -1;
    const int loss = sign * (*evalBefore - *evalAfter);
    if (loss < cfg.missLossMin || loss > cfg.missLossMax)
      return false;

    const bool wasBetter = sign * *evalBefore >= cfg.missAdvantageMin;
    const bool bestWinsMaterial =
        bestMove && bestMove->isCapture() && capturedValue(before, *bestMove) >= cfg.missCaptureValueMin;
    if (!wasBetter && !bestWinsMaterial)
      return false;

    const auto after = model::rules::applyMove(before, played);
    if (!after)
      return false;
    return !hangsMovedPiece(before, played, *after);
  }
} // namespace glyph::review
