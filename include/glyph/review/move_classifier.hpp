#pragma once
#include <optional>
#include <string>

#include "glyph/chess_types.hpp"
#include "glyph/review/config.hpp"
#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  // Everything the classifier needs to know about one played move.
  struct MoveFacts
  {
    core::Color side = core::Color::White;
    bool deliversMate = false;
    bool deliversStalemate = false;
    bool isBook = false;
    bool isForced = false;
    bool isMiss = false;
    bool isSacrifice = false;
    std::optional<int> evalBefore; // White POV
    std::optional<int> evalAfter;  // White POV
    std::optional<int> loss;       // unclamped mover-POV loss; empty if not computable
    std::optional<ProblemDiagnosis> diagnosis;
    std::optional<std::string> bestMoveSan; // engine's choice when it differs from the move
  };

  struct Verdict
  {
    MoveQuality quality = MoveQuality::Unknown;
    std::string comment;
    int loss = 0; // clamped to [0, lossCeiling]
  };

  // Mover-POV loss of playing into 'evalAfter' instead of the line worth 'bestLineEval'.
  int moverLoss(core::Color side, int bestLineEval, int evalAfter);

  int clampLoss(int loss, const ClassifierConfig &cfg = {});

  MoveQuality qualityForLoss(int clampedLoss, const ClassifierConfig &cfg = {});

  // First match wins: mate, book, forced, miss, loss table (stalemate handled specially),
  // then the brilliant upgrade of best/excellent sacrifices.
  Verdict classify(const MoveFacts &f, const ClassifierConfig &cfg = {});
} // namespace glyph::review
