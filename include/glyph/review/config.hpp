#pragma once
#include <cstddef>

namespace glyph::review
{
  struct ClassifierConfig
  {
    // loss thresholds (centipawns, inclusive upper bounds)
    int bestMax = 0;
    int excellentMax = 10;
    int goodMax = 30;
    int inaccuracyMax = 80;
    int mistakeMax = 200; // above: blunder

    int lossCeiling = 800;        // mate scores would otherwise dominate
    int stalemateBalanced = 200;  // |evalBefore| below this: stalemate costs nothing
    int stalemateLoss = 150;

    int bookPlyLimit = 10; // plies [0, limit) are looked up in the book

    int missLossMin = 50;
    int missLossMax = 200;
    int missAdvantageMin = 100;   // mover already this far ahead
    int missCaptureValueMin = 3;  // or the best move wins at least a minor piece

    int brilliantMaxAdvantage = 500; // "competitive" before the move
    int brilliantEvalFloor = 100;    // post-move eval must not be worse than -floor for the mover
  };

  struct AnalyzerConfig
  {
    ClassifierConfig classifier;
    int depth = 18;
    std::size_t maxWorkers = 0; // 0 => hardware concurrency
  };
} // namespace glyph::review
