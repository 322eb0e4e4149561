#pragma once

#include <string>
#include <string_view>

namespace glyph::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
  enum GameResult
  {
    ONGOING,
    CHECKMATE,
    STALEMATE
  };
  // "mate in N" is reported as +/-(MATE_SCORE - N) centipawns.
  constexpr int MATE_SCORE = 10000;

  inline constexpr std::string_view GLYPH_VERSION{"glyph 1.0"};
}
