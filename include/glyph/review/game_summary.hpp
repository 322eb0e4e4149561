#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>

#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  enum class PhaseRating
  {
    Excellent,
    Good,
    Ok,
    Poor
  };

  const char *toString(PhaseRating r);

  enum class GamePhase
  {
    Opening,    // plies [0, 20)
    Middlegame, // [20, 60)
    Endgame     // 60 and later
  };

  GamePhase phaseOf(int plyIndex); // 0-based

  constexpr std::size_t MOVE_QUALITY_COUNT = static_cast<std::size_t>(MoveQuality::Unknown) + 1;

  struct SideReport
  {
    std::array<int, MOVE_QUALITY_COUNT> counts{};
    std::optional<double> averageCentipawnLoss; // excludes book and unknown moves
    std::array<std::optional<PhaseRating>, 3> phases{}; // indexed by GamePhase; empty if no moves

    int count(MoveQuality q) const { return counts[static_cast<std::size_t>(q)]; }
    std::optional<PhaseRating> phase(GamePhase p) const { return phases[static_cast<std::size_t>(p)]; }
  };

  struct GameReport
  {
    SideReport white;
    SideReport black;
    std::string openingName;
  };

  GameReport summarize(const std::vector<AnalysisEntry> &entries, const std::string &openingName);

  // Inaccuracies, mistakes, blunders and brilliancies, in ply order.
  std::vector<AnalysisEntry> movesNeedingReview(const std::vector<AnalysisEntry> &entries);
} // namespace glyph::review
