#include "glyph/review/game_summary.hpp"

namespace glyph::review
{
  namespace
  {
    struct PhaseTally
    {
      int moves = 0;
      int scored = 0;
      int unknown = 0;
      double bad = 0.0;
    };

    double badWeight(MoveQuality q)
    {
      switch (q)
      {
      case MoveQuality::Blunder:
        return 3.0;
      case MoveQuality::Mistake:
        return 2.0;
      case MoveQuality::Miss:
        return 1.5;
      case MoveQuality::Inaccuracy:
        return 1.0;
      default:
        return 0.0;
      }
    }

    std::optional<PhaseRating> rate(const PhaseTally &t)
    {
      if (t.moves == 0)
        return std::nullopt;
      if (t.scored == 0 && t.unknown > 0)
        return std::nullopt; // nothing could be evaluated
      if (t.scored == 0)
        return PhaseRating::Excellent; // book moves only
      const double avg = t.bad / t.scored;
      if (avg >= 1.5)
        return PhaseRating::Poor;
      if (avg >= 0.8)
        return PhaseRating::Ok;
      if (avg >= 0.3)
        return PhaseRating::Good;
      return PhaseRating::Excellent;
    }

    SideReport summarizeSide(const std::vector<AnalysisEntry> &entries, core::Color side)
    {
      SideReport r;
      std::array<PhaseTally, 3> tally{};
      long long lossSum = 0;
      int lossN = 0;

      for (const auto &e : entries)
      {
        if (e.side != side)
          continue;
        ++r.counts[static_cast<std::size_t>(e.quality)];

        PhaseTally &t = tally[static_cast<std::size_t>(phaseOf(e.ply - 1))];
        ++t.moves;
        if (e.isBook || e.quality == MoveQuality::Book)
          continue;
        if (e.quality == MoveQuality::Unknown)
        {
          ++t.unknown;
          continue;
        }
        ++t.scored;
        t.bad += badWeight(e.quality);
        lossSum += e.centipawnLoss;
        ++lossN;
      }

      if (lossN > 0)
        r.averageCentipawnLoss = static_cast<double>(lossSum) / lossN;
      for (std::size_t p = 0; p < tally.size(); ++p)
        r.phases[p] = rate(tally[p]);
      return r;
    }
  } // namespace

  const char *toString(PhaseRating r)
  {
    switch (r)
    {
    case PhaseRating::Excellent:
      return "excellent";
    case PhaseRating::Good:
      return "good";
    case PhaseRating::Ok:
      return "ok";
    case PhaseRating::Poor:
      return "poor";
    }
    return "ok";
  }

  GamePhase phaseOf(int plyIndex)
  {
    if (plyIndex < 20)
      return GamePhase::Opening;
    if (plyIndex < 60)
      return GamePhase::Middlegame;
    return GamePhase::Endgame;
  }

  GameReport summarize(const std::vector<AnalysisEntry> &entries, const std::string &openingName)
  {
    GameReport g;
    g.white = summarizeSide(entries, core::Color::White);
    g.black = summarizeSide(entries, core::Color::Black);
    g.openingName = openingName;
    return g;
  }

  std::vector<AnalysisEntry> movesNeedingReview(const std::vector<AnalysisEntry> &entries)
  {
    std::vector<AnalysisEntry> out;
    for (const auto &e : entries)
    {
      switch (e.quality)
      {
      case MoveQuality::Inaccuracy:
      case MoveQuality::Mistake:
      case MoveQuality::Blunder:
      case MoveQuality::Brilliant:
        out.push_back(e);
        break;
      default:
        break;
      }
    }
    return out;
  }
} // namespace glyph::review
