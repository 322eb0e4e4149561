#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "glyph/review/game_summary.hpp"
#include "glyph/review/report_writer.hpp"

using namespace glyph;
using namespace glyph::review;

static AnalysisEntry entry(int ply, MoveQuality q, int loss, const std::string &san = "x")
{
  AnalysisEntry e;
  e.ply = ply;
  e.san = san;
  e.quality = q;
  e.isBook = q == MoveQuality::Book;
  e.centipawnLoss = loss;
  e.side = (ply % 2 == 1) ? core::Color::White : core::Color::Black;
  return e;
}

int main()
{
  // Phases by ply index
  {
    assert(phaseOf(0) == GamePhase::Opening);
    assert(phaseOf(19) == GamePhase::Opening);
    assert(phaseOf(20) == GamePhase::Middlegame);
    assert(phaseOf(59) == GamePhase::Middlegame);
    assert(phaseOf(60) == GamePhase::Endgame);
  }

  const std::vector<AnalysisEntry> entries = {
      entry(1, MoveQuality::Book, 0, "e4"),
      entry(2, MoveQuality::Mistake, 150, "f6"),
      entry(3, MoveQuality::Best, 0, "d4"),
      entry(4, MoveQuality::Good, 20, "g5"),
      entry(5, MoveQuality::Blunder, 400, "Qh5"),
      entry(7, MoveQuality::Unknown, 0, "Qe2"),
  };

  // Per-side counts, loss and phase ratings
  {
    const auto r = summarize(entries, "Some Opening");
    assert(r.openingName == "Some Opening");

    assert(r.white.count(MoveQuality::Book) == 1);
    assert(r.white.count(MoveQuality::Blunder) == 1);
    assert(r.white.count(MoveQuality::Unknown) == 1);
    assert(r.white.count(MoveQuality::Mistake) == 0);
    assert(r.black.count(MoveQuality::Mistake) == 1);

    assert(r.white.averageCentipawnLoss && *r.white.averageCentipawnLoss == 200.0);
    assert(r.black.averageCentipawnLoss && *r.black.averageCentipawnLoss == 85.0);

    // d4 and Qh5 are scored; Qe2 has no evaluation and does not dilute the blunder
    assert(r.white.phase(GamePhase::Opening) == PhaseRating::Poor);
    assert(r.black.phase(GamePhase::Opening) == PhaseRating::Ok);
    assert(!r.white.phase(GamePhase::Middlegame));
    assert(!r.black.phase(GamePhase::Endgame));
  }

  // Book-only and clean phases
  {
    std::vector<AnalysisEntry> clean = {
        entry(1, MoveQuality::Book, 0),
        entry(2, MoveQuality::Book, 0),
        entry(61, MoveQuality::Best, 0),
        entry(63, MoveQuality::Inaccuracy, 60),
        entry(65, MoveQuality::Excellent, 5),
        entry(67, MoveQuality::Best, 0),
    };
    const auto r = summarize(clean, "");
    assert(r.white.phase(GamePhase::Opening) == PhaseRating::Excellent);
    assert(r.black.phase(GamePhase::Opening) == PhaseRating::Excellent);
    assert(!r.black.averageCentipawnLoss);
    // one inaccuracy in four moves
    assert(r.white.phase(GamePhase::Endgame) == PhaseRating::Excellent);

    clean.push_back(entry(69, MoveQuality::Mistake, 150));
    assert(summarize(clean, "").white.phase(GamePhase::Endgame) == PhaseRating::Good);
  }

  // Failed evaluations leave a phase unrated
  {
    std::vector<AnalysisEntry> failed = {
        entry(1, MoveQuality::Book, 0),
        entry(3, MoveQuality::Unknown, 0),
        entry(61, MoveQuality::Unknown, 0),
        entry(63, MoveQuality::Unknown, 0),
    };
    const auto r = summarize(failed, "");
    assert(!r.white.phase(GamePhase::Opening));
    assert(!r.white.phase(GamePhase::Endgame));
    assert(!r.white.averageCentipawnLoss);
    assert(r.white.count(MoveQuality::Unknown) == 3);
  }

  // Moves worth a second look
  {
    auto withBrilliant = entries;
    withBrilliant.push_back(entry(9, MoveQuality::Brilliant, 0, "Qxf7+"));
    const auto review = movesNeedingReview(withBrilliant);
    assert(review.size() == 3);
    assert(review[0].ply == 2);
    assert(review[1].ply == 5);
    assert(review[2].quality == MoveQuality::Brilliant);
  }

  // Text report
  {
    model::analysis::GameRecord rec;
    rec.tags["White"] = "Alice";
    rec.tags["Black"] = "Bob";
    rec.result = "1-0";

    GameAnalysis analysis;
    analysis.entries = entries;
    analysis.openingEco = "B00";
    analysis.openingName = "King's Pawn Opening";
    const auto report = summarize(entries, analysis.openingName);

    std::ostringstream full;
    writeTextReport(full, rec, analysis, report, false);
    const std::string text = full.str();
    assert(text.find("[White \"Alice\"]") != std::string::npos);
    assert(text.find("Opening: B00 King's Pawn Opening") != std::string::npos);
    assert(text.find("1. e4") != std::string::npos);
    assert(text.find("1... f6") != std::string::npos);
    assert(text.find("3. Qh5") != std::string::npos);
    assert(text.find("average centipawn loss: 200.0") != std::string::npos);
    assert(text.find("Result: 1-0") != std::string::npos);

    std::ostringstream brief;
    writeTextReport(brief, rec, analysis, report, true);
    assert(brief.str().find("2. d4") == std::string::npos);
    assert(brief.str().find("3. Qh5") != std::string::npos);
  }

  // TSV rows
  {
    std::ostringstream os;
    writeTsvHeader(os);
    auto rows = entries;
    rows[1].comment = "two\tcolumns";
    rows[1].problem = ProblemKind::HangingPiece;
    writeTsvRows(os, 3, rows);

    std::istringstream in(os.str());
    std::string line;
    int n = 0;
    while (std::getline(in, line))
    {
      ++n;
      std::size_t tabs = 0;
      for (char c : line)
        tabs += c == '\t';
      assert(tabs == 11);
    }
    assert(n == 1 + static_cast<int>(rows.size()));
    assert(os.str().find("3\t2\tb\tf6\tmistake\t0\t-\t-\t150\t-\thanging_piece\ttwo columns\n") != std::string::npos);
  }

  return 0;
}
