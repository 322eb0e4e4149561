#include "glyph/review/report_writer.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace glyph::review
{
  namespace
  {
    std::string fmtEval(const std::optional<double> &v)
    {
      if (!v)
        return "-";
      std::ostringstream os;
      os << std::showpos << std::fixed << std::setprecision(2) << *v;
      return os.str();
    }

    // blackFirst: the game starts with Black to move
    std::string moveLabel(const AnalysisEntry &e, bool blackFirst)
    {
      const int moveNo = (e.ply + (blackFirst ? 1 : 0) + 1) / 2;
      return std::to_string(moveNo) + (e.side == core::Color::White ? ". " : "... ") + e.san;
    }

    void writeSide(std::ostream &os, const char *name, const SideReport &s)
    {
      os << name << ":";
      for (std::size_t q = 0; q < MOVE_QUALITY_COUNT; ++q)
      {
        if (s.counts[q] == 0)
          continue;
        os << " " << toString(static_cast<MoveQuality>(q)) << "=" << s.counts[q];
      }
      os << "\n";

      os << "  average centipawn loss: ";
      if (s.averageCentipawnLoss)
        os << std::fixed << std::setprecision(1) << *s.averageCentipawnLoss;
      else
        os << "-";
      os << "\n";

      static const char *kPhase[] = {"opening", "middlegame", "endgame"};
      for (std::size_t p = 0; p < s.phases.size(); ++p)
      {
        if (s.phases[p])
          os << "  " << kPhase[p] << ": " << toString(*s.phases[p]) << "\n";
      }
    }

    std::string tsvSafe(std::string s)
    {
      for (char &c : s)
        if (c == '\t' || c == '\n' || c == '\r')
          c = ' ';
      return s;
    }
  } // namespace

  void writeTextReport(std::ostream &os, const model::analysis::GameRecord &rec, const GameAnalysis &analysis,
                       const GameReport &report, bool reviewOnly)
  {
    static const char *kTags[] = {"Event", "Site", "Date", "White", "Black", "Result"};
    for (const char *t : kTags)
    {
      const std::string v = rec.tag(t);
      if (!v.empty())
        os << "[" << t << " \"" << v << "\"]\n";
    }
    if (!report.openingName.empty())
      os << "Opening: " << (analysis.openingEco.empty() ? "" : analysis.openingEco + " ") << report.openingName
         << "\n";
    os << "\n";

    const bool blackFirst = !analysis.entries.empty() && analysis.entries.front().side == core::Color::Black;
    const auto rows = reviewOnly ? movesNeedingReview(analysis.entries) : analysis.entries;
    for (const auto &e : rows)
    {
      os << std::left << std::setw(14) << moveLabel(e, blackFirst) << std::setw(11) << toString(e.quality)
         << std::right << std::setw(7) << fmtEval(e.evalAfter) << std::setw(5) << e.centipawnLoss << "  "
         << e.comment;
      if (e.bestMoveSan && e.quality != MoveQuality::Miss && e.comment.find(*e.bestMoveSan) == std::string::npos)
        os << " (best: " << *e.bestMoveSan << ")";
      os << "\n";
    }
    os << "\n";

    writeSide(os, "White", report.white);
    writeSide(os, "Black", report.black);
    os << "Result: " << rec.result << "\n";
  }

  void writeTsvHeader(std::ostream &os)
  {
    os << "game\tply\tside\tmove\tquality\tbook\teval_before\teval_after\tloss\tbest\tproblem\tcomment\n";
  }

  void writeTsvRows(std::ostream &os, int gameNo, const std::vector<AnalysisEntry> &entries)
  {
    for (const auto &e : entries)
    {
      os << gameNo << '\t' << e.ply << '\t' << (e.side == core::Color::White ? "w" : "b") << '\t' << e.san
         << '\t' << toString(e.quality) << '\t' << (e.isBook ? 1 : 0) << '\t' << fmtEval(e.evalBefore) << '\t'
         << fmtEval(e.evalAfter) << '\t' << e.centipawnLoss << '\t' << e.bestMoveSan.value_or("-") << '\t'
         << (e.problem ? toString(*e.problem) : "-") << '\t' << tsvSafe(e.comment) << '\n';
    }
  }
} // namespace glyph::review
