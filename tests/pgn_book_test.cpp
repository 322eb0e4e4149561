#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "glyph/constants.hpp"
#include "glyph/model/analysis/opening_book.hpp"
#include "glyph/model/analysis/pgn_reader.hpp"
#include "glyph/model/rules.hpp"

using namespace glyph;
namespace rules = glyph::model::rules;
using model::analysis::GameRecord;
using model::analysis::OpeningBook;

static std::string fingerprintAfter(const std::vector<std::string> &line)
{
  auto pos = model::Position::startpos();
  for (const auto &san : line)
  {
    model::Move mv;
    const bool ok = rules::fromSan(pos, san, mv);
    assert(ok);
    pos = *rules::applyMove(pos, mv);
  }
  return rules::fingerprint(pos);
}

int main()
{
  // Tags, comments, variations and NAGs
  {
    const std::string pgn = "[Event \"Club match\"]\n"
                            "[White \"Alice\"]\n"
                            "[Black \"Bob\"]\n"
                            "[Result \"1-0\"]\n"
                            "\n"
                            "1. e4 {best by test} e5 2. Nf3 (2. f4 exf4 3. Nf3) Nc6\n"
                            "3. Bb5 $1 a6 1-0\n";
    GameRecord rec;
    std::string err;
    assert(model::analysis::parsePgnToRecord(pgn, rec, &err));
    assert(rec.plies.size() == 6);
    assert(rec.result == "1-0");
    assert(rec.tag("White") == "Alice");
    assert(rec.tag("Round").empty());
    assert(rec.startFen == core::START_FEN);
    assert(rec.plies[2].san == "Nf3");
    assert(rec.plies[4].san == "Bb5");
    assert(rules::toUci(rec.plies[5].move) == "a7a6");
  }

  // Result taken from the tag when the movetext has none; "..." continuation numbers
  {
    const std::string pgn = "[Result \"1/2-1/2\"]\n\n1.d4 d5 2.c4 2...e6\n";
    GameRecord rec;
    assert(model::analysis::parsePgnToRecord(pgn, rec));
    assert(rec.plies.size() == 4);
    assert(rec.plies[3].san == "e6");
    assert(rec.result == "1/2-1/2");
  }

  // FEN tag sets the start position
  {
    const std::string fen = "4k3/8/8/8/8/8/8/4K2R w K - 0 1";
    const std::string pgn = "[SetUp \"1\"]\n[FEN \"" + fen + "\"]\n\n1. O-O+ *\n";
    GameRecord rec;
    assert(model::analysis::parsePgnToRecord(pgn, rec));
    assert(rec.startFen == fen);
    assert(rec.plies.size() == 1);
    assert(rec.plies[0].move.castle() == model::CastleSide::KingSide);
    assert(rec.result == "*");
  }

  // Unreadable tokens are reported
  {
    GameRecord rec;
    std::string err;
    assert(!model::analysis::parsePgnToRecord("1. e4 e5 2. Ke3 *", rec, &err));
    assert(err.find("Ke3") != std::string::npos);

    assert(!model::analysis::parsePgnToRecord("[FEN \"garbage\"]\n\n1. e4 *", rec, &err));
    assert(err.find("FEN") != std::string::npos);
  }

  // Multi-game files
  {
    const std::string text = "[Event \"A\"]\n\n1. e4 e5 1-0\n\n"
                             "[Event \"B\"]\n[Site \"?\"]\n\n1. d4 d5 0-1\n";
    const auto games = model::analysis::splitPgnGames(text);
    assert(games.size() == 2);
    GameRecord second;
    assert(model::analysis::parsePgnToRecord(games[1], second));
    assert(second.tag("Event") == "B");
    assert(second.result == "0-1");
  }

  // Built-in book
  {
    const OpeningBook &book = OpeningBook::builtin();
    assert(book.size() > 0);
    assert(book.contains(fingerprintAfter({"e4"})));
    assert(!book.contains(rules::fingerprint(model::Position::startpos())));
    assert(!book.contains(fingerprintAfter({"a4", "h5"})));

    const auto *sicilian = book.openingAt(fingerprintAfter({"e4", "c5"}));
    assert(sicilian);
    assert(sicilian->name == "Sicilian Defense");
    assert(sicilian->eco == "B20");

    // a prefix that is not the end of any line has no name
    assert(book.contains(fingerprintAfter({"e4", "c5", "Nf3", "d6", "d4"})));
    assert(!book.openingAt(fingerprintAfter({"e4", "c5", "Nf3", "d6", "d4"})));

    // transpositions land on the same entry
    assert(fingerprintAfter({"Nf3", "d5", "d4"}) == fingerprintAfter({"d4", "d5", "Nf3"}));
    assert(book.contains(fingerprintAfter({"Nf3", "d5", "d4"})));
  }

  // Extra lines and TSV files
  {
    OpeningBook book;
    std::string err;
    assert(!book.addLine("A00", "Broken", "e4 e4", &err));
    assert(!err.empty());
    assert(book.addLine("A00", "Polish Opening", "b4"));
    assert(book.openingAt(fingerprintAfter({"b4"}))->name == "Polish Opening");

    assert(!book.loadFromTsvFile("/nonexistent/glyph/book.tsv", &err));

    const auto path = std::filesystem::temp_directory_path() / "glyph_pgn_book_test.tsv";
    {
      std::ofstream out(path);
      out << "B28\tSicilian Defense: O'Kelly Variation\te4 c5 Nf3 a6\n";
      out << "this line is not valid\n";
      out << "C99\tNonsense\te4 Ke7 Ke2\n";
    }
    assert(book.loadFromTsvFile(path.string(), &err));
    const auto *okelly = book.openingAt(fingerprintAfter({"e4", "c5", "Nf3", "a6"}));
    assert(okelly && okelly->eco == "B28");
    assert(book.contains(fingerprintAfter({"e4", "c5"})));
    std::filesystem::remove(path);
  }

  return 0;
}
