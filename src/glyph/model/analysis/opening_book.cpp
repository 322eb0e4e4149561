#include "glyph/model/analysis/opening_book.hpp"

#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

#include "glyph/log.hpp"
#include "glyph/model/position.hpp"
#include "glyph/model/rules.hpp"

namespace glyph::model::analysis
{
  namespace
  {
    struct BuiltinLine
    {
      const char *eco;
      const char *name;
      const char *moves;
    };

    // Main lines only. Load a TSV for wider coverage.
    const BuiltinLine kBuiltin[] = {
        {"A04", "Reti Opening", "Nf3"},
        {"A10", "English Opening", "c4"},
        {"A20", "English Opening: King's English", "c4 e5"},
        {"A40", "Queen's Pawn", "d4"},
        {"A45", "Indian Defense", "d4 Nf6"},
        {"A80", "Dutch Defense", "d4 f5"},
        {"B00", "King's Pawn Opening", "e4"},
        {"B01", "Scandinavian Defense", "e4 d5"},
        {"B07", "Pirc Defense", "e4 d6 d4 Nf6 Nc3 g6"},
        {"B10", "Caro-Kann Defense", "e4 c6"},
        {"B12", "Caro-Kann Defense: Advance Variation", "e4 c6 d4 d5 e5"},
        {"B20", "Sicilian Defense", "e4 c5"},
        {"B22", "Sicilian Defense: Alapin Variation", "e4 c5 c3"},
        {"B23", "Sicilian Defense: Closed", "e4 c5 Nc3"},
        {"B30", "Sicilian Defense: Rossolimo Variation", "e4 c5 Nf3 Nc6 Bb5"},
        {"B40", "Sicilian Defense: French Variation", "e4 c5 Nf3 e6"},
        {"B50", "Sicilian Defense", "e4 c5 Nf3 d6"},
        {"B70", "Sicilian Defense: Dragon Variation", "e4 c5 Nf3 d6 d4 cxd4 Nxd4 Nf6 Nc3 g6"},
        {"B90", "Sicilian Defense: Najdorf Variation", "e4 c5 Nf3 d6 d4 cxd4 Nxd4 Nf6 Nc3 a6"},
        {"C00", "French Defense", "e4 e6"},
        {"C10", "French Defense: Paulsen Variation", "e4 e6 d4 d5 Nc3"},
        {"C20", "King's Pawn Game", "e4 e5"},
        {"C30", "King's Gambit", "e4 e5 f4"},
        {"C40", "King's Knight Opening", "e4 e5 Nf3"},
        {"C42", "Petrov's Defense", "e4 e5 Nf3 Nf6"},
        {"C44", "King's Pawn Game: Tayler Opening", "e4 e5 Nf3 Nc6"},
        {"C45", "Scotch Game", "e4 e5 Nf3 Nc6 d4"},
        {"C50", "Italian Game", "e4 e5 Nf3 Nc6 Bc4"},
        {"C53", "Italian Game: Giuoco Piano", "e4 e5 Nf3 Nc6 Bc4 Bc5 c3"},
        {"C55", "Italian Game: Two Knights Defense", "e4 e5 Nf3 Nc6 Bc4 Nf6"},
        {"C60", "Ruy Lopez", "e4 e5 Nf3 Nc6 Bb5"},
        {"C65", "Ruy Lopez: Berlin Defense", "e4 e5 Nf3 Nc6 Bb5 Nf6"},
        {"C68", "Ruy Lopez: Exchange Variation", "e4 e5 Nf3 Nc6 Bb5 a6 Bxc6"},
        {"C78", "Ruy Lopez: Morphy Defense", "e4 e5 Nf3 Nc6 Bb5 a6 Ba4 Nf6 O-O"},
        {"D00", "Queen's Pawn Game", "d4 d5"},
        {"D02", "London System", "d4 d5 Nf3 Nf6 Bf4"},
        {"D06", "Queen's Gambit", "d4 d5 c4"},
        {"D10", "Slav Defense", "d4 d5 c4 c6"},
        {"D20", "Queen's Gambit Accepted", "d4 d5 c4 dxc4"},
        {"D30", "Queen's Gambit Declined", "d4 d5 c4 e6"},
        {"D37", "Queen's Gambit Declined: Three Knights", "d4 d5 c4 e6 Nc3 Nf6 Nf3 Be7"},
        {"D80", "Grunfeld Defense", "d4 Nf6 c4 g6 Nc3 d5"},
        {"E00", "Catalan Opening", "d4 Nf6 c4 e6 g3"},
        {"E12", "Queen's Indian Defense", "d4 Nf6 c4 e6 Nf3 b6"},
        {"E20", "Nimzo-Indian Defense", "d4 Nf6 c4 e6 Nc3 Bb4"},
        {"E60", "King's Indian Defense", "d4 Nf6 c4 g6"},
        {"E61", "King's Indian Defense", "d4 Nf6 c4 g6 Nc3 Bg7"},
    };

    inline std::string trimCopy(std::string s)
    {
      auto isSpace = [](unsigned char c)
      { return std::isspace(c) != 0; };
      while (!s.empty() && isSpace((unsigned char)s.front()))
        s.erase(s.begin());
      while (!s.empty() && isSpace((unsigned char)s.back()))
        s.pop_back();
      return s;
    }
  } // namespace

  const OpeningBook &OpeningBook::builtin()
  {
    static std::once_flag once;
    static OpeningBook book;
    std::call_once(once, []()
                   {
      for (const auto &l : kBuiltin)
      {
        std::string err;
        if (!book.addLine(l.eco, l.name, l.moves, &err))
          log::warn("OpeningBook", std::string("bad built-in line ") + l.eco + ": " + err);
      } });
    return book;
  }

  bool OpeningBook::addLine(std::string_view eco, std::string_view name, std::string_view sanLine,
                            std::string *err)
  {
    Position pos = Position::startpos();
    std::vector<std::string> keys;
    keys.push_back(pos.fingerprint());

    std::istringstream in{std::string(sanLine)};
    std::string tok;
    while (in >> tok)
    {
      Move mv;
      if (!rules::fromSan(pos, tok, mv) || !pos.doMove(mv))
      {
        if (err)
          *err = "Could not parse SAN token: " + tok;
        return false;
      }
      keys.push_back(pos.fingerprint());
    }
    if (keys.size() < 2)
    {
      if (err)
        *err = "empty line";
      return false;
    }

    // The start position itself is not a book move.
    for (std::size_t i = 1; i + 1 < keys.size(); ++i)
      m_positions.emplace(keys[i], -1);

    m_openings.push_back(Opening{std::string(eco), std::string(name)});
    m_positions[keys.back()] = static_cast<int>(m_openings.size() - 1);
    return true;
  }

  bool OpeningBook::loadFromTsvFile(const std::string &path, std::string *err)
  {
    std::ifstream in(path);
    if (!in)
    {
      if (err)
        *err = "cannot open " + path;
      return false;
    }

    std::string line;
    std::size_t added = 0, lineNo = 0;
    while (std::getline(in, line))
    {
      ++lineNo;
      line = trimCopy(std::move(line));
      if (line.empty() || line[0] == '#')
        continue;

      const auto t1 = line.find('\t');
      const auto t2 = t1 == std::string::npos ? std::string::npos : line.find('\t', t1 + 1);
      if (t2 == std::string::npos)
      {
        log::warn("OpeningBook", path + ":" + std::to_string(lineNo) + ": expected 3 tab-separated fields");
        continue;
      }

      std::string lineErr;
      if (!addLine(trimCopy(line.substr(0, t1)), trimCopy(line.substr(t1 + 1, t2 - t1 - 1)),
                   line.substr(t2 + 1), &lineErr))
      {
        log::warn("OpeningBook", path + ":" + std::to_string(lineNo) + ": " + lineErr);
        continue;
      }
      ++added;
    }

    if (added == 0 && err)
      *err = "no usable lines in " + path;
    return added > 0;
  }

  bool OpeningBook::contains(const std::string &fingerprint) const
  {
    return m_positions.count(fingerprint) != 0;
  }

  const OpeningBook::Opening *OpeningBook::openingAt(const std::string &fingerprint) const
  {
    auto it = m_positions.find(fingerprint);
    if (it == m_positions.end() || it->second < 0)
      return nullptr;
    return &m_openings[static_cast<std::size_t>(it->second)];
  }

} // namespace glyph::model::analysis
