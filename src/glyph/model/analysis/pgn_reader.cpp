#include "glyph/model/analysis/pgn_reader.hpp"

#include <cctype>
#include <string>
#include <vector>

#include "glyph/constants.hpp"
#include "glyph/model/position.hpp"
#include "glyph/model/rules.hpp"

namespace glyph::model::analysis
{
  namespace
  {
    // Drops {...} and ';' comments and (...) variations, nested to any depth.
    void stripCommentsAndVariations(std::string &s)
    {
      std::string out;
      out.reserve(s.size());

      int brace = 0;
      int paren = 0;
      bool lineComment = false;

      for (char c : s)
      {
        if (lineComment)
        {
          if (c == '\n' || c == '\r')
            lineComment = false;
          else
            continue;
        }
        if (brace > 0)
        {
          if (c == '}')
            --brace;
          continue;
        }
        if (c == '{')
        {
          brace = 1;
          continue;
        }
        if (c == ';' && paren == 0)
        {
          lineComment = true;
          continue;
        }
        if (c == '(')
        {
          ++paren;
          continue;
        }
        if (paren > 0)
        {
          if (c == ')')
            --paren;
          continue;
        }
        out.push_back(c);
      }

      s.swap(out);
    }

    // "1.e4" -> "1." "e4", "10...O-O" -> "10..." "O-O"
    void pushToken(std::vector<std::string> &toks, std::string tok)
    {
      if (tok.empty())
        return;

      std::size_t i = 0;
      while (i < tok.size() && std::isdigit((unsigned char)tok[i]))
        ++i;
      std::size_t j = i;
      while (j < tok.size() && tok[j] == '.')
        ++j;

      if (i > 0 && j > i && j < tok.size())
      {
        toks.push_back(tok.substr(0, j));
        toks.push_back(tok.substr(j));
        return;
      }
      toks.push_back(std::move(tok));
    }

    std::vector<std::string> tokenizeMovetext(const std::string &s)
    {
      std::vector<std::string> toks;
      std::string cur;

      auto flush = [&]
      {
        pushToken(toks, cur);
        cur.clear();
      };

      for (std::size_t i = 0; i < s.size(); ++i)
      {
        const unsigned char c = (unsigned char)s[i];
        if (std::isspace(c))
        {
          flush();
          continue;
        }
        if (c == '$') // NAG
        {
          flush();
          while (i + 1 < s.size() && std::isdigit((unsigned char)s[i + 1]))
            ++i;
          continue;
        }
        cur.push_back((char)c);
      }
      flush();
      return toks;
    }

    bool isMoveNumberToken(const std::string &t)
    {
      std::size_t i = 0;
      while (i < t.size() && std::isdigit((unsigned char)t[i]))
        ++i;
      if (i == 0)
        return false;
      std::size_t j = i;
      while (j < t.size() && t[j] == '.')
        ++j;
      return j > i && j == t.size();
    }

    bool isResultToken(const std::string &t)
    {
      return t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*";
    }

    std::size_t skipBlank(std::string_view s, std::size_t i)
    {
      while (i < s.size() && std::isspace((unsigned char)s[i]))
        ++i;
      return i;
    }

    // Reads the [Key "Value"] section; returns the offset of the movetext.
    std::size_t parseTags(std::string_view pgn, GameRecord &out)
    {
      std::size_t i = skipBlank(pgn, 0);
      while (i < pgn.size() && pgn[i] == '[')
      {
        const std::size_t end = pgn.find(']', i);
        if (end == std::string_view::npos)
          break;

        const std::string_view line = pgn.substr(i + 1, end - i - 1);
        const std::size_t sp = line.find(' ');
        if (sp != std::string_view::npos)
        {
          const std::string_view rest = line.substr(sp + 1);
          const std::size_t q1 = rest.find('"');
          const std::size_t q2 = rest.rfind('"');
          if (q1 != std::string_view::npos && q2 > q1)
            out.tags[std::string(line.substr(0, sp))] = std::string(rest.substr(q1 + 1, q2 - q1 - 1));
        }
        i = skipBlank(pgn, end + 1);
      }
      return i;
    }
  } // namespace

  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err)
  {
    out = GameRecord{};
    const std::size_t bodyAt = parseTags(pgn, out);

    out.startFen = out.tag("FEN");
    if (out.startFen.empty())
      out.startFen = core::START_FEN;

    Position pos;
    std::string fenErr;
    if (!Position::fromFen(out.startFen, pos, &fenErr))
    {
      if (err)
        *err = "Bad FEN tag: " + fenErr;
      return false;
    }

    std::string movetext(pgn.substr(bodyAt));
    stripCommentsAndVariations(movetext);

    for (const std::string &t : tokenizeMovetext(movetext))
    {
      if (isMoveNumberToken(t))
        continue;
      if (isResultToken(t))
      {
        out.result = t;
        break;
      }

      model::Move mv;
      if (!rules::fromSan(pos, t, mv))
      {
        if (err)
          *err = "Could not parse SAN token: " + t;
        return false;
      }

      PlyRecord pr{mv, rules::toSan(pos, mv)};
      if (!pos.doMove(mv))
      {
        if (err)
          *err = "Illegal move in PGN: " + t;
        return false;
      }
      out.plies.push_back(std::move(pr));
    }

    // movetext without a termination marker
    if (out.result == "*" && !out.tag("Result").empty())
      out.result = out.tag("Result");
    return true;
  }

  std::vector<std::string> splitPgnGames(std::string_view text)
  {
    std::vector<std::string> games;
    std::string cur;
    bool sawMovetext = false;

    std::size_t i = 0;
    while (i < text.size())
    {
      std::size_t nl = text.find('\n', i);
      if (nl == std::string_view::npos)
        nl = text.size();
      const std::string_view line = text.substr(i, nl - i);
      i = nl + 1;

      const std::size_t first = skipBlank(line, 0);
      const bool blank = first == line.size();
      const bool isTag = !blank && line[first] == '[';

      if (isTag && sawMovetext)
      {
        games.push_back(std::move(cur));
        cur.clear();
        sawMovetext = false;
      }
      if (!blank && !isTag)
        sawMovetext = true;

      cur.append(line);
      cur.push_back('\n');
    }

    if (skipBlank(cur, 0) < cur.size())
      games.push_back(std::move(cur));
    return games;
  }
}
