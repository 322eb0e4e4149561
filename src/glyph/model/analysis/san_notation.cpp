#include "glyph/model/analysis/san_notation.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "glyph/model/rules.hpp"

namespace glyph::model::notation
{
  namespace
  {
    inline char pieceLetter(core::PieceType pt)
    {
      switch (pt)
      {
      case core::PieceType::Knight:
        return 'N';
      case core::PieceType::Bishop:
        return 'B';
      case core::PieceType::Rook:
        return 'R';
      case core::PieceType::Queen:
        return 'Q';
      case core::PieceType::King:
        return 'K';
      default:
        return '\0'; // pawn/none
      }
    }

    inline std::string trim(std::string_view v)
    {
      std::size_t a = 0, b = v.size();
      while (a < b && std::isspace((unsigned char)v[a]))
        ++a;
      while (b > a && std::isspace((unsigned char)v[b - 1]))
        --b;
      return std::string(v.substr(a, b - a));
    }

    inline std::string normalizeSan(std::string_view in)
    {
      std::string s = trim(in);
      if (s == "0-0")
        s = "O-O";
      if (s == "0-0-0")
        s = "O-O-O";

      // strip trailing annotations and check symbols
      while (!s.empty())
      {
        char c = s.back();
        if (c == '+' || c == '#' || c == '!' || c == '?')
          s.pop_back();
        else
          break;
      }
      // "e8Q" is a common spelling of "e8=Q"
      if (s.size() >= 3 && std::isdigit((unsigned char)s[s.size() - 2]))
      {
        const char last = s.back();
        if (last == 'Q' || last == 'R' || last == 'B' || last == 'N')
          s.insert(s.size() - 1, 1, '=');
      }
      return s;
    }

    inline std::string checkSuffix(const model::Position &pos, const model::Move &mv)
    {
      const auto after = rules::applyMove(pos, mv);
      if (!after || !after->inCheck())
        return {};
      return rules::legalMoves(*after).empty() ? "#" : "+";
    }
  } // namespace

  std::string toSan(const model::Position &pos, const model::Move &mv)
  {
    const auto legals = rules::legalMoves(pos);

    const model::Move *match = nullptr;
    for (const auto &m : legals)
      if (m == mv)
      {
        match = &m;
        break;
      }
    if (!match)
      return "";
    const model::Move m = *match;

    if (m.castle() != model::CastleSide::None)
    {
      std::string san = (m.castle() == model::CastleSide::KingSide) ? "O-O" : "O-O-O";
      return san + checkSuffix(pos, m);
    }

    const auto mover = *pos.getBoard().getPiece(m.from());
    const core::PieceType pt = mover.type;
    const bool isPawn = (pt == core::PieceType::Pawn);

    std::string san;

    if (!isPawn)
    {
      san.push_back(pieceLetter(pt));

      // Disambiguation against same-type pieces that can reach the same square
      const int fromFile = bb::file_of(m.from());
      const int fromRank = bb::rank_of(m.from());
      bool competitors = false, anySameFile = false, anySameRank = false;
      for (const auto &o : legals)
      {
        if (o.to() != m.to() || o.from() == m.from())
          continue;
        const auto pc = pos.getBoard().getPiece(o.from());
        if (!pc || pc->type != pt)
          continue;
        competitors = true;
        if (bb::file_of(o.from()) == fromFile)
          anySameFile = true;
        if (bb::rank_of(o.from()) == fromRank)
          anySameRank = true;
      }

      if (competitors)
      {
        if (!anySameFile)
          san.push_back(char('a' + fromFile));
        else if (!anySameRank)
          san.push_back(char('1' + fromRank));
        else
        {
          san.push_back(char('a' + fromFile));
          san.push_back(char('1' + fromRank));
        }
      }
    }

    if (m.isCapture())
    {
      if (isPawn)
        san.push_back(char('a' + bb::file_of(m.from())));
      san.push_back('x');
    }

    san += rules::squareName(m.to());

    if (m.promotion() != core::PieceType::None)
    {
      san.push_back('=');
      san.push_back(pieceLetter(m.promotion()));
    }

    return san + checkSuffix(pos, m);
  }

  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out)
  {
    std::string tok = normalizeSan(sanToken);
    if (tok.empty())
      return false;

    if (tok == "1-0" || tok == "0-1" || tok == "1/2-1/2" || tok == "*")
      return false;

    // Coordinate fallback ("e2e4", "e7e8q")
    if (rules::fromUci(pos, tok, out))
      return true;

    for (const auto &m : rules::legalMoves(pos))
    {
      if (normalizeSan(toSan(pos, m)) == tok)
      {
        out = m;
        return true;
      }
    }
    return false;
  }

} // namespace glyph::model::notation
