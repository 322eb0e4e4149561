#include "glyph/review/position_enumerator.hpp"

#include "glyph/model/rules.hpp"
#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  namespace
  {
    void push(Game &g, const model::Move &mv, std::size_t ply, const std::string &token)
    {
      // keep the generator's copy so capture/castle flags are always set
      for (const auto &legal : model::rules::legalMoves(g.positions.back()))
      {
        if (legal != mv)
          continue;
        model::Position next = g.positions.back();
        if (next.doMove(legal))
        {
          g.moves.push_back(legal);
          g.positions.push_back(std::move(next));
          return;
        }
      }
      throw ParseError("ply " + std::to_string(ply) + ": illegal move '" + token + "'");
    }
  } // namespace

  Game enumeratePositions(const model::Position &start, const std::vector<std::string> &tokens)
  {
    Game g;
    g.positions.reserve(tokens.size() + 1);
    g.positions.push_back(start);

    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
      model::Move mv;
      if (!model::rules::fromSan(g.positions.back(), tokens[i], mv))
        throw ParseError("ply " + std::to_string(i + 1) + ": could not parse move '" + tokens[i] + "'");
      push(g, mv, i + 1, tokens[i]);
    }
    return g;
  }

  Game enumeratePositions(const model::Position &start, const std::vector<model::Move> &moves)
  {
    Game g;
    g.positions.reserve(moves.size() + 1);
    g.positions.push_back(start);

    for (std::size_t i = 0; i < moves.size(); ++i)
      push(g, moves[i], i + 1, model::rules::toUci(moves[i]));
    return g;
  }
} // namespace glyph::review
