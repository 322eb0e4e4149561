#include <cassert>
#include <iostream>
#include <string>

#include "glyph/constants.hpp"
#include "glyph/model/core/bitboard.hpp"
#include "glyph/model/rules.hpp"

using namespace glyph;
namespace rules = glyph::model::rules;

static core::Square sq(char file, int rank)
{
  int f = file - 'a';
  int r = rank - 1;
  return static_cast<core::Square>(r * 8 + f);
}

static model::Position load(const std::string &fen)
{
  model::Position pos;
  std::string err;
  const bool ok = model::Position::fromFen(fen, pos, &err);
  assert(ok && err.empty());
  return pos;
}

static model::Position play(model::Position pos, const std::string &san)
{
  model::Move mv;
  const bool ok = rules::fromSan(pos, san, mv);
  assert(ok);
  auto next = rules::applyMove(pos, mv);
  assert(next);
  return *next;
}

int main()
{
  // Start position
  {
    const auto pos = model::Position::startpos();
    const auto moves = rules::legalMoves(pos);
    if (moves.size() != 20)
    {
      std::cerr << "Expected 20 moves from the start position, got " << moves.size() << std::endl;
      return 1;
    }
    assert(!rules::isCheck(pos));
    assert(rules::gameResult(pos) == core::ONGOING);
    assert(pos.toFen() == core::START_FEN);
  }

  // Knights out and back: same fingerprint, different clocks
  {
    const auto start = model::Position::startpos();
    auto pos = start;
    for (const char *san : {"Nf3", "Nc6", "Ng1", "Nb8"})
      pos = play(pos, san);
    assert(rules::fingerprint(pos) == rules::fingerprint(start));
    assert(pos.toFen() != start.toFen());
  }

  // En passant square only counts when a capture is possible
  {
    const auto pos = play(model::Position::startpos(), "e4");
    assert(pos.toFen().find(" e3 ") != std::string::npos);
    assert(rules::fingerprint(pos) == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq -");

    const auto ep = load("rnbqkbnr/ppp1pppp/8/8/3pP3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 3");
    assert(ep.epCapturable());
    assert(rules::fingerprint(ep).substr(rules::fingerprint(ep).size() - 3) == " e3");
    model::Move mv;
    assert(rules::fromSan(ep, "dxe3", mv));
    assert(mv.isEnPassant());
  }

  // Checkmate and stalemate
  {
    const auto mate = load("rnb1kbnr/pppp1ppp/8/4p3/6Pq/5P2/PPPPP2P/RNBQKBNR w KQkq - 1 3");
    assert(rules::isCheck(mate));
    assert(rules::isCheckmate(mate));
    assert(!rules::isStalemate(mate));
    assert(rules::gameResult(mate) == core::CHECKMATE);

    const auto stale = load("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    assert(!rules::isCheck(stale));
    assert(rules::isStalemate(stale));
    assert(rules::gameResult(stale) == core::STALEMATE);
    assert(rules::legalMoves(stale).empty());
  }

  // Rejected FENs
  {
    model::Position pos;
    std::string err;
    assert(!model::Position::fromFen("8/8/8/8/8/8/8/8 w - - 0 1", pos, &err));
    assert(!err.empty());
    // the side not to move is in check
    assert(!model::Position::fromFen("4k3/8/8/8/8/8/4R3/4K3 w - - 0 1", pos, &err));
    assert(!model::Position::fromFen("not a fen", pos, &err));
  }

  // SAN rendering
  {
    const auto start = model::Position::startpos();
    assert(rules::toSan(start, model::Move(sq('e', 2), sq('e', 4))) == "e4");
    assert(rules::toSan(start, model::Move(sq('g', 1), sq('f', 3))) == "Nf3");
    // not legal
    assert(rules::toSan(start, model::Move(sq('e', 2), sq('e', 5))).empty());

    const auto castle = load("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    assert(rules::toSan(castle, model::Move(sq('e', 1), sq('g', 1))) == "O-O");
    assert(rules::toSan(castle, model::Move(sq('e', 1), sq('c', 1))) == "O-O-O");

    const auto files = load("4k3/8/8/8/8/8/4K3/R6R w - - 0 1");
    assert(rules::toSan(files, model::Move(sq('a', 1), sq('d', 1))) == "Rad1");
    assert(rules::toSan(files, model::Move(sq('h', 1), sq('d', 1))) == "Rhd1");

    const auto ranks = load("4k3/8/8/R7/8/8/4K3/R7 w - - 0 1");
    assert(rules::toSan(ranks, model::Move(sq('a', 1), sq('a', 3))) == "R1a3");

    const auto promo = load("8/P7/8/8/8/8/k7/4K3 w - - 0 1");
    assert(rules::toSan(promo, model::Move(sq('a', 7), sq('a', 8), core::PieceType::Queen)) == "a8=Q+");
    assert(rules::toSan(promo, model::Move(sq('a', 7), sq('a', 8), core::PieceType::Knight)) == "a8=N");
  }

  // SAN and coordinate parsing
  {
    const auto start = model::Position::startpos();
    model::Move mv;
    assert(rules::fromSan(start, "e2e4", mv));
    assert(mv == model::Move(sq('e', 2), sq('e', 4)));
    assert(rules::fromSan(start, "Nf3!?", mv));
    assert(mv == model::Move(sq('g', 1), sq('f', 3)));
    assert(!rules::fromSan(start, "Zz9", mv));
    assert(!rules::fromSan(start, "e5", mv));

    const auto castle = load("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    assert(rules::fromSan(castle, "0-0", mv));
    assert(mv.castle() == model::CastleSide::KingSide);
    assert(rules::fromSan(castle, "O-O-O", mv));
    assert(mv.castle() == model::CastleSide::QueenSide);

    const auto promo = load("8/P7/8/8/8/8/k7/4K3 w - - 0 1");
    assert(rules::fromSan(promo, "a8Q", mv));
    assert(mv.promotion() == core::PieceType::Queen);
    assert(rules::fromSan(promo, "a8=R", mv));
    assert(mv.promotion() == core::PieceType::Rook);

    assert(rules::fromUci(promo, "a7a8n", mv));
    assert(rules::toUci(mv) == "a7a8n");
    assert(!rules::fromUci(promo, "a7a6", mv));
  }

  // Attack queries
  {
    const auto start = model::Position::startpos();
    assert(model::bb::popcount(rules::attackers(start, sq('f', 3), core::Color::White)) == 3);
    assert(rules::attackers(start, sq('f', 3), core::Color::Black) == 0);

    const auto p = rules::pieceAt(start, sq('d', 8));
    assert(p && p->type == core::PieceType::Queen && p->color == core::Color::Black);
    assert(!rules::pieceAt(start, sq('d', 4)));

    assert(rules::squareName(sq('a', 1)) == "a1");
    assert(rules::squareName(sq('h', 8)) == "h8");
    assert(rules::squareName(core::NO_SQUARE) == "-");
    assert(rules::pieceName(core::PieceType::Knight) == "knight");
  }

  return 0;
}
