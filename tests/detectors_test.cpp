#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "glyph/model/rules.hpp"
#include "glyph/review/material.hpp"
#include "glyph/review/miss_detector.hpp"
#include "glyph/review/problem_diagnoser.hpp"
#include "glyph/review/sacrifice_detector.hpp"

using namespace glyph;
using namespace glyph::review;
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
  const bool ok = model::Position::fromFen(fen, pos);
  assert(ok);
  return pos;
}

// Resolves a SAN move so capture/castle flags match the generator's.
static model::Move san(const model::Position &pos, const std::string &text)
{
  model::Move mv;
  const bool ok = rules::fromSan(pos, text, mv);
  assert(ok);
  return mv;
}

static std::optional<ProblemDiagnosis> diagnoseSan(const model::Position &pos, const std::string &text)
{
  const auto mv = san(pos, text);
  const auto after = rules::applyMove(pos, mv);
  assert(after);
  return diagnose(pos, mv, *after);
}

int main()
{
  // Material helpers
  {
    const auto pos = load("4k3/8/4p3/3p4/8/8/8/3QK3 w - - 0 1");
    const auto mv = san(pos, "Qxd5");
    assert(movedValue(pos, mv) == 9);
    assert(capturedValue(pos, mv) == 1);
    assert(attackerValue(core::PieceType::King) == KING_ATTACKER_VALUE);
    assert(describePiece(pos, sq('d', 1)) == "queen on d1");

    const auto ep = load("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 2");
    assert(capturedValue(ep, san(ep, "exd6")) == 1);

    const auto promo = load("8/P7/8/8/8/8/k7/4K3 w - - 0 1");
    assert(movedValue(promo, san(promo, "a8=Q")) == 9);
  }

  // Knight steps next to an enemy knight: an even trade offer, not a sacrifice
  {
    const auto pos = load("4k3/8/8/8/3n4/8/8/4K1N1 w - - 0 1");
    assert(!isSacrifice(pos, san(pos, "Nf3")));
  }

  // Queen put en prise to a pawn
  {
    const auto pos = load("4k3/8/4p3/8/8/8/8/3QK3 w - - 0 1");
    assert(isSacrifice(pos, san(pos, "Qd5")));
    // a quiet move that nothing attacks
    assert(!isSacrifice(pos, san(pos, "Qd2")));
  }

  // Queen for queen
  {
    const auto pos = load("3qk3/8/8/8/8/8/8/3QK3 w - - 0 1");
    assert(!isSacrifice(pos, san(pos, "Qxd8+")));
  }

  // Rook takes a pawn that a pawn recaptures
  {
    const auto pos = load("4k3/8/8/2p5/3p4/8/8/3RK3 w - - 0 1");
    assert(isSacrifice(pos, san(pos, "Rxd4")));
  }

  // Back rank left open
  {
    const auto pos = load("4r1k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1");
    const auto d = diagnoseSan(pos, "Ra2");
    assert(d);
    assert(d->kind == ProblemKind::AllowsCheckmate);
    assert(d->culprit == "Re1#");
    assert(d->description == "This allows checkmate with Re1#.");
    assert(std::string(toString(d->kind)) == "allows_checkmate");

    // keeping the guard is fine
    assert(!diagnoseSan(pos, "h3"));
  }

  // Moved piece hangs
  {
    const auto pos = load("4k3/8/4p3/8/8/8/8/3QK3 w - - 0 1");
    const auto d = diagnoseSan(pos, "Qd5");
    assert(d && d->kind == ProblemKind::HangingPiece);
    assert(d->materialLost == 9);
    assert(!d->offsetByCapture);
    assert(d->square == sq('d', 5));
    assert(d->culprit == "exd5");
    assert(d->description == "The queen on d5 is left hanging (net loss 9).");
  }

  // Hangs after taking something small
  {
    const auto pos = load("4k3/8/4p3/3p4/8/8/8/3QK3 w - - 0 1");
    const auto d = diagnoseSan(pos, "Qxd5");
    assert(d && d->kind == ProblemKind::HangingPiece);
    assert(d->materialLost == 8);
    assert(d->offsetByCapture);
  }

  // Defended, but a pawn still wins the rook for itself
  {
    const auto pos = load("4k3/8/8/2p5/3p4/4P3/8/3RK3 w - - 0 1");
    const auto d = diagnoseSan(pos, "Rxd4");
    assert(d && d->kind == ProblemKind::BadTrade);
    assert(d->materialLost == 3);
    assert(d->offsetByCapture);
    assert(d->culprit == "cxd4");
    assert(d->description == "The rook on d4 can be taken by the pawn on c5; recapturing still loses 3.");
  }

  // Rook for knight and pawn is close enough
  {
    const auto pos = load("4k3/8/8/2p5/3n4/4P3/8/3RK3 w - - 0 1");
    assert(!diagnoseSan(pos, "Rxd4"));
  }

  // Defended queen trade
  {
    const auto pos = load("4k3/8/4p3/3q4/2P5/8/8/3QK3 w - - 0 1");
    const auto qxq = san(pos, "Qxd5");
    assert(!isSacrifice(pos, qxq));
    const auto d = diagnoseSan(pos, "Qxd5");
    if (d)
    {
      std::cerr << "Queen trade diagnosed as: " << d->description << std::endl;
      return 1;
    }
  }

  // Pawn push drops the knight's only defender
  {
    const auto pos = load("3rk3/8/8/8/3N4/2P5/8/4K3 w - - 0 1");
    const auto d = diagnoseSan(pos, "c4");
    assert(d && d->kind == ProblemKind::LeavesPieceHanging);
    assert(d->square == sq('d', 4));
    assert(d->materialLost == 3);
    assert(d->culprit == "Rxd4");
  }

  // Knight could have taken a loose rook
  {
    const auto pos = load("4k3/8/8/8/1r6/8/2N5/4K3 w - - 0 1");
    const auto d = diagnoseSan(pos, "Ne3");
    assert(d && d->kind == ProblemKind::MissedCapture);
    assert(d->materialLost == 5);
    assert(d->culprit == "Nxb4");
    assert(d->square == sq('b', 4));

    // taking it is clean
    assert(!diagnoseSan(pos, "Nxb4"));
  }

  // Ordinary opening move
  {
    assert(!diagnoseSan(model::Position::startpos(), "e4"));
  }

  // Misses
  {
    const auto pos = load("4k3/8/8/8/1r6/8/2N5/4K3 w - - 0 1");
    const auto best = san(pos, "Nxb4");
    const auto played = san(pos, "Ne3");

    // already ahead, gave back a moderate amount
    assert(isMiss(pos, best, played, 500, 400, core::Color::White));
    // too cheap or too expensive to be a miss
    assert(!isMiss(pos, best, played, 500, 470, core::Color::White));
    assert(!isMiss(pos, best, played, 500, 200, core::Color::White));
    // level position, but the engine's move won a rook
    assert(isMiss(pos, best, played, 0, -100, core::Color::White));
    // level position and the engine's move was quiet
    assert(!isMiss(pos, san(pos, "Kd1"), played, 0, -100, core::Color::White));
    assert(!isMiss(pos, std::nullopt, played, 0, -100, core::Color::White));
    // no evaluation
    assert(!isMiss(pos, best, played, std::nullopt, -100, core::Color::White));
  }

  // Hanging the moved piece is never a miss
  {
    const auto pos = load("4k3/8/4p3/8/8/8/8/3QK3 w - - 0 1");
    assert(!isMiss(pos, std::nullopt, san(pos, "Qd5"), 150, 50, core::Color::White));
    assert(isMiss(pos, std::nullopt, san(pos, "Qd3"), 150, 50, core::Color::White));
  }

  // Black to move: losses are measured from Black's side
  {
    const auto pos = load("4k3/8/8/8/8/8/8/4K3 b - - 0 1");
    const auto played = san(pos, "Kd7");
    assert(isMiss(pos, std::nullopt, played, -300, -200, core::Color::Black));
    assert(!isMiss(pos, std::nullopt, played, -300, -400, core::Color::Black));
  }

  return 0;
}
