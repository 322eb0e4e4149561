#include <cassert>
#include <string>

#include "glyph/model/rules.hpp"
#include "glyph/review/move_classifier.hpp"
#include "glyph/review/sacrifice_detector.hpp"

using namespace glyph;
using namespace glyph::review;

static MoveFacts scored(int before, int after, int loss, core::Color side = core::Color::White)
{
  MoveFacts f;
  f.side = side;
  f.evalBefore = before;
  f.evalAfter = after;
  f.loss = loss;
  return f;
}

int main()
{
  // Loss bands
  {
    assert(qualityForLoss(0) == MoveQuality::Best);
    assert(qualityForLoss(5) == MoveQuality::Excellent);
    assert(qualityForLoss(10) == MoveQuality::Excellent);
    assert(qualityForLoss(25) == MoveQuality::Good);
    assert(qualityForLoss(60) == MoveQuality::Inaccuracy);
    assert(qualityForLoss(150) == MoveQuality::Mistake);
    assert(qualityForLoss(400) == MoveQuality::Blunder);

    assert(clampLoss(-40) == 0);
    assert(clampLoss(5000) == 800);
    assert(moverLoss(core::Color::White, 50, 20) == 30);
    assert(moverLoss(core::Color::Black, 50, 20) == -30);
    assert(moverLoss(core::Color::Black, -100, 40) == 140);
  }

  // Table classification and comments
  {
    auto v = classify(scored(30, 30, 0));
    assert(v.quality == MoveQuality::Best && v.loss == 0);
    assert(v.comment == "The best move.");

    v = classify(scored(30, 60, -30));
    assert(v.quality == MoveQuality::Best && v.loss == 0);

    v = classify(scored(30, 5, 25));
    assert(v.quality == MoveQuality::Good);

    auto f = scored(30, -1000, 1030);
    v = classify(f);
    assert(v.quality == MoveQuality::Blunder);
    assert(v.loss == 800);
    assert(v.comment == "A serious error that changes the evaluation.");

    f.bestMoveSan = "Nf3";
    assert(classify(f).comment == "Better was Nf3.");

    f.diagnosis = ProblemDiagnosis{ProblemKind::HangingPiece, "The queen on d5 is left hanging (net loss 9).",
                                   9, false, core::NO_SQUARE, "exd5"};
    assert(classify(f).comment == "The queen on d5 is left hanging (net loss 9).");
  }

  // Overrides in order
  {
    auto f = scored(9000, -9000, 18000);
    f.deliversMate = true;
    f.isBook = true;
    auto v = classify(f);
    assert(v.quality == MoveQuality::Best);
    assert(v.loss == 0);
    assert(v.comment == "Checkmate! A perfect finishing move.");

    f.deliversMate = false;
    f.isForced = true;
    assert(classify(f).quality == MoveQuality::Book);

    f.isBook = false;
    v = classify(f);
    assert(v.quality == MoveQuality::Forced && v.loss == 0);

    f.isForced = false;
    f.isMiss = true;
    f.loss = 120;
    f.bestMoveSan = "Nxb4";
    v = classify(f);
    assert(v.quality == MoveQuality::Miss);
    assert(v.loss == 120);
    assert(v.comment == "Missed opportunity: Nxb4 was much stronger.");
  }

  // Missing evaluations
  {
    MoveFacts f;
    f.evalBefore = 20;
    auto v = classify(f);
    assert(v.quality == MoveQuality::Unknown);
    assert(v.loss == 0);

    // mate and book still speak for themselves
    f.deliversMate = true;
    assert(classify(f).quality == MoveQuality::Best);
    f.deliversMate = false;
    f.isBook = true;
    assert(classify(f).quality == MoveQuality::Book);
  }

  // Stalemate
  {
    auto f = scored(50, 0, 400);
    f.deliversStalemate = true;
    auto v = classify(f);
    assert(v.quality == MoveQuality::Best && v.loss == 0);
    assert(v.comment == "Stalemate in a balanced position.");

    f = scored(900, 0, 900);
    f.deliversStalemate = true;
    v = classify(f);
    assert(v.loss == 150);
    assert(v.quality == MoveQuality::Mistake);
    assert(v.comment == "Stalemate throws away a winning position.");

    // losing side escaping into stalemate is scored the same way
    f = scored(-900, 0, -900);
    f.deliversStalemate = true;
    assert(classify(f).loss == 150);
  }

  // Brilliant: a real sacrifice with a sound evaluation
  {
    model::Position pos;
    const bool ok = model::Position::fromFen("4k3/8/4p3/8/8/8/8/3QK3 w - - 0 1", pos);
    assert(ok);
    model::Move mv;
    assert(model::rules::fromSan(pos, "Qd5", mv));

    auto f = scored(20, -50, 5);
    f.isSacrifice = isSacrifice(pos, mv);
    assert(f.isSacrifice);
    auto v = classify(f);
    assert(v.quality == MoveQuality::Brilliant);
    assert(v.comment == "Brilliant sacrifice! Giving up material keeps the position.");

    // already winning: just a good move
    f.evalBefore = 600;
    assert(classify(f).quality == MoveQuality::Excellent);

    // position collapses afterwards
    f.evalBefore = 20;
    f.evalAfter = -150;
    assert(classify(f).quality == MoveQuality::Excellent);

    // too costly to upgrade
    f.evalAfter = -50;
    f.loss = 25;
    assert(classify(f).quality == MoveQuality::Good);

    f.isSacrifice = false;
    f.loss = 0;
    assert(classify(f).quality == MoveQuality::Best);
  }

  // Brilliant for Black mirrors the bounds
  {
    auto f = scored(-20, 50, 0, core::Color::Black);
    f.isSacrifice = true;
    assert(classify(f).quality == MoveQuality::Brilliant);
    f.evalAfter = 150;
    assert(classify(f).quality == MoveQuality::Best);
    f.evalAfter = 50;
    f.evalBefore = -600;
    assert(classify(f).quality == MoveQuality::Best);
  }

  // Names used in reports
  {
    assert(std::string(toString(MoveQuality::Brilliant)) == "brilliant");
    assert(std::string(toString(MoveQuality::Inaccuracy)) == "inaccuracy");
    assert(std::string(toString(ProblemKind::LeavesPieceHanging)) == "leaves_piece_hanging");
  }

  return 0;
}
