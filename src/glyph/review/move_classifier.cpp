#include "glyph/review/move_classifier.hpp"

#include <algorithm>
#include <cstdlib>

namespace glyph::review
{
  namespace
  {
    int moverPov(core::Color side, int whitePov)
    {
      return side == core::Color::White ? whitePov : -whitePov;
    }

    std::string weakMoveComment(MoveQuality q, const MoveFacts &f)
    {
      if (f.diagnosis && !f.diagnosis->description.empty())
        return f.diagnosis->description;
      if (f.bestMoveSan)
        return "Better was " + *f.bestMoveSan + ".";
      switch (q)
      {
      case MoveQuality::Inaccuracy:
        return "A slightly imprecise move.";
      case MoveQuality::Mistake:
        return "A mistake that gives away part of the advantage.";
      default:
        return "A serious error that changes the evaluation.";
      }
    }

    std::string plainComment(MoveQuality q)
    {
      switch (q)
      {
      case MoveQuality::Best:
        return "The best move.";
      case MoveQuality::Excellent:
        return "An excellent move, nearly the engine's choice.";
      default:
        return "A good, solid move.";
      }
    }

    bool brilliantGates(const MoveFacts &f, const ClassifierConfig &cfg)
    {
      if (!f.isSacrifice || !f.evalBefore || !f.evalAfter)
        return false;
      if (moverPov(f.side, *f.evalBefore) > cfg.brilliantMaxAdvantage)
        return false;
      return f.side == core::Color::White ? *f.evalAfter >= -cfg.brilliantEvalFloor
                                          : *f.evalAfter <= cfg.brilliantEvalFloor;
    }
  } // namespace

  int moverLoss(core::Color side, int bestLineEval, int evalAfter)
  {
    return moverPov(side, bestLineEval - evalAfter);
  }

  int clampLoss(int loss, const ClassifierConfig &cfg)
  {
    return std::clamp(loss, 0, cfg.lossCeiling);
  }

  MoveQuality qualityForLoss(int loss, const ClassifierConfig &cfg)
  {
    if (loss <= cfg.bestMax)
      return MoveQuality::Best;
    if (loss <= cfg.excellentMax)
      return MoveQuality::Excellent;
    if (loss <= cfg.goodMax)
      return MoveQuality::Good;
    if (loss <= cfg.inaccuracyMax)
      return MoveQuality::Inaccuracy;
    if (loss <= cfg.mistakeMax)
      return MoveQuality::Mistake;
    return MoveQuality::Blunder;
  }

  Verdict classify(const MoveFacts &f, const ClassifierConfig &cfg)
  {
    if (f.deliversMate)
      return {MoveQuality::Best, "Checkmate! A perfect finishing move.", 0};
    if (f.isBook)
      return {MoveQuality::Book, "A known opening move.", 0};
    if (f.isForced)
      return {MoveQuality::Forced, "The only legal move.", 0};
    if (f.isMiss)
    {
      std::string c = f.bestMoveSan ? "Missed opportunity: " + *f.bestMoveSan + " was much stronger."
                                    : "Missed a stronger continuation.";
      return {MoveQuality::Miss, std::move(c), f.loss ? clampLoss(*f.loss, cfg) : 0};
    }

    std::optional<int> loss = f.loss;
    if (f.deliversStalemate)
    {
      if (!f.evalBefore)
        loss.reset();
      else
        loss = std::abs(*f.evalBefore) < cfg.stalemateBalanced ? 0 : cfg.stalemateLoss;
    }
    if (!loss)
      return {MoveQuality::Unknown, "Evaluation unavailable for this move.", 0};

    Verdict v;
    v.loss = clampLoss(*loss, cfg);
    v.quality = qualityForLoss(v.loss, cfg);

    switch (v.quality)
    {
    case MoveQuality::Inaccuracy:
    case MoveQuality::Mistake:
    case MoveQuality::Blunder:
      v.comment = f.deliversStalemate ? "Stalemate throws away a winning position."
                                      : weakMoveComment(v.quality, f);
      return v;
    default:
      break;
    }

    if (f.deliversStalemate)
      v.comment = "Stalemate in a balanced position.";
    else
      v.comment = plainComment(v.quality);

    if ((v.quality == MoveQuality::Best || v.quality == MoveQuality::Excellent) && brilliantGates(f, cfg))
    {
      v.quality = MoveQuality::Brilliant;
      v.comment = "Brilliant sacrifice! Giving up material keeps the position.";
    }
    return v;
  }
} // namespace glyph::review
