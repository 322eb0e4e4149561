#include "glyph/review/game_analyzer.hpp"

#include "glyph/log.hpp"
#include "glyph/model/rules.hpp"
#include "glyph/review/book_oracle.hpp"
#include "glyph/review/miss_detector.hpp"
#include "glyph/review/move_classifier.hpp"
#include "glyph/review/problem_diagnoser.hpp"
#include "glyph/review/sacrifice_detector.hpp"

namespace glyph::review
{
  namespace
  {
    namespace rules = model::rules;

    std::optional<double> toPawns(std::optional<int> cp)
    {
      if (!cp)
        return std::nullopt;
      return *cp / 100.0;
    }

    // Eval of the line the engine preferred: the cached score of the position its best move
    // reaches, else the score of the position before the move.
    std::optional<int> bestLineEval(const model::Position &before, const EvaluationRecord &rec,
                                    const EvaluationCache &cache)
    {
      if (rec.bestMove)
      {
        if (auto reached = rules::applyMove(before, *rec.bestMove))
        {
          if (auto s = cache.score(reached->fingerprint()))
            return s;
        }
      }
      return rec.score;
    }

    AnalysisEntry analyzePly(std::size_t i, const Game &game, const EvaluationCache &cache, BookOracle &book,
                             const ClassifierConfig &cfg)
    {
      const model::Position &before = game.positions[i];
      const model::Position &after = game.positions[i + 1];
      const model::Move &mv = game.moves[i];
      const core::Color side = before.sideToMove();

      const EvaluationRecord recBefore = cache.find(before.fingerprint()).value_or(EvaluationRecord{});
      const std::optional<int> evalAfter = cache.score(after.fingerprint());

      MoveFacts f;
      f.side = side;
      f.evalBefore = recBefore.score;
      f.evalAfter = evalAfter;

      const auto legals = rules::legalMoves(before);
      const core::GameResult ending = rules::gameResult(after);
      f.deliversMate = ending == core::CHECKMATE;
      f.deliversStalemate = ending == core::STALEMATE;
      f.isBook = book.isBookMove(static_cast<int>(i), after);
      f.isForced = before.inCheck() && legals.size() == 1 && legals.front() == mv;

      if (recBefore.bestMove && *recBefore.bestMove != mv)
        f.bestMoveSan = rules::toSan(before, *recBefore.bestMove);

      if (const auto line = bestLineEval(before, recBefore, cache); line && evalAfter)
        f.loss = moverLoss(side, *line, *evalAfter);

      f.isMiss = isMiss(before, recBefore.bestMove, mv, f.evalBefore, f.evalAfter, side, cfg);
      f.isSacrifice = isSacrifice(before, mv);
      f.diagnosis = diagnose(before, mv, after);

      const Verdict v = classify(f, cfg);

      AnalysisEntry e;
      e.ply = static_cast<int>(i) + 1;
      e.san = rules::toSan(before, mv);
      e.quality = v.quality;
      e.isBook = f.isBook;
      e.comment = v.comment;
      e.evalBefore = toPawns(f.evalBefore);
      e.evalAfter = toPawns(f.evalAfter);
      e.bestMoveSan = f.bestMoveSan;
      e.centipawnLoss = v.loss;
      const bool weak = v.quality == MoveQuality::Inaccuracy || v.quality == MoveQuality::Mistake ||
                        v.quality == MoveQuality::Blunder;
      if (weak && f.diagnosis)
        e.problem = f.diagnosis->kind;
      e.side = side;
      return e;
    }
  } // namespace

  GameAnalysis GameAnalyzer::analyze(const Game &game, const StopFlag &stop) const
  {
    GameAnalysis out;

    // phase 1: the cache is complete before any move is classified
    EvaluationCache cache;
    {
      EvaluatorPool pool(m_factory);
      out.stats = evaluateAll(game.positions, pool, cache, m_cfg.depth, m_cfg.maxWorkers, stop);
    } // engines shut down here
    if (out.stats.failed > 0)
      log::warn("Analyzer", std::to_string(out.stats.failed) + " of " + std::to_string(out.stats.distinct) +
                                " positions could not be evaluated");

    // phase 2: sequential, deterministic
    BookOracle book(m_book, m_cfg.classifier.bookPlyLimit);
    out.entries.reserve(game.moves.size());
    for (std::size_t i = 0; i < game.moves.size(); ++i)
      out.entries.push_back(analyzePly(i, game, cache, book, m_cfg.classifier));

    for (std::size_t i = game.positions.size(); i-- > 1;)
    {
      if (const auto *o = book.openingAt(game.positions[i]))
      {
        out.openingEco = o->eco;
        out.openingName = o->name;
        break;
      }
    }
    return out;
  }

  GameAnalysis GameAnalyzer::analyze(const model::analysis::GameRecord &rec, const StopFlag &stop) const
  {
    model::Position start;
    std::string err;
    if (!model::Position::fromFen(rec.startFen, start, &err))
      throw ParseError("bad start position: " + err);

    std::vector<model::Move> moves;
    moves.reserve(rec.plies.size());
    for (const auto &p : rec.plies)
      moves.push_back(p.move);
    return analyze(enumeratePositions(start, moves), stop);
  }
} // namespace glyph::review
