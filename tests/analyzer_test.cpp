#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "glyph/model/analysis/opening_book.hpp"
#include "glyph/model/analysis/pgn_reader.hpp"
#include "glyph/model/rules.hpp"
#include "glyph/review/game_analyzer.hpp"

using namespace glyph;
using namespace glyph::review;
using Script = ScriptedEvaluator::Script;

static Game replay(const std::vector<std::string> &tokens, const std::string &fen = {})
{
  model::Position start = model::Position::startpos();
  if (!fen.empty())
  {
    const bool ok = model::Position::fromFen(fen, start);
    assert(ok);
  }
  return enumeratePositions(start, tokens);
}

static GameAnalysis run(const Game &g, const std::shared_ptr<Script> &script,
                        const model::analysis::OpeningBook *book = nullptr, AnalyzerConfig cfg = {})
{
  GameAnalyzer analyzer(cfg, ScriptedEvaluator::factory(script), book);
  return analyzer.analyze(g);
}

int main()
{
  // Fool's mate: the blunder that allows it, then the mate itself
  {
    const Game g = replay({"f3", "e5", "g4", "Qh4#"});
    auto script = std::make_shared<Script>();
    script->fallback = EvaluationRecord{0, std::nullopt};
    script->set(g.positions[3], -300);
    // whatever the engine says about the final position, mate is mate
    script->set(g.positions[4], 500);

    const auto a = run(g, script);
    assert(a.entries.size() == 4);
    assert(a.entries[0].ply == 1 && a.entries[0].side == core::Color::White);
    assert(a.entries[3].ply == 4 && a.entries[3].side == core::Color::Black);

    const auto &blunder = a.entries[2];
    assert(blunder.san == "g4");
    assert(blunder.quality == MoveQuality::Blunder);
    assert(blunder.centipawnLoss == 300);
    assert(blunder.problem == ProblemKind::AllowsCheckmate);
    assert(blunder.comment == "This allows checkmate with Qh4#.");
    assert(blunder.evalBefore == 0.0 && blunder.evalAfter == -3.0);

    const auto &mate = a.entries[3];
    assert(mate.san == "Qh4#");
    assert(mate.quality == MoveQuality::Best);
    assert(mate.centipawnLoss == 0);
    assert(mate.comment == "Checkmate! A perfect finishing move.");
    assert(!mate.problem);
  }

  // The only legal move out of check
  {
    const Game g = replay({"Kxb2"}, "4k3/8/8/8/8/8/1q6/K7 w - - 0 1");
    auto script = std::make_shared<Script>();
    script->fallback = EvaluationRecord{0, std::nullopt};
    const auto a = run(g, script);
    assert(a.entries.size() == 1);
    assert(a.entries[0].quality == MoveQuality::Forced);
    assert(a.entries[0].comment == "The only legal move.");
  }

  // Stalemating from a won position
  {
    const Game g = replay({"Qf7"}, "7k/8/6K1/8/8/8/8/5Q2 w - - 0 1");
    auto script = std::make_shared<Script>();
    script->set(g.positions[0], 900);
    script->set(g.positions[1], 0);
    const auto a = run(g, script);
    assert(a.entries.size() == 1);
    assert(model::rules::gameResult(g.positions[1]) == core::STALEMATE);
    assert(a.entries[0].quality == MoveQuality::Mistake);
    assert(a.entries[0].centipawnLoss == 150);
    assert(a.entries[0].comment == "Stalemate throws away a winning position.");
  }

  // A failed evaluation only affects the moves touching that position
  {
    const Game g = replay({"e4", "e5", "Nf3", "Nc6", "Bc4"});
    auto script = std::make_shared<Script>();
    script->set(g.positions[0], 20);
    script->set(g.positions[1], 30);
    script->set(g.positions[2], 25);
    script->failOn.insert(g.positions[3].fingerprint());
    script->set(g.positions[4], 30);
    script->set(g.positions[5], 25);

    const auto a = run(g, script);
    assert(a.stats.distinct == 6);
    assert(a.stats.failed == 1);
    assert(a.entries[0].quality == MoveQuality::Best);
    assert(a.entries[0].evalAfter == 0.3);
    assert(a.entries[1].quality == MoveQuality::Best);
    assert(a.entries[2].quality == MoveQuality::Unknown);
    assert(!a.entries[2].evalAfter);
    assert(a.entries[3].quality == MoveQuality::Unknown);
    assert(!a.entries[3].evalBefore);
    assert(a.entries[4].quality == MoveQuality::Excellent);
    assert(a.entries[4].centipawnLoss == 5);
    assert(a.openingName.empty());

    // same input, same output, whatever the thread interleaving
    for (std::size_t workers : {1u, 2u, 0u})
    {
      AnalyzerConfig cfg;
      cfg.maxWorkers = workers;
      if (run(g, script, nullptr, cfg).entries != a.entries)
      {
        std::cerr << "Analysis differs with maxWorkers=" << workers << "\n";
        return 1;
      }
    }
  }

  // Loss is measured against the engine's own line
  {
    const Game g = replay({"a3"});
    auto script = std::make_shared<Script>();
    script->set(g.positions[0], 30, "e2e4");
    script->set(g.positions[1], -10);

    const auto a = run(g, script);
    const auto &e = a.entries[0];
    assert(e.quality == MoveQuality::Inaccuracy);
    assert(e.centipawnLoss == 40);
    assert(e.bestMoveSan && *e.bestMoveSan == "e4");
    assert(e.comment == "Better was e4.");
    assert(!e.problem);
  }

  // Playing the engine's move costs nothing even if the scores drift
  {
    const Game g = replay({"e4"});
    auto script = std::make_shared<Script>();
    script->set(g.positions[0], 30, "e2e4");
    script->set(g.positions[1], 25);

    const auto a = run(g, script);
    assert(a.entries[0].quality == MoveQuality::Best);
    assert(a.entries[0].centipawnLoss == 0);
    assert(!a.entries[0].bestMoveSan);
  }

  // Book moves need no engine
  {
    const Game g = replay({"e4", "e5", "Nf3"});
    auto script = std::make_shared<Script>();
    const auto &book = model::analysis::OpeningBook::builtin();

    const auto a = run(g, script, &book);
    for (const auto &e : a.entries)
    {
      assert(e.quality == MoveQuality::Book);
      assert(e.isBook);
      assert(e.comment == "A known opening move.");
    }
    assert(a.openingEco == "C40");
    assert(a.openingName == "King's Knight Opening");

    AnalyzerConfig cfg;
    cfg.classifier.bookPlyLimit = 2;
    const auto limited = run(g, script, &book, cfg);
    assert(limited.entries[1].quality == MoveQuality::Book);
    assert(limited.entries[2].quality == MoveQuality::Unknown);
    assert(!limited.entries[2].isBook);
  }

  // Games read from PGN
  {
    model::analysis::GameRecord rec;
    const bool ok = model::analysis::parsePgnToRecord(
        "[FEN \"4k3/8/8/8/8/8/1q6/K7 w - - 0 1\"]\n\n1. Kxb2 Kd7 *", rec);
    assert(ok);
    auto script = std::make_shared<Script>();
    script->fallback = EvaluationRecord{0, std::nullopt};
    GameAnalyzer analyzer(AnalyzerConfig{}, ScriptedEvaluator::factory(script), nullptr);

    const auto a = analyzer.analyze(rec);
    assert(a.entries.size() == 2);
    assert(a.entries[0].quality == MoveQuality::Forced);
    assert(a.entries[1].san == "Kd7");

    rec.startFen = "not a position";
    bool rejected = false;
    try
    {
      analyzer.analyze(rec);
    }
    catch (const ParseError &)
    {
      rejected = true;
    }
    assert(rejected);
  }

  // Unplayable move text
  {
    bool rejected = false;
    try
    {
      replay({"e4", "e5", "Ke3"});
    }
    catch (const ParseError &e)
    {
      rejected = std::string(e.what()).find("ply 3") != std::string::npos;
    }
    assert(rejected);
  }

  // Cancellation
  {
    const Game g = replay({"d4", "Nf6", "c4"});
    auto script = std::make_shared<Script>();
    script->fallback = EvaluationRecord{0, std::nullopt};
    GameAnalyzer analyzer(AnalyzerConfig{}, ScriptedEvaluator::factory(script), nullptr);

    StopFlag stop = std::make_shared<std::atomic<bool>>(true);
    bool cancelled = false;
    try
    {
      analyzer.analyze(g, stop);
    }
    catch (const AnalysisCancelled &)
    {
      cancelled = true;
    }
    assert(cancelled);
  }

  return 0;
}
