#include "glyph/review/uci_evaluator.hpp"

#include <vector>

#include "glyph/engine/uci/uci_info.hpp"
#include "glyph/log.hpp"
#include "glyph/model/rules.hpp"

namespace glyph::review
{
  EvaluationRecord UciEvaluator::fail(const std::string &why)
  {
    log::warn("UciEvaluator", why);
    m_broken = true;
    m_proc.stop();
    return {};
  }

  bool UciEvaluator::ensureStarted()
  {
    if (m_started)
      return true;

    if (!m_proc.start(m_cfg.path))
    {
      fail("could not start engine: " + m_cfg.path);
      return false;
    }

    engine::uci::UciEngineProcess::Id id;
    if (!m_proc.uciHandshake(id, m_cfg.handshakeTimeoutMs))
    {
      fail("handshake failed: " + m_cfg.path);
      return false;
    }
    log::info("UciEvaluator", "started " + (id.name.empty() ? m_cfg.path : id.name));

    m_proc.setOption("Threads", std::to_string(m_cfg.threads));
    m_proc.setOption("Hash", std::to_string(m_cfg.hashMb));
    if (m_cfg.skillLevel)
      m_proc.setOption("Skill Level", std::to_string(*m_cfg.skillLevel));
    if (m_cfg.elo)
    {
      m_proc.setOption("UCI_LimitStrength", "true");
      m_proc.setOption("UCI_Elo", std::to_string(*m_cfg.elo));
    }
    if (!m_proc.waitReady(m_cfg.handshakeTimeoutMs))
    {
      fail("engine not ready after configuration");
      return false;
    }

    m_started = true;
    return true;
  }

  EvaluationRecord UciEvaluator::evaluate(const model::Position &pos, int depth)
  {
    if (m_broken || !ensureStarted())
      return {};

    m_proc.newGame();
    if (!m_proc.waitReady(m_cfg.handshakeTimeoutMs))
      return fail("engine not ready after ucinewgame");
    m_proc.position(pos.toFen());
    m_proc.goFixedDepth(depth > 0 ? depth : m_cfg.depth);

    std::string bestLine;
    std::vector<std::string> info;
    using WS = engine::uci::UciEngineProcess::WaitStatus;
    switch (m_proc.waitBestmove(m_cfg.searchTimeoutMs, bestLine, info))
    {
    case WS::Ok:
      break;
    case WS::Timeout:
      m_proc.stopSearch();
      return fail("search timed out after " + std::to_string(m_cfg.searchTimeoutMs) + " ms");
    case WS::Closed:
      return fail("engine closed during search");
    }

    const auto res = engine::uci::summarizeSearch(info, bestLine);

    EvaluationRecord rec;
    if (res.score)
      rec.score = pos.sideToMove() == core::Color::White ? *res.score : -*res.score;
    else
      log::warn("UciEvaluator", "no score reported for " + pos.toFen());

    model::Move mv;
    if (res.bestmove && model::rules::fromUci(pos, *res.bestmove, mv))
      rec.bestMove = mv;
    return rec;
  }

  EvaluatorFactory UciEvaluator::factory(const engine::EvalEngineConfig &cfg)
  {
    return [cfg]()
    { return std::make_unique<UciEvaluator>(cfg); };
  }
} // namespace glyph::review
