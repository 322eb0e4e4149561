#pragma once
#include <memory>
#include <string>

#include "glyph/engine/config.hpp"
#include "glyph/engine/uci/uci_engine_process.hpp"
#include "glyph/review/evaluator.hpp"

namespace glyph::review
{
  // PositionEvaluator backed by one external UCI engine process.
  // The process is started lazily on the first evaluate() and configured once.
  class UciEvaluator final : public PositionEvaluator
  {
  public:
    explicit UciEvaluator(engine::EvalEngineConfig cfg) : m_cfg(std::move(cfg)) {}

    EvaluationRecord evaluate(const model::Position &pos, int depth) override;
    bool usable() const override { return !m_broken; }

    static EvaluatorFactory factory(const engine::EvalEngineConfig &cfg);

  private:
    bool ensureStarted();
    EvaluationRecord fail(const std::string &why);

    engine::EvalEngineConfig m_cfg;
    engine::uci::UciEngineProcess m_proc;
    bool m_started = false;
    bool m_broken = false;
  };
} // namespace glyph::review
