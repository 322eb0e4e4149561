#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "glyph/model/position.hpp"
#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  // Scores one position at a time. Implementations are not shared between threads.
  class PositionEvaluator
  {
  public:
    virtual ~PositionEvaluator() = default;

    // Failures come back as a record with a null score.
    virtual EvaluationRecord evaluate(const model::Position &pos, int depth) = 0;

    // False once the instance must not be used again (crashed engine, timed-out search).
    virtual bool usable() const { return true; }
  };

  using EvaluatorFactory = std::function<std::unique_ptr<PositionEvaluator>()>;

  // Hands out evaluators one task at a time and recycles the healthy ones.
  class EvaluatorPool
  {
  public:
    class Lease
    {
    public:
      Lease(EvaluatorPool &pool, std::unique_ptr<PositionEvaluator> ev) : m_pool(&pool), m_ev(std::move(ev)) {}
      Lease(Lease &&) noexcept = default;
      Lease &operator=(Lease &&) = delete;
      Lease(const Lease &) = delete;
      Lease &operator=(const Lease &) = delete;
      ~Lease()
      {
        if (m_ev)
          m_pool->release(std::move(m_ev));
      }

      PositionEvaluator *operator->() const { return m_ev.get(); }
      PositionEvaluator &operator*() const { return *m_ev; }

      // Destroy instead of returning to the pool.
      void discard() { m_ev.reset(); }

    private:
      EvaluatorPool *m_pool;
      std::unique_ptr<PositionEvaluator> m_ev;
    };

    explicit EvaluatorPool(EvaluatorFactory factory) : m_factory(std::move(factory)) {}

    EvaluatorPool(const EvaluatorPool &) = delete;
    EvaluatorPool &operator=(const EvaluatorPool &) = delete;

    // Reuses an idle evaluator or creates one. Throws if the factory yields nothing.
    Lease acquire();

    std::size_t created() const;
    std::size_t idle() const;

  private:
    void release(std::unique_ptr<PositionEvaluator> ev);

    EvaluatorFactory m_factory;
    mutable std::mutex m_mtx;
    std::vector<std::unique_ptr<PositionEvaluator>> m_idle;
    std::size_t m_created = 0;
  };

  // Deterministic evaluator for tests: answers from a table keyed by position fingerprint.
  class ScriptedEvaluator final : public PositionEvaluator
  {
  public:
    struct Script
    {
      std::unordered_map<std::string, EvaluationRecord> records;
      std::unordered_set<std::string> failOn;  // null record, instance becomes unusable
      std::unordered_set<std::string> throwOn; // evaluate() throws
      std::optional<EvaluationRecord> fallback; // for unscripted positions; null record if unset
      std::function<void(const std::string &)> onEvaluate; // called before answering

      // bestUci is resolved against 'pos'; an unknown or illegal move leaves bestMove empty.
      void set(const model::Position &pos, std::optional<int> score, std::string_view bestUci = {});

      int calls(const std::string &fingerprint) const;
      int totalCalls() const;

    private:
      friend class ScriptedEvaluator;
      mutable std::mutex mtx;
      std::unordered_map<std::string, int> callCount;
    };

    explicit ScriptedEvaluator(std::shared_ptr<Script> script) : m_script(std::move(script)) {}

    EvaluationRecord evaluate(const model::Position &pos, int depth) override;
    bool usable() const override { return m_usable; }

    static EvaluatorFactory factory(std::shared_ptr<Script> script);

  private:
    std::shared_ptr<Script> m_script;
    bool m_usable = true;
  };
} // namespace glyph::review
