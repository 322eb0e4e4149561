#include "glyph/review/evaluator.hpp"

#include <stdexcept>

#include "glyph/model/rules.hpp"

namespace glyph::review
{
  EvaluatorPool::Lease EvaluatorPool::acquire()
  {
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      if (!m_idle.empty())
      {
        auto ev = std::move(m_idle.back());
        m_idle.pop_back();
        return Lease(*this, std::move(ev));
      }
    }

    // creation may be slow (engine spawn); keep it outside the lock
    auto ev = m_factory();
    if (!ev)
      throw std::runtime_error("evaluator factory returned no instance");
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      ++m_created;
    }
    return Lease(*this, std::move(ev));
  }

  void EvaluatorPool::release(std::unique_ptr<PositionEvaluator> ev)
  {
    if (!ev || !ev->usable())
      return;
    std::lock_guard<std::mutex> lk(m_mtx);
    m_idle.push_back(std::move(ev));
  }

  std::size_t EvaluatorPool::created() const
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_created;
  }

  std::size_t EvaluatorPool::idle() const
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_idle.size();
  }

  void ScriptedEvaluator::Script::set(const model::Position &pos, std::optional<int> score,
                                      std::string_view bestUci)
  {
    EvaluationRecord rec;
    rec.score = score;
    model::Move mv;
    if (!bestUci.empty() && model::rules::fromUci(pos, bestUci, mv))
      rec.bestMove = mv;
    records[pos.fingerprint()] = rec;
  }

  int ScriptedEvaluator::Script::calls(const std::string &fingerprint) const
  {
    std::lock_guard<std::mutex> lk(mtx);
    auto it = callCount.find(fingerprint);
    return it == callCount.end() ? 0 : it->second;
  }

  int ScriptedEvaluator::Script::totalCalls() const
  {
    std::lock_guard<std::mutex> lk(mtx);
    int n = 0;
    for (const auto &kv : callCount)
      n += kv.second;
    return n;
  }

  EvaluationRecord ScriptedEvaluator::evaluate(const model::Position &pos, int /*depth*/)
  {
    const std::string fp = pos.fingerprint();
    {
      std::lock_guard<std::mutex> lk(m_script->mtx);
      ++m_script->callCount[fp];
    }
    if (m_script->onEvaluate)
      m_script->onEvaluate(fp);

    if (m_script->throwOn.count(fp))
      throw std::runtime_error("scripted failure for " + fp);
    if (m_script->failOn.count(fp))
    {
      m_usable = false;
      return {};
    }

    auto it = m_script->records.find(fp);
    if (it != m_script->records.end())
      return it->second;
    return m_script->fallback.value_or(EvaluationRecord{});
  }

  EvaluatorFactory ScriptedEvaluator::factory(std::shared_ptr<Script> script)
  {
    return [script]()
    { return std::make_unique<ScriptedEvaluator>(script); };
  }
} // namespace glyph::review
