#include "glyph/review/evaluation_scheduler.hpp"

#include <algorithm>
#include <future>
#include <string>
#include <thread>
#include <unordered_set>

#include "glyph/engine/thread_pool.hpp"
#include "glyph/log.hpp"

namespace glyph::review
{
  namespace
  {
    bool stopped(const StopFlag &stop)
    {
      return stop && stop->load(std::memory_order_acquire);
    }

    // true if a non-null record was written
    bool evaluateOne(const model::Position &pos, const std::string &fp, EvaluatorPool &pool,
                     EvaluationCache &cache, int depth, const StopFlag &stop)
    {
      if (stopped(stop))
        return true;

      EvaluationRecord rec;
      try
      {
        auto lease = pool.acquire();
        try
        {
          rec = lease->evaluate(pos, depth);
        }
        catch (...)
        {
          lease.discard();
          throw;
        }
      }
      catch (const std::exception &e)
      {
        log::warn("Scheduler", "evaluation failed for " + fp + ": " + e.what());
        rec = EvaluationRecord{};
      }

      if (stopped(stop))
        return true;
      cache.insert(fp, rec);
      if (!rec.score)
      {
        log::info("Scheduler", "no score for " + fp);
        return false;
      }
      return true;
    }
  } // namespace

  std::size_t workerCount(std::size_t distinct, std::size_t maxWorkers)
  {
    std::size_t n = std::thread::hardware_concurrency();
    if (n == 0)
      n = 1;
    n = std::min(n, distinct);
    if (maxWorkers > 0)
      n = std::min(n, maxWorkers);
    return n;
  }

  ScheduleStats evaluateAll(const std::vector<model::Position> &positions, EvaluatorPool &pool,
                            EvaluationCache &cache, int depth, std::size_t maxWorkers,
                            const StopFlag &stop)
  {
    ScheduleStats stats;

    std::unordered_set<std::string> seen;
    std::vector<std::pair<std::string, const model::Position *>> work;
    for (const auto &pos : positions)
    {
      std::string fp = pos.fingerprint();
      if (seen.insert(fp).second)
        work.emplace_back(std::move(fp), &pos);
    }
    stats.distinct = work.size();
    if (work.empty())
      return stats;

    stats.workers = workerCount(work.size(), maxWorkers);
    log::info("Scheduler", std::to_string(work.size()) + " distinct positions on " +
                               std::to_string(stats.workers) + " workers");

    std::vector<std::future<bool>> futures;
    futures.reserve(work.size());
    {
      engine::ThreadPool threads(stats.workers);
      for (const auto &w : work)
        futures.push_back(threads.submit([&pool, &cache, &w, depth, &stop]()
                                         { return evaluateOne(*w.second, w.first, pool, cache, depth, stop); }));

      for (auto &f : futures)
      {
        try
        {
          if (!f.get())
            ++stats.failed;
        }
        catch (const std::exception &e)
        {
          log::warn("Scheduler", std::string("task failed: ") + e.what());
          ++stats.failed;
        }
      }
    } // joins the workers

    if (stopped(stop))
      throw AnalysisCancelled();

    // a task that died before writing still owes its key a null record
    for (const auto &w : work)
      if (cache.insert(w.first, EvaluationRecord{}))
        ++stats.failed;
    return stats;
  }
} // namespace glyph::review
