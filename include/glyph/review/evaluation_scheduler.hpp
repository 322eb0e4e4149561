#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

#include "glyph/model/position.hpp"
#include "glyph/review/evaluation_cache.hpp"
#include "glyph/review/evaluator.hpp"

namespace glyph::review
{
  using StopFlag = std::shared_ptr<std::atomic<bool>>;

  struct ScheduleStats
  {
    std::size_t distinct = 0; // positions submitted after fingerprint collapse
    std::size_t workers = 0;
    std::size_t failed = 0;   // null records written
  };

  // Evaluates every distinct position once and fills 'cache'. Blocks until all tasks are done.
  // A failing task writes a null record; it never aborts the batch.
  // Throws AnalysisCancelled if 'stop' is set before the batch completes; results produced
  // after that point are dropped.
  ScheduleStats evaluateAll(const std::vector<model::Position> &positions, EvaluatorPool &pool,
                            EvaluationCache &cache, int depth, std::size_t maxWorkers = 0,
                            const StopFlag &stop = nullptr);

  // min(hardware concurrency, distinct, maxWorkers); maxWorkers 0 means no extra cap.
  std::size_t workerCount(std::size_t distinct, std::size_t maxWorkers);
} // namespace glyph::review
