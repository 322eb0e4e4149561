#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace glyph::engine {

// Fixed-size pool owned by its caller. Destruction runs what is already queued, then joins.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t workers) {
    const std::size_t n = workers > 0 ? workers : 1;
    workers_.reserve(n);
    while (workers_.size() < n) workers_.emplace_back([this] { run(); });
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  ~ThreadPool() {
    {
      std::lock_guard<std::mutex> lk(m_);
      closing_ = true;
    }
    wake_.notify_all();
    for (auto& w : workers_) w.join();
  }

  // Queue a nullary job. Whatever it throws is rethrown by future::get().
  template <class Job>
  auto submit(Job&& job) -> std::future<std::invoke_result_t<Job>> {
    using R = std::invoke_result_t<Job>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Job>(job));
    auto fut = task->get_future();
    {
      std::lock_guard<std::mutex> lk(m_);
      jobs_.push([task] { (*task)(); });
    }
    wake_.notify_one();
    return fut;
  }

  std::size_t size() const noexcept { return workers_.size(); }

 private:
  void run() {
    std::unique_lock<std::mutex> lk(m_);
    for (;;) {
      wake_.wait(lk, [this] { return closing_ || !jobs_.empty(); });
      if (jobs_.empty()) return;  // closing and drained
      auto job = std::move(jobs_.front());
      jobs_.pop();
      lk.unlock();
      job();
      lk.lock();
    }
  }

  std::mutex m_;
  std::condition_variable wake_;
  std::queue<std::function<void()>> jobs_;
  std::vector<std::thread> workers_;
  bool closing_ = false;
};

}  // namespace glyph::engine
