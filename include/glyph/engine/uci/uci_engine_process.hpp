#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace glyph::engine::uci
{
  // One external UCI engine child process with a background reader thread.
  class UciEngineProcess
  {
  public:
    struct Id
    {
      std::string name, author;
    };

    enum class WaitStatus
    {
      Ok,
      Timeout,
      Closed
    };

    UciEngineProcess() = default;
    ~UciEngineProcess(); // out-of-line semantics via custom deleter (safe with incomplete Impl)

    UciEngineProcess(const UciEngineProcess &) = delete;
    UciEngineProcess &operator=(const UciEngineProcess &) = delete;
    UciEngineProcess(UciEngineProcess &&) = delete;
    UciEngineProcess &operator=(UciEngineProcess &&) = delete;

    bool start(const std::string &exePath);
    void stop();
    bool running() const { return m_running.load(); }

    // "uci" ... "uciok", then "isready" ... "readyok".
    bool uciHandshake(Id &outId, int timeoutMs);
    bool waitReady(int timeoutMs);

    void setOption(const std::string &name, const std::string &value);
    void newGame();

    void position(const std::string &fen);
    void goFixedDepth(int depth);
    void stopSearch();

    // Collects every line up to and including "bestmove ...". Lines other than the
    // bestmove line are appended to 'infoLines'.
    WaitStatus waitBestmove(int timeoutMs, std::string &bestmoveLine, std::vector<std::string> &infoLines);

  private:
    bool sendLine(const std::string &line);
    void readerLoop();
    bool popLine(std::string &out, std::chrono::steady_clock::time_point deadline, WaitStatus &st);
    // Feeds lines to 'done' until it returns true, the deadline passes or the engine closes.
    WaitStatus readUntil(int timeoutMs, const std::function<bool(std::string &)> &done);

    bool platformStart(const std::string &exePath);
    void platformShutdown(); // close stdin, reap or kill the child
    void platformRelease();  // close remaining handles, after the reader has exited

    bool platformWrite(const std::string &s);
    bool platformReadLine(std::string &outLine);

  private:
    std::thread m_reader;
    std::atomic_bool m_running{false};
    std::atomic_bool m_eof{false};

    std::mutex m_mtx;
    std::condition_variable m_cvLines;
    std::deque<std::string> m_lines;

    struct Impl;

    struct ImplDeleter
    {
      void operator()(Impl *p) noexcept; // defined in platform .cpp where Impl is complete
    };

    std::unique_ptr<Impl, ImplDeleter> m_impl;
  };
} // namespace glyph::engine::uci
