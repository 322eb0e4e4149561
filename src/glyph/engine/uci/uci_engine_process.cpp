#include "glyph/engine/uci/uci_engine_process.hpp"

#include <chrono>
#include <string>

namespace glyph::engine::uci
{
  namespace
  {
    bool starts_with(const std::string &s, const char *pfx)
    {
      return s.rfind(pfx, 0) == 0;
    }
  } // namespace

  UciEngineProcess::~UciEngineProcess()
  {
    stop();
  }

  bool UciEngineProcess::start(const std::string &exePath)
  {
    stop();
    if (!platformStart(exePath))
    {
      platformRelease();
      return false;
    }

    m_eof.store(false);
    m_running.store(true);
    m_reader = std::thread([this]
                           { readerLoop(); });
    return true;
  }

  void UciEngineProcess::stop()
  {
    if (!m_running.exchange(false))
      return;

    // best-effort graceful shutdown
    sendLine("quit");
    platformShutdown();

    // the reader sees EOF once the child is gone
    if (m_reader.joinable())
      m_reader.join();
    platformRelease();

    std::lock_guard lk(m_mtx);
    m_lines.clear();
  }

  bool UciEngineProcess::sendLine(const std::string &line)
  {
    return platformWrite(line + "\n");
  }

  void UciEngineProcess::readerLoop()
  {
    for (;;)
    {
      std::string line;
      if (!platformReadLine(line))
        break;

      // Normalize CRLF
      while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();

      {
        std::lock_guard lk(m_mtx);
        m_lines.push_back(std::move(line));
      }
      m_cvLines.notify_all();
    }

    {
      std::lock_guard lk(m_mtx);
      m_eof.store(true);
    }
    m_cvLines.notify_all();
  }

  bool UciEngineProcess::popLine(std::string &out, std::chrono::steady_clock::time_point deadline,
                                 WaitStatus &st)
  {
    std::unique_lock lk(m_mtx);
    const bool ready = m_cvLines.wait_until(lk, deadline, [&]
                                            { return !m_lines.empty() || m_eof.load(); });
    if (!m_lines.empty())
    {
      out = std::move(m_lines.front());
      m_lines.pop_front();
      st = WaitStatus::Ok;
      return true;
    }
    st = ready ? WaitStatus::Closed : WaitStatus::Timeout;
    return false;
  }

  UciEngineProcess::WaitStatus UciEngineProcess::readUntil(int timeoutMs,
                                                           const std::function<bool(std::string &)> &done)
  {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::string line;
    WaitStatus st{};
    while (popLine(line, deadline, st))
    {
      if (done(line))
        return WaitStatus::Ok;
    }
    return st;
  }

  bool UciEngineProcess::uciHandshake(Id &outId, int timeoutMs)
  {
    static const std::string kName = "id name ";
    static const std::string kAuthor = "id author ";

    outId = {};
    if (!sendLine("uci"))
      return false;
    const WaitStatus st = readUntil(timeoutMs, [&](std::string &line)
                                    {
      if (starts_with(line, kName.c_str()))
        outId.name = line.substr(kName.size());
      else if (starts_with(line, kAuthor.c_str()))
        outId.author = line.substr(kAuthor.size());
      return line == "uciok"; });
    return st == WaitStatus::Ok && waitReady(timeoutMs);
  }

  bool UciEngineProcess::waitReady(int timeoutMs)
  {
    if (!sendLine("isready"))
      return false;
    return readUntil(timeoutMs, [](std::string &line)
                     { return line == "readyok"; }) == WaitStatus::Ok;
  }

  void UciEngineProcess::setOption(const std::string &name, const std::string &value)
  {
    sendLine("setoption name " + name + " value " + value);
  }

  void UciEngineProcess::newGame()
  {
    sendLine("ucinewgame");
  }

  void UciEngineProcess::position(const std::string &fen)
  {
    sendLine("position fen " + fen);
  }

  void UciEngineProcess::goFixedDepth(int depth)
  {
    sendLine("go depth " + std::to_string(depth));
  }

  void UciEngineProcess::stopSearch()
  {
    sendLine("stop");
  }

  UciEngineProcess::WaitStatus UciEngineProcess::waitBestmove(int timeoutMs, std::string &bestmoveLine,
                                                              std::vector<std::string> &infoLines)
  {
    return readUntil(timeoutMs, [&](std::string &line)
                     {
      if (starts_with(line, "bestmove"))
      {
        bestmoveLine = std::move(line);
        return true;
      }
      infoLines.push_back(std::move(line));
      return false; });
  }
} // namespace glyph::engine::uci
