#if !defined(_WIN32)

#include "glyph/engine/uci/uci_engine_process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace glyph::engine::uci
{
  struct UciEngineProcess::Impl
  {
    pid_t pid{-1};
    int toEngine{-1};   // engine stdin
    int fromEngine{-1}; // engine stdout
    std::string pending; // bytes read past the last newline
  };

  void UciEngineProcess::ImplDeleter::operator()(Impl *p) noexcept
  {
    delete p;
  }

  namespace
  {
    constexpr int kQuitGraceMs = 500;
    constexpr int kTermGraceMs = 200;

    void closeFd(int &fd)
    {
      if (fd >= 0)
        ::close(fd);
      fd = -1;
    }

    struct PipePair
    {
      int fd[2] = {-1, -1}; // [0] read end, [1] write end

      bool open() { return ::pipe2(fd, O_CLOEXEC) == 0; }
      void close()
      {
        closeFd(fd[0]);
        closeFd(fd[1]);
      }
    };

    // Writing to an engine that already died must fail with EPIPE instead of killing us.
    void ignoreSigpipe()
    {
      static std::once_flag once;
      std::call_once(once, []
                     { ::signal(SIGPIPE, SIG_IGN); });
    }

    // Runs in the forked child; never returns.
    [[noreturn]] void execEngine(const std::string &exePath, int stdinFd, int stdoutFd)
    {
      // own process group: Ctrl-C in the terminal stops the review, which then shuts engines down
      ::setpgid(0, 0);
      ::signal(SIGPIPE, SIG_DFL);

      ::dup2(stdinFd, STDIN_FILENO);
      ::dup2(stdoutFd, STDOUT_FILENO);
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0)
        ::dup2(devnull, STDERR_FILENO);

      char *const argv[] = {const_cast<char *>(exePath.c_str()), nullptr};
      if (exePath.find('/') == std::string::npos)
        ::execvp(exePath.c_str(), argv);
      else
        ::execv(exePath.c_str(), argv);
      _exit(127);
    }

    // Polls for exit for up to 'graceMs'. True once the child is gone.
    bool reapWithin(pid_t pid, int graceMs)
    {
      const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(graceMs);
      for (;;)
      {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR))
          return true;
        if (std::chrono::steady_clock::now() >= deadline)
          return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
  } // namespace

  bool UciEngineProcess::platformStart(const std::string &exePath)
  {
    ignoreSigpipe();
    m_impl.reset(new Impl()); // custom deleter type, so no make_unique

    PipePair in;  // parent writes, engine reads
    PipePair out; // engine writes, parent reads
    if (!in.open())
      return false;
    if (!out.open())
    {
      in.close();
      return false;
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
      in.close();
      out.close();
      return false;
    }
    if (pid == 0)
      execEngine(exePath, in.fd[0], out.fd[1]);

    closeFd(in.fd[0]);
    closeFd(out.fd[1]);
    m_impl->pid = pid;
    m_impl->toEngine = in.fd[1];
    m_impl->fromEngine = out.fd[0];
    return true;
  }

  void UciEngineProcess::platformShutdown()
  {
    if (!m_impl)
      return;

    // stdin EOF: the engine exits on its own
    closeFd(m_impl->toEngine);
    if (m_impl->pid <= 0)
      return;

    if (!reapWithin(m_impl->pid, kQuitGraceMs))
    {
      ::kill(m_impl->pid, SIGTERM);
      if (!reapWithin(m_impl->pid, kTermGraceMs))
      {
        ::kill(m_impl->pid, SIGKILL);
        int status = 0;
        while (::waitpid(m_impl->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
      }
    }
    m_impl->pid = -1;
  }

  void UciEngineProcess::platformRelease()
  {
    if (!m_impl)
      return;
    closeFd(m_impl->toEngine);
    closeFd(m_impl->fromEngine);
    m_impl.reset();
  }

  bool UciEngineProcess::platformWrite(const std::string &s)
  {
    if (!m_impl || m_impl->toEngine < 0)
      return false;

    std::size_t off = 0;
    while (off < s.size())
    {
      const ssize_t n = ::write(m_impl->toEngine, s.data() + off, s.size() - off);
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
        return false;
      off += static_cast<std::size_t>(n);
    }
    return true;
  }

  bool UciEngineProcess::platformReadLine(std::string &outLine)
  {
    outLine.clear();
    if (!m_impl || m_impl->fromEngine < 0)
      return false;

    std::string &buf = m_impl->pending;
    for (;;)
    {
      const auto nl = buf.find('\n');
      if (nl != std::string::npos)
      {
        outLine.assign(buf, 0, nl + 1);
        buf.erase(0, nl + 1);
        return true;
      }

      char chunk[4096];
      const ssize_t n = ::read(m_impl->fromEngine, chunk, sizeof(chunk));
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
      {
        // engine gone: hand out a final unterminated line once
        if (buf.empty())
          return false;
        outLine.swap(buf);
        buf.clear();
        return true;
      }
      buf.append(chunk, static_cast<std::size_t>(n));
    }
  }
} // namespace glyph::engine::uci

#endif // !_WIN32
