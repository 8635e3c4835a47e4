#include "gambit/engine/uci/uci_engine_process.hpp"

#include <cerrno>

#include <poll.h>
#include <unistd.h>

#include "gambit/engine/uci/engine_error.hpp"

namespace gambit::engine::uci
{
  UciEngineProcess::~UciEngineProcess()
  {
    stop();
    if (m_proc.stdoutFd >= 0)
      ::close(m_proc.stdoutFd);
  }

  void UciEngineProcess::start(const std::string &exePath)
  {
    if (isRunning())
      throw LaunchError("engine process already running");

    std::string err;
    if (!spawnWithPipes(exePath, m_proc, &err))
      throw LaunchError(err);
  }

  int UciEngineProcess::releaseOutput()
  {
    const int fd = m_proc.stdoutFd;
    m_proc.stdoutFd = -1;
    return fd;
  }

  bool UciEngineProcess::sendLine(const std::string &line)
  {
    // UCI requires \n; many engines tolerate \r\n.
    return platformWrite(line + "\n");
  }

  bool UciEngineProcess::sendLines(const std::string &first, const std::string &second)
  {
    return platformWrite(first + "\n" + second + "\n");
  }

  void UciEngineProcess::stop() noexcept
  {
    if (!isRunning())
      return;
    // The child gets killed right after; a failed quit changes nothing.
    (void)platformWrite("quit\n");
    terminateProcess(m_proc);
  }

  bool UciEngineProcess::platformWrite(const std::string &s)
  {
    if (m_proc.stdinFd < 0)
      return false;

    const char *p = s.data();
    size_t remaining = s.size();

    while (remaining > 0)
    {
      ssize_t n = ::write(m_proc.stdinFd, p, remaining);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        return false;
      }
      p += n;
      remaining -= static_cast<size_t>(n);
    }
    return true;
  }

  PipeLineReader::~PipeLineReader()
  {
    if (m_fd >= 0)
      ::close(m_fd);
  }

  bool PipeLineReader::readLine(std::string &outLine, const std::atomic_bool *cancel)
  {
    outLine.clear();
    if (m_fd < 0)
      return false;

    for (;;)
    {
      auto pos = m_buf.find('\n');
      if (pos != std::string::npos)
      {
        outLine = m_buf.substr(0, pos);
        m_buf.erase(0, pos + 1);
        break;
      }

      if (cancel)
      {
        if (cancel->load())
          return false;
        pollfd pfd{m_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 50);
        if (ready < 0 && errno != EINTR)
          return false;
        if (ready <= 0)
          continue;
      }

      char tmp[4096];
      ssize_t n = ::read(m_fd, tmp, sizeof(tmp));
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        return false;
      }
      if (n == 0)
      {
        if (m_buf.empty())
          return false;
        outLine = std::move(m_buf);
        m_buf.clear();
        break;
      }
      m_buf.append(tmp, tmp + n);
    }

    // Normalize CRLF
    while (!outLine.empty() && outLine.back() == '\r')
      outLine.pop_back();
    return true;
  }
} // namespace gambit::engine::uci
