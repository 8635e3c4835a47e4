#include "gambit/engine/uci/platform_spawn.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gambit::engine::uci
{
  namespace
  {
    void closeFd(int &fd)
    {
      if (fd >= 0)
      {
        ::close(fd);
        fd = -1;
      }
    }

    void closePair(int (&p)[2])
    {
      closeFd(p[0]);
      closeFd(p[1]);
    }

    // A dead engine must surface as a failed write, not kill the whole program.
    void ignoreSigpipeOnce()
    {
      static const bool s_ignored = [] {
        ::signal(SIGPIPE, SIG_IGN);
        return true;
      }();
      (void)s_ignored;
    }
  } // namespace

  bool spawnWithPipes(const std::string &exePath, SpawnedProcess &out, std::string *outError)
  {
    ignoreSigpipeOnce();

    int inPipe[2]{-1, -1};   // child reads [0], parent writes [1]
    int outPipe[2]{-1, -1};  // parent reads [0], child writes [1]
    int execPipe[2]{-1, -1}; // child reports exec errno, closed by a successful exec

    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execPipe, O_CLOEXEC) != 0)
    {
      if (outError)
        *outError = std::string("pipe failed: ") + std::strerror(errno);
      closePair(inPipe);
      closePair(outPipe);
      closePair(execPipe);
      return false;
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
      if (outError)
        *outError = std::string("fork failed: ") + std::strerror(errno);
      closePair(inPipe);
      closePair(outPipe);
      closePair(execPipe);
      return false;
    }

    if (pid == 0)
    {
      // Child: dup2 clears close-on-exec on the standard descriptors only. stderr stays inherited.
      (void)::dup2(inPipe[0], STDIN_FILENO);
      (void)::dup2(outPipe[1], STDOUT_FILENO);

      char *const argv[] = {const_cast<char *>(exePath.c_str()), nullptr};
      ::execv(exePath.c_str(), argv);

      const int err = errno;
      (void)!::write(execPipe[1], &err, sizeof(err));
      _exit(127);
    }

    // Parent
    ::close(inPipe[0]);
    ::close(outPipe[1]);
    ::close(execPipe[1]);

    int childErr = 0;
    ssize_t n = 0;
    do
    {
      n = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n > 0)
    {
      if (outError)
        *outError = "cannot execute '" + exePath + "': " + std::strerror(childErr);
      ::close(inPipe[1]);
      ::close(outPipe[0]);
      int status = 0;
      (void)::waitpid(pid, &status, 0);
      return false;
    }

    out.pid = pid;
    out.stdinFd = inPipe[1];
    out.stdoutFd = outPipe[0];
    return true;
  }

  void terminateProcess(SpawnedProcess &p) noexcept
  {
    closeFd(p.stdinFd);

    if (p.pid > 0)
    {
      // SIGKILL cannot be ignored, so the blocking reap below is bounded.
      (void)::kill(p.pid, SIGKILL);
      int status = 0;
      pid_t r = -1;
      do
      {
        r = ::waitpid(p.pid, &status, 0);
      } while (r < 0 && errno == EINTR);
      p.pid = -1;
    }
  }
} // namespace gambit::engine::uci
