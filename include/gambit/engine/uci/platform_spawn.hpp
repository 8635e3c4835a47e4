#pragma once
#include <string>

#include <sys/types.h>

namespace gambit::engine::uci
{
  struct SpawnedProcess
  {
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1}; // child's stdout
  };

  // Starts exePath without arguments. Fails (false + outError) if the pipes cannot be created,
  // fork fails, or the child cannot exec the file.
  bool spawnWithPipes(const std::string &exePath, SpawnedProcess &out, std::string *outError = nullptr);

  // Closes stdin, kills the child and reaps it. Never blocks on a live child.
  // stdoutFd is left alone: whoever reads it closes it.
  void terminateProcess(SpawnedProcess &p) noexcept;

} // namespace gambit::engine::uci
