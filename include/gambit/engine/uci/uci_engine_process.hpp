#pragma once

#include <atomic>
#include <string>

#include "gambit/engine/uci/platform_spawn.hpp"

namespace gambit::engine::uci
{
  // Owns the engine's pid and the write end of its stdin. The stdout pipe is handed out
  // once (releaseOutput) and never read here.
  class UciEngineProcess
  {
  public:
    UciEngineProcess() = default;
    ~UciEngineProcess();

    UciEngineProcess(const UciEngineProcess &) = delete;
    UciEngineProcess &operator=(const UciEngineProcess &) = delete;
    UciEngineProcess(UciEngineProcess &&) = delete;
    UciEngineProcess &operator=(UciEngineProcess &&) = delete;

    // Throws LaunchError.
    void start(const std::string &exePath);

    // Transfers ownership of the stdout read descriptor to the caller (-1 if already taken).
    int releaseOutput();

    // One newline-terminated line per entry, issued as a single write.
    // False on any write failure or when no process is running.
    bool sendLine(const std::string &line);
    bool sendLines(const std::string &first, const std::string &second);

    // Best-effort "quit", then kill and reap. Safe to call repeatedly.
    void stop() noexcept;

    bool isRunning() const { return m_proc.pid > 0; }

  private:
    bool platformWrite(const std::string &s);

    SpawnedProcess m_proc;
  };

  // Owns a read descriptor and splits it into lines. Closes the descriptor on destruction.
  class PipeLineReader
  {
  public:
    explicit PipeLineReader(int fd) : m_fd(fd) {}
    ~PipeLineReader();

    PipeLineReader(const PipeLineReader &) = delete;
    PipeLineReader &operator=(const PipeLineReader &) = delete;

    // Next line without its CR/LF. A trailing unterminated line is returned before EOF.
    // False at end of stream, on a read error, or once `cancel` becomes true.
    bool readLine(std::string &outLine, const std::atomic_bool *cancel = nullptr);

  private:
    int m_fd{-1};
    std::string m_buf;
  };
} // namespace gambit::engine::uci
