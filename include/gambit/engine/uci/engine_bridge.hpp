#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <thread>

#include "gambit/engine/uci/engine_options.hpp"
#include "gambit/engine/uci/move_channel.hpp"
#include "gambit/engine/uci/uci_engine_process.hpp"

namespace gambit::engine::uci
{
  // Single owner of an external UCI engine: its process, its stdin, and the listener thread
  // that turns "bestmove" lines into queued move notations.
  //
  // NotStarted -> Running -> Stopped. A stopped bridge cannot be started again.
  // Overlapping requestMove calls are not guarded against; callers keep at most one
  // search outstanding.
  class EngineBridge
  {
  public:
    enum class State
    {
      NotStarted,
      Running,
      Stopped
    };

    explicit EngineBridge(EngineOptions opts = {});
    ~EngineBridge();

    EngineBridge(const EngineBridge &) = delete;
    EngineBridge &operator=(const EngineBridge &) = delete;

    // Spawns the engine, starts the listener and sends the handshake.
    // Throws LaunchError if the process cannot be spawned (state stays NotStarted) and
    // ProtocolError if the handshake cannot be written (state is Running; stop it).
    void start(const std::string &exePath);

    // "position fen <fen>" + "go movetime <ms>". Does not wait for the reply.
    // Throws ProtocolError on write failure or when not Running.
    void requestMove(const std::string &fen);

    // Next queued move notation, if any. Never blocks.
    std::optional<std::string> pollMove();

    // quit, kill, reap, join. Queued and in-flight replies are discarded. Never throws.
    void stop() noexcept;

    State state() const { return m_state; }
    // The engine's output stream has closed (process exited or crashed).
    bool engineExited() const { return m_exited.load(); }

  private:
    void sendHandshake();

    static void listen(int fd, MoveSender sender, const std::atomic_bool &stopFlag,
                       std::atomic_bool &exited);

    EngineOptions m_opts;
    State m_state{State::NotStarted};
    UciEngineProcess m_proc;
    MoveReceiver m_moves;
    std::thread m_listener;
    std::atomic_bool m_stopListener{false};
    std::atomic_bool m_exited{false};
  };
} // namespace gambit::engine::uci
