#include "gambit/engine/uci/engine_bridge.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>

#include "gambit/engine/uci/engine_error.hpp"

namespace gambit::engine::uci
{
  EngineBridge::EngineBridge(EngineOptions opts) : m_opts(std::move(opts)) {}

  EngineBridge::~EngineBridge()
  {
    stop();
  }

  void EngineBridge::start(const std::string &exePath)
  {
    if (m_state != State::NotStarted)
      throw ProtocolError("engine bridge can only be started once");

    m_proc.start(exePath);

    auto [sender, receiver] = makeMoveChannel();
    m_moves = std::move(receiver);
    m_listener = std::thread(&EngineBridge::listen, m_proc.releaseOutput(), std::move(sender),
                             std::cref(m_stopListener), std::ref(m_exited));
    m_state = State::Running;

    std::cerr << "[EngineBridge] started " << exePath << "\n";
    sendHandshake();
  }

  void EngineBridge::sendHandshake()
  {
    const std::string lines[] = {
        "uci",
        "isready",
        "setoption name Skill Level value " + std::to_string(m_opts.skillLevel),
        "setoption name Threads value " + std::to_string(m_opts.threads),
        "setoption name Hash value " + std::to_string(m_opts.hashMb),
        "setoption name UCI_AnalyseMode value false",
        "setoption name UCI_LimitStrength value false",
    };
    for (const auto &line : lines)
    {
      if (!m_proc.sendLine(line))
        throw ProtocolError("handshake write failed: " + line);
    }
  }

  void EngineBridge::requestMove(const std::string &fen)
  {
    if (m_state != State::Running)
      throw ProtocolError("engine bridge is not running");

    std::ostringstream go;
    go << "go movetime " << m_opts.movetimeMs;
    if (!m_proc.sendLines("position fen " + fen, go.str()))
      throw ProtocolError("failed to send search request");
  }

  std::optional<std::string> EngineBridge::pollMove()
  {
    if (m_state != State::Running)
      return std::nullopt;
    return m_moves.tryReceive();
  }

  void EngineBridge::stop() noexcept
  {
    if (m_state != State::Running)
    {
      m_state = State::Stopped;
      return;
    }

    // Close the consumer first so nothing produced from here on is delivered.
    m_moves.close();
    m_proc.stop();

    m_stopListener.store(true);
    if (m_listener.joinable())
      m_listener.join();

    m_state = State::Stopped;
  }

  void EngineBridge::listen(int fd, MoveSender sender, const std::atomic_bool &stopFlag,
                            std::atomic_bool &exited)
  {
    PipeLineReader reader(fd);
    std::string line;
    while (reader.readLine(line, &stopFlag))
    {
      constexpr std::string_view KEYWORD = "bestmove";
      if (line.rfind(KEYWORD, 0) != 0)
        continue;
      if (line.size() > KEYWORD.size() &&
          !std::isspace(static_cast<unsigned char>(line[KEYWORD.size()])))
        continue;

      std::istringstream iss(line.substr(KEYWORD.size()));
      std::string move;
      if (iss >> move)
        (void)sender.send(std::move(move)); // receiver gone: keep draining until EOF
    }
    exited.store(true);
  }
} // namespace gambit::engine::uci
