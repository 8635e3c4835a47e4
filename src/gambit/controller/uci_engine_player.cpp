#include "gambit/controller/uci_engine_player.hpp"

#include <utility>

namespace gambit::controller
{
  UciEnginePlayer::UciEnginePlayer(engine::uci::EngineOptions opts)
      : m_bridge(std::move(opts))
  {
  }

  UciEnginePlayer::~UciEnginePlayer()
  {
    m_bridge.stop();
  }

  void UciEnginePlayer::start(const std::string &exePath)
  {
    m_bridge.start(exePath);
  }

  void UciEnginePlayer::stop() noexcept
  {
    m_bridge.stop();
  }

  void UciEnginePlayer::requestMove(const std::string &fen)
  {
    m_bridge.requestMove(fen);
  }

  std::optional<std::string> UciEnginePlayer::pollMove()
  {
    return m_bridge.pollMove();
  }

  bool UciEnginePlayer::hasExited() const
  {
    return m_bridge.engineExited();
  }
} // namespace gambit::controller
