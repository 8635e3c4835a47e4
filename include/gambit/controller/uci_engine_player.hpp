#pragma once
#include <optional>
#include <string>

#include "gambit/controller/player.hpp" // IPlayer
#include "gambit/engine/uci/engine_bridge.hpp"
#include "gambit/engine/uci/engine_options.hpp"

namespace gambit::controller
{
  class UciEnginePlayer final : public IPlayer
  {
  public:
    explicit UciEnginePlayer(engine::uci::EngineOptions opts);
    ~UciEnginePlayer() override;

    // Throws engine::uci::LaunchError / ProtocolError.
    void start(const std::string &exePath);
    void stop() noexcept;

    void requestMove(const std::string &fen) override;
    std::optional<std::string> pollMove() override;
    bool hasExited() const override;

  private:
    engine::uci::EngineBridge m_bridge;
  };
} // namespace gambit::controller
