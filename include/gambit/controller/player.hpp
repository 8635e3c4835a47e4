#pragma once

#include <optional>
#include <string>

namespace gambit::controller
{

  // The non-human side of the board. Requests are fire-and-forget; replies are polled.
  struct IPlayer
  {
    virtual ~IPlayer() = default;

    // Starts a search on `fen`. May throw engine::uci::EngineError.
    virtual void requestMove(const std::string &fen) = 0;
    // UCI notation of the next finished search, if one is ready.
    virtual std::optional<std::string> pollMove() = 0;
    virtual bool hasExited() const = 0;
  };

} // namespace gambit::controller
