#pragma once
#include <stdexcept>
#include <string>

namespace gambit::engine::uci
{
  struct EngineError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // The engine executable could not be spawned. Fatal for the session.
  struct LaunchError : EngineError
  {
    using EngineError::EngineError;
  };

  // Writing to the engine's stdin failed, or the bridge is not running.
  // The session is desynchronized and should be stopped.
  struct ProtocolError : EngineError
  {
    using EngineError::EngineError;
  };
} // namespace gambit::engine::uci
