#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/constants.hpp"
#include "gambit/model/core/model_types.hpp"

namespace gambit::controller
{

  // Read-only view of the game handed to renderers.
  struct GameSnapshot
  {
    std::array<model::bb::Piece, 64> pieces{};
    std::string fen;
    core::Square selected{core::NO_SQUARE};
    std::vector<core::Square> legalDestinations;
    std::string message;
    bool thinking{false};
    core::Color sideToMove{core::Color::White};
    core::Color humanColor{core::Color::White};
    std::optional<core::GameResult> result;
  };

  enum class InputKind
  {
    Square,
    Quit
  };

  struct InputEvent
  {
    InputKind kind{InputKind::Quit};
    core::Square square{core::NO_SQUARE};
  };

} // namespace gambit::controller
