#pragma once

#include <string>
#include <string_view>

namespace gambit::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
  enum GameResult
  {
    ONGOING,
    CHECKMATE,
    REPETITION,
    MOVERULE,
    STALEMATE,
    INSUFFICIENT
  };

  inline std::string_view resultName(GameResult r)
  {
    switch (r)
    {
    case CHECKMATE:
      return "Checkmate";
    case REPETITION:
      return "Threefold repetition";
    case MOVERULE:
      return "Fifty-move rule";
    case STALEMATE:
      return "Stalemate";
    case INSUFFICIENT:
      return "Insufficient material";
    case ONGOING:
    default:
      return "Ongoing";
    }
  }

  // ------------------ Version ------------------
  inline constexpr std::string_view GAMBIT_VERSION{"Gambit 1.0v"};
}
