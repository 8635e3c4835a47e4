#pragma once

#include <iosfwd>
#include <string>

#include "gambit/chess_types.hpp"
#include "gambit/constants.hpp"
#include "gambit/engine/uci/engine_options.hpp"

namespace gambit::app {

struct Options {
  std::string enginePath = "/usr/games/stockfish";
  engine::uci::EngineOptions engine;
  std::string fen = core::START_FEN;
  core::Color humanColor = core::Color::White;
  int tickMs = 250;
  std::string fontPath;  // SFML front end only
  bool help = false;
};

// Throws std::invalid_argument on unknown flags, missing or malformed values.
Options parseArgs(int argc, char** argv);

void printUsage(std::ostream& os);

}  // namespace gambit::app
