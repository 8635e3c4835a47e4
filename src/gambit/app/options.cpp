#include "gambit/app/options.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace gambit::app {

namespace {

int parseInt(const std::string& value, const char* name, int lo, int hi) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(value, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + value);
  }
  if (used != value.size() || v < lo || v > hi)
    throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + value);
  return v;
}

}  // namespace

void printUsage(std::ostream& os) {
  os << "Usage: gambit [options]\n"
        "Options:\n"
        "  --engine <path>           UCI engine binary (default /usr/games/stockfish)\n"
        "  --skill <0..20>           Engine Skill Level (default 10)\n"
        "  --threads <N>             Engine Threads (default 4)\n"
        "  --hash <MB>               Engine Hash size (default 128)\n"
        "  --movetime <ms>           Engine think time per move (default 2000)\n"
        "  --fen <FEN>               Start position (default standard start)\n"
        "  --color white|black       Side you play (default white)\n"
        "  --tick <ms>               Interaction loop tick (default 250)\n"
        "  --font <path>             Font for the board window (piece letters, status)\n"
        "  --help                    Show this text\n";
}

Options parseArgs(int argc, char** argv) {
  Options o;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) throw std::invalid_argument(std::string("Missing value for ") + name);
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      o.help = true;
    } else if (arg == "--engine") {
      o.enginePath = require_value(i, "--engine");
    } else if (arg == "--skill") {
      o.engine.skillLevel = parseInt(require_value(i, "--skill"), "--skill", 0, 20);
    } else if (arg == "--threads") {
      o.engine.threads = parseInt(require_value(i, "--threads"), "--threads", 1, 1024);
    } else if (arg == "--hash") {
      o.engine.hashMb = parseInt(require_value(i, "--hash"), "--hash", 1, 1 << 20);
    } else if (arg == "--movetime") {
      o.engine.movetimeMs = parseInt(require_value(i, "--movetime"), "--movetime", 1, 3600000);
    } else if (arg == "--fen") {
      o.fen = require_value(i, "--fen");
    } else if (arg == "--color") {
      const std::string c = require_value(i, "--color");
      if (c == "white" || c == "w")
        o.humanColor = core::Color::White;
      else if (c == "black" || c == "b")
        o.humanColor = core::Color::Black;
      else
        throw std::invalid_argument("Invalid value for --color: " + c);
    } else if (arg == "--tick") {
      o.tickMs = parseInt(require_value(i, "--tick"), "--tick", 1, 10000);
    } else if (arg == "--font") {
      o.fontPath = require_value(i, "--font");
    } else {
      throw std::invalid_argument("Unknown option: " + arg);
    }
  }

  return o;
}

}  // namespace gambit::app
