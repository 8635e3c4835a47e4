#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gambit/app/options.hpp"

using namespace gambit;

static app::Options parse(std::vector<std::string> args)
{
  args.insert(args.begin(), "gambit");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  return app::parseArgs(static_cast<int>(argv.size()), argv.data());
}

static bool rejects(std::vector<std::string> args)
{
  try
  {
    parse(std::move(args));
  }
  catch (const std::invalid_argument &)
  {
    return true;
  }
  return false;
}

int main()
{
  // Defaults
  {
    auto o = parse({});
    assert(o.enginePath == "/usr/games/stockfish");
    assert(o.engine.skillLevel == 10);
    assert(o.engine.threads == 4);
    assert(o.engine.hashMb == 128);
    assert(o.engine.movetimeMs == 2000);
    assert(o.fen == core::START_FEN);
    assert(o.humanColor == core::Color::White);
    assert(o.tickMs == 250);
    assert(!o.help);
  }

  // Every flag
  {
    auto o = parse({"--engine", "/opt/sf", "--skill", "3", "--threads", "1", "--hash", "16",
                    "--movetime", "500", "--fen", "4k3/8/8/8/8/8/8/4K3 w - - 0 1", "--color",
                    "black", "--tick", "100", "--font", "/tmp/f.ttf", "--help"});
    assert(o.enginePath == "/opt/sf");
    assert(o.engine.skillLevel == 3);
    assert(o.engine.threads == 1);
    assert(o.engine.hashMb == 16);
    assert(o.engine.movetimeMs == 500);
    assert(o.fen == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
    assert(o.humanColor == core::Color::Black);
    assert(o.tickMs == 100);
    assert(o.fontPath == "/tmp/f.ttf");
    assert(o.help);
  }

  // Bad input
  {
    assert(rejects({"--skill", "21"}));
    assert(rejects({"--skill", "ten"}));
    assert(rejects({"--threads", "0"}));
    assert(rejects({"--movetime", "5ms"}));
    assert(rejects({"--color", "red"}));
    assert(rejects({"--engine"}));
    assert(rejects({"--bogus"}));
  }

  // Usage lists the flags
  {
    std::ostringstream os;
    app::printUsage(os);
    const std::string text = os.str();
    for (const char *flag : {"--engine", "--skill", "--threads", "--hash", "--movetime", "--fen",
                             "--color", "--tick", "--font", "--help"})
      assert(text.find(flag) != std::string::npos);
  }

  std::cout << "options_test passed\n";
  return 0;
}
