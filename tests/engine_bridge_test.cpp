#undef NDEBUG
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

#include "gambit/engine/uci/engine_bridge.hpp"
#include "gambit/engine/uci/engine_error.hpp"

using namespace gambit::engine::uci;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Fake engines are small shell scripts that log what they receive and answer "go" with a
// scripted reply.
static std::string writeScript(const fs::path &dir, const std::string &name,
                               const std::string &onGo, const std::string &logFile)
{
  const fs::path path = dir / name;
  std::ofstream out(path);
  out << "#!/bin/sh\n"
         "while IFS= read -r line; do\n"
         "  echo \"$line\" >> '"
      << logFile << "'\n"
                    "  case \"$line\" in\n"
                    "    uci) echo 'id name Fake'; echo 'uciok' ;;\n"
                    "    isready) echo 'readyok' ;;\n"
                    "    go*) "
      << onGo << " ;;\n"
                 "    quit) exit 0 ;;\n"
                 "  esac\n"
                 "done\n";
  out.close();
  ::chmod(path.c_str(), 0755);
  return path.string();
}

static std::optional<std::string> waitForMove(EngineBridge &bridge,
                                              std::chrono::milliseconds limit = 5000ms)
{
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline)
  {
    if (auto m = bridge.pollMove())
      return m;
    std::this_thread::sleep_for(10ms);
  }
  return std::nullopt;
}

static std::vector<std::string> readLines(const fs::path &p)
{
  std::ifstream in(p);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  return lines;
}

int main()
{
  char tmpl[] = "/tmp/gambit_bridge_XXXXXX";
  const char *made = ::mkdtemp(tmpl);
  assert(made);
  const fs::path dir(made);

  // Missing and non-executable engines fail to launch
  {
    EngineBridge bridge;
    bool threw = false;
    try
    {
      bridge.start((dir / "no_such_engine").string());
    }
    catch (const LaunchError &)
    {
      threw = true;
    }
    assert(threw);
    assert(bridge.state() == EngineBridge::State::NotStarted);
    assert(!bridge.pollMove());

    const fs::path plain = dir / "plain.txt";
    std::ofstream(plain) << "not a program\n";
    ::chmod(plain.c_str(), 0644);
    threw = false;
    try
    {
      bridge.start(plain.string());
    }
    catch (const LaunchError &)
    {
      threw = true;
    }
    assert(threw);
  }

  // Requests need a running bridge
  {
    EngineBridge bridge;
    bool threw = false;
    try
    {
      bridge.requestMove("8/8/8/8/8/8/8/8 w - - 0 1");
    }
    catch (const ProtocolError &)
    {
      threw = true;
    }
    assert(threw);
  }

  // Handshake, request, bestmove delivery with info lines and ponder ignored
  {
    const fs::path log = dir / "basic.log";
    const std::string exe = writeScript(
        dir, "basic.sh", "echo 'info depth 1 score cp 20'; echo 'bestmove e7e5 ponder g1f3'",
        log.string());

    EngineOptions opts;
    opts.movetimeMs = 150;
    EngineBridge bridge(opts);
    bridge.start(exe);
    assert(bridge.state() == EngineBridge::State::Running);
    assert(!bridge.pollMove());

    const std::string fen = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";
    bridge.requestMove(fen);
    auto move = waitForMove(bridge);
    assert(move && *move == "e7e5");
    assert(!bridge.pollMove());

    const auto lines = readLines(log);
    const std::vector<std::string> expected = {
        "uci",
        "isready",
        "setoption name Skill Level value 10",
        "setoption name Threads value 4",
        "setoption name Hash value 128",
        "setoption name UCI_AnalyseMode value false",
        "setoption name UCI_LimitStrength value false",
        "position fen " + fen,
        "go movetime 150",
    };
    assert(lines == expected);

    // Second search on the same session
    bridge.requestMove(fen);
    move = waitForMove(bridge);
    assert(move && *move == "e7e5");

    bridge.stop();
    assert(bridge.state() == EngineBridge::State::Stopped);
    bridge.stop();
  }

  // CRLF output, look-alike keywords, indented keywords and stderr ignored, replies queued
  // in order
  {
    const std::string exe =
        writeScript(dir, "crlf.sh",
                    "printf 'bestmovex a2a3\\r\\n'; printf 'info string bestmove b2b3\\r\\n'; "
                    "printf '  bestmove a2a4\\n'; echo 'bestmove h7h6' >&2; "
                    "printf 'bestmove d7d5\\r\\n'",
                    (dir / "crlf.log").string());
    EngineBridge bridge;
    bridge.start(exe);
    bridge.requestMove("startpos-is-not-checked");
    bridge.requestMove("startpos-is-not-checked");
    auto first = waitForMove(bridge);
    auto second = waitForMove(bridge);
    assert(first && *first == "d7d5");
    assert(second && *second == "d7d5");
    assert(!bridge.pollMove());
  }

  // Stop while a search is outstanding: no late notification, no hang
  {
    const std::string exe =
        writeScript(dir, "slow.sh", "sleep 1; echo 'bestmove e7e5'", (dir / "slow.log").string());
    EngineBridge bridge;
    bridge.start(exe);
    bridge.requestMove("fen");
    const auto t0 = std::chrono::steady_clock::now();
    bridge.stop();
    assert(std::chrono::steady_clock::now() - t0 < 3s);
    std::this_thread::sleep_for(1500ms);
    assert(!bridge.pollMove());

    bool threw = false;
    try
    {
      bridge.requestMove("fen");
    }
    catch (const ProtocolError &)
    {
      threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
      bridge.start(exe);
    }
    catch (const ProtocolError &)
    {
      threw = true;
    }
    assert(threw);
  }

  // Replies queued before stop are dropped
  {
    const std::string exe =
        writeScript(dir, "fast.sh", "echo 'bestmove c7c5'", (dir / "fast.log").string());
    EngineBridge bridge;
    bridge.start(exe);
    bridge.requestMove("fen");
    std::this_thread::sleep_for(500ms);
    bridge.stop();
    assert(!bridge.pollMove());
  }

  // Engine that dies on "go" is reported as exited
  {
    const std::string exe = writeScript(dir, "crash.sh", "exit 3", (dir / "crash.log").string());
    EngineBridge bridge;
    bridge.start(exe);
    assert(!bridge.engineExited());
    bridge.requestMove("fen");

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!bridge.engineExited() && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(10ms);
    assert(bridge.engineExited());
    assert(!bridge.pollMove());
  }

  // Destructor alone shuts a busy engine down
  {
    const std::string exe = writeScript(dir, "slow2.sh", "sleep 2; echo 'bestmove e7e5'",
                                        (dir / "slow2.log").string());
    const auto t0 = std::chrono::steady_clock::now();
    {
      EngineBridge bridge;
      bridge.start(exe);
      bridge.requestMove("fen");
    }
    assert(std::chrono::steady_clock::now() - t0 < 2s);
  }

  std::error_code ec;
  fs::remove_all(dir, ec);

  std::cout << "engine_bridge_test passed\n";
  return 0;
}
