#undef NDEBUG
#include <cassert>
#include <deque>
#include <iostream>
#include <string>
#include <vector>

#include "gambit/controller/game_controller.hpp"
#include "gambit/controller/game_manager.hpp"
#include "gambit/controller/player.hpp"
#include "gambit/engine/uci/engine_error.hpp"
#include "gambit/model/chess_game.hpp"

using namespace gambit;
using controller::InputEvent;
using controller::InputKind;

static core::Square sq(char file, int rank)
{
  return static_cast<core::Square>((rank - 1) * 8 + (file - 'a'));
}

static InputEvent click(char file, int rank)
{
  return {InputKind::Square, sq(file, rank)};
}

// Scripted engine: records requests, hands out queued replies.
struct FakeEngine : controller::IPlayer
{
  std::vector<std::string> requests;
  int attempts = 0;
  std::deque<std::string> replies;
  bool exited = false;
  bool failRequests = false;

  void requestMove(const std::string &fen) override
  {
    ++attempts;
    if (failRequests)
      throw engine::uci::ProtocolError("write to engine failed");
    requests.push_back(fen);
  }
  std::optional<std::string> pollMove() override
  {
    if (replies.empty())
      return std::nullopt;
    std::string r = replies.front();
    replies.pop_front();
    return r;
  }
  bool hasExited() const override { return exited; }
};

int main()
{
  // Human move triggers exactly one request; no second request while thinking
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    gc.start();
    assert(eng.requests.empty());

    assert(gc.tick({click('e', 2), click('e', 4)}));
    assert(eng.requests.size() == 1);
    assert(eng.requests[0] == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    assert(gm.isThinking());
    assert(gm.message() == "Engine is thinking...");

    for (int i = 0; i < 5; ++i)
      assert(gc.tick({}));
    assert(eng.requests.size() == 1);

    // Clicks during the engine's turn do nothing
    assert(gc.tick({click('e', 7), click('e', 5)}));
    assert(gm.sideToMove() == core::Color::Black);

    eng.replies.push_back("e7e5");
    assert(gc.tick({}));
    assert(!gm.isThinking());
    assert(gm.message() == "Engine moved: e7e5");
    assert(gm.sideToMove() == core::Color::White);
    assert(eng.requests.size() == 1);
  }

  // The engine reply is applied before the same tick's input
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    gc.tick({click('e', 2), click('e', 4)});
    eng.replies.push_back("e7e5");
    assert(gc.tick({click('g', 1), click('f', 3)}));
    assert(game.getPiece(sq('f', 3)).type == core::PieceType::Knight);
    assert(gm.message() == "Engine is thinking...");
    assert(eng.requests.size() == 2);
    assert(gm.isThinking());
  }

  // At most one reply is consumed per tick
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    gc.tick({click('e', 2), click('e', 4)});
    eng.replies.push_back("a1h8");
    eng.replies.push_back("c7c5");
    const std::string fen = gm.currentFen();
    assert(gc.tick({}));
    assert(gm.currentFen() == fen);
    assert(gm.isThinking());
    assert(gc.tick({}));
    assert(gm.message() == "Engine moved: c7c5");
  }

  // Engine plays first when the human has Black
  {
    model::ChessGame game;
    controller::GameManager gm(game, core::Color::Black);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    gc.start();
    assert(eng.requests.size() == 1 && eng.requests[0] == core::START_FEN);
    assert(gm.isThinking());
  }

  // Request failure is reported and clears the thinking flag
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    eng.failRequests = true;
    controller::GameController gc(gm, eng);
    assert(gc.tick({click('d', 2), click('d', 4)}));
    assert(!gm.isThinking());
    assert(gm.message() == "Engine error: write to engine failed");

    // A broken session is not written to again
    for (int i = 0; i < 10; ++i)
      assert(gc.tick({}));
    assert(eng.attempts == 1);
    assert(gm.message() == "Engine error: write to engine failed");
    assert(!gm.isThinking());
  }

  // Game over after the human's mating move: no request
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    assert(gm.startGame("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1"));
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    assert(gc.tick({click('a', 1), click('a', 8)}));
    assert(gm.message() == "Game over: Checkmate");
    assert(eng.requests.empty());
    assert(!gm.isThinking());
  }

  // Game over after the engine's move
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    gc.tick({click('f', 2), click('f', 3)});
    eng.replies.push_back("e7e5");
    gc.tick({click('g', 2), click('g', 4)});
    eng.replies.push_back("d8h4");
    gc.tick({});
    assert(gm.gameResult() == core::GameResult::CHECKMATE);
    assert(gm.message() == "Game over: Checkmate");
    assert(eng.requests.size() == 2);
  }

  // Engine exit while thinking
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    gc.tick({click('e', 2), click('e', 4)});
    eng.exited = true;
    assert(gc.tick({}));
    assert(!gm.isThinking());
    assert(gm.message() == "Engine error: engine process exited");
  }

  // Quit stops the loop and skips the rest of the events
  {
    model::ChessGame game;
    controller::GameManager gm(game);
    FakeEngine eng;
    controller::GameController gc(gm, eng);
    assert(!gc.tick({{InputKind::Quit, core::NO_SQUARE}, click('e', 2)}));
    assert(gc.quitRequested());
    assert(gm.selectedSquare() == core::NO_SQUARE);
  }

  std::cout << "game_controller_test passed\n";
  return 0;
}
