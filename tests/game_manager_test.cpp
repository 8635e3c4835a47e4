#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "gambit/controller/game_manager.hpp"
#include "gambit/model/chess_game.hpp"

using namespace gambit;
using controller::GameManager;

static core::Square sq(char file, int rank)
{
  return static_cast<core::Square>((rank - 1) * 8 + (file - 'a'));
}

static bool contains(const std::vector<core::Square> &v, core::Square s)
{
  return std::find(v.begin(), v.end(), s) != v.end();
}

// Every cached move starts on the selected square.
static void checkSelectionInvariant(const GameManager &gm)
{
  if (gm.selectedSquare() == core::NO_SQUARE)
  {
    assert(gm.selectedMoves().empty());
    return;
  }
  for (const auto &m : gm.selectedMoves())
    assert(m.from() == gm.selectedSquare());
}

int main()
{
  // Welcome message and initial state
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(gm.message() == "Welcome to Chess Terminal! You play as White.");
    assert(!gm.isThinking());
    assert(gm.isHumanTurn());
    assert(!gm.gameResult());

    model::ChessGame game2;
    GameManager black(game2, core::Color::Black);
    assert(black.message() == "Welcome to Chess Terminal! You play as Black.");
    assert(!black.isHumanTurn());
  }

  // Selecting e2 offers e3 and e4; moving clears the selection
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(!gm.select(sq('e', 2)));
    assert(gm.selectedSquare() == sq('e', 2));
    auto dests = gm.legalDestinations();
    assert(dests.size() == 2);
    assert(contains(dests, sq('e', 3)) && contains(dests, sq('e', 4)));
    checkSelectionInvariant(gm);

    assert(gm.select(sq('e', 4)));
    assert(gm.selectedSquare() == core::NO_SQUARE);
    assert(gm.selectedMoves().empty());
    assert(gm.sideToMove() == core::Color::Black);
    assert(gm.message() == "Move: e2e4");
    assert(!gm.isHumanTurn());
  }

  // Empty or enemy squares do not select; reselecting an own piece switches
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(!gm.select(sq('e', 4)));
    assert(gm.selectedSquare() == core::NO_SQUARE);
    assert(!gm.select(sq('e', 7)));
    assert(gm.selectedSquare() == core::NO_SQUARE);

    assert(!gm.select(sq('g', 1)));
    assert(!gm.select(sq('b', 1)));
    assert(gm.selectedSquare() == sq('b', 1));
    checkSelectionInvariant(gm);

    // Not a destination and not our piece: deselect, nothing moves
    const std::string fen = gm.currentFen();
    assert(!gm.select(sq('b', 5)));
    assert(gm.selectedSquare() == core::NO_SQUARE);
    assert(gm.currentFen() == fen);
    checkSelectionInvariant(gm);
  }

  // Engine reply after 1.e4
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(gm.select(sq('e', 2)) == false);
    assert(gm.select(sq('e', 4)));
    gm.setThinking(true);
    assert(gm.isThinking());
    assert(gm.message() == GameManager::THINKING_MESSAGE);

    assert(gm.applyEngineMove("e7e5"));
    assert(!gm.isThinking());
    assert(gm.sideToMove() == core::Color::White);
    assert(gm.message() == "Engine moved: e7e5");
    assert(gm.currentFen() == "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq e6 0 2");
  }

  // Undecodable replies change nothing
  {
    model::ChessGame game;
    GameManager gm(game);
    gm.select(sq('d', 2));
    gm.select(sq('d', 4));
    gm.setThinking(true);
    const std::string fen = gm.currentFen();
    const std::string msg = gm.message();

    assert(!gm.applyEngineMove("a1h8"));
    assert(!gm.applyEngineMove("zz"));
    assert(!gm.applyEngineMove("(none)"));
    assert(gm.currentFen() == fen);
    assert(gm.message() == msg);
    assert(gm.isThinking());
    assert(gm.sideToMove() == core::Color::Black);
  }

  // A reply cannot move for the human
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(!gm.applyEngineMove("e2e4"));
    assert(gm.currentFen() == core::START_FEN);
  }

  // Human input is ignored on the engine's turn
  {
    model::ChessGame game;
    GameManager gm(game);
    gm.select(sq('e', 2));
    gm.select(sq('e', 4));
    assert(!gm.select(sq('e', 7)));
    assert(gm.selectedSquare() == core::NO_SQUARE);
  }

  // Engine promotion
  {
    model::ChessGame game;
    GameManager gm(game, core::Color::Black);
    assert(gm.startGame("8/P3k3/8/8/8/8/8/4K3 w - - 0 1"));
    assert(gm.applyEngineMove("a7a8q"));
    assert(game.getPiece(sq('a', 8)).type == core::PieceType::Queen);
    assert(gm.message() == "Engine moved: a7a8q");
  }

  // Human promotion takes the first listed choice (queen)
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(gm.startGame("8/P3k3/8/8/8/8/8/4K3 w - - 0 1"));
    gm.select(sq('a', 7));
    assert(gm.select(sq('a', 8)));
    assert(game.getPiece(sq('a', 8)).type == core::PieceType::Queen);
    assert(gm.message() == "Move: a7a8q");
  }

  // setThinking(false) keeps the message
  {
    model::ChessGame game;
    GameManager gm(game);
    gm.setMessage("hello");
    gm.setThinking(false);
    assert(gm.message() == "hello");
    gm.setThinking(true);
    gm.setThinking(false);
    assert(!gm.isThinking());
    assert(gm.message() == GameManager::THINKING_MESSAGE);
  }

  // Results, and no selection once the game is over
  {
    model::ChessGame game;
    GameManager gm(game);
    assert(gm.startGame("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    assert(gm.gameResult() == core::GameResult::STALEMATE);

    assert(gm.startGame("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1"));
    gm.select(sq('a', 1));
    assert(gm.select(sq('a', 8)));
    assert(gm.gameResult() == core::GameResult::CHECKMATE);
    assert(!gm.select(sq('g', 1)));
    assert(gm.selectedSquare() == core::NO_SQUARE);
  }

  // Bad FEN keeps the current game
  {
    model::ChessGame game;
    GameManager gm(game);
    gm.select(sq('e', 2));
    gm.select(sq('e', 4));
    const std::string fen = gm.currentFen();
    assert(!gm.startGame("garbage"));
    assert(gm.currentFen() == fen);
  }

  // Snapshot mirrors the manager
  {
    model::ChessGame game;
    GameManager gm(game);
    gm.select(sq('g', 1));
    auto snap = gm.snapshot();
    assert(snap.fen == core::START_FEN);
    assert(snap.selected == sq('g', 1));
    assert(snap.legalDestinations.size() == 2);
    assert(snap.pieces[sq('e', 1)].type == core::PieceType::King);
    assert(snap.pieces[sq('e', 4)].isNone());
    assert(snap.sideToMove == core::Color::White);
    assert(!snap.result);
  }

  std::cout << "game_manager_test passed\n";
  return 0;
}
