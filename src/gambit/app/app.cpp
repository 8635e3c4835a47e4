#include "gambit/app/app.hpp"

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <utility>

#include "gambit/controller/game_controller.hpp"
#include "gambit/controller/game_manager.hpp"
#include "gambit/controller/uci_engine_player.hpp"
#include "gambit/engine/uci/engine_error.hpp"
#include "gambit/model/chess_game.hpp"

#ifdef GAMBIT_SFML_UI
#include "gambit/view/board_window.hpp"
#else
#include "gambit/view/terminal_input.hpp"
#include "gambit/view/terminal_view.hpp"
#endif

namespace gambit::app {

#ifndef GAMBIT_SFML_UI
namespace {

bool sameFrame(const controller::GameSnapshot& a, const controller::GameSnapshot& b) {
  return a.fen == b.fen && a.selected == b.selected && a.message == b.message &&
         a.thinking == b.thinking && a.legalDestinations == b.legalDestinations;
}

}  // namespace
#endif

App::App(Options opts) : m_opts(std::move(opts)) {}

int App::run() {
  model::ChessGame chessGame;
  controller::GameManager gameManager(chessGame, m_opts.humanColor);
  if (!gameManager.startGame(m_opts.fen)) {
    std::cerr << "Invalid FEN: " << m_opts.fen << "\n";
    return 1;
  }

  controller::UciEnginePlayer enginePlayer(m_opts.engine);
  try {
    enginePlayer.start(m_opts.enginePath);
  } catch (const engine::uci::EngineError& e) {
    std::cerr << "Failed to start engine: " << e.what() << "\n";
    enginePlayer.stop();
    return 1;
  }

  controller::GameController gameController(gameManager, enginePlayer);
  gameController.start();

#ifdef GAMBIT_SFML_UI
  view::BoardWindow window(m_opts.fontPath);
  while (window.isOpen()) {
    if (!gameController.tick(window.pollEvents())) break;
    window.render(gameManager.snapshot());
  }
#else
  view::TerminalView terminalView(std::cout);
  view::TerminalInput terminalInput(STDIN_FILENO);
  const std::chrono::milliseconds tick(m_opts.tickMs);
  controller::GameSnapshot last;
  bool drawn = false;

  while (true) {
    auto snap = gameManager.snapshot();
    if (!drawn || !sameFrame(snap, last)) {
      terminalView.render(snap);
      last = std::move(snap);
      drawn = true;
    }
    if (!gameController.tick(terminalInput.poll(tick))) break;
  }
#endif

  enginePlayer.stop();
  return 0;
}

}  // namespace gambit::app
