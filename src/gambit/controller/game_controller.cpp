#include "gambit/controller/game_controller.hpp"

#include <iostream>
#include <string>

#include "gambit/constants.hpp"
#include "gambit/controller/game_manager.hpp"
#include "gambit/controller/player.hpp"
#include "gambit/engine/uci/engine_error.hpp"

namespace gambit::controller {

GameController::GameController(GameManager& manager, IPlayer& engine)
    : m_manager(manager), m_engine(engine) {}

void GameController::start() {
  if (!announceResult()) requestEngineMoveIfDue();
}

bool GameController::tick(const std::vector<InputEvent>& events) {
  pollEngine();
  handleInput(events);
  if (m_quit) return false;
  requestEngineMoveIfDue();
  checkEngineHealth();
  return true;
}

void GameController::pollEngine() {
  auto reply = m_engine.pollMove();
  if (!reply) return;

  if (!m_manager.applyEngineMove(*reply)) {
    std::cerr << "[GameController] discarded engine reply '" << *reply << "'\n";
    return;
  }
  announceResult();
}

void GameController::handleInput(const std::vector<InputEvent>& events) {
  for (const auto& ev : events) {
    if (ev.kind == InputKind::Quit) {
      m_quit = true;
      return;
    }
    if (m_manager.select(ev.square)) announceResult();
  }
}

void GameController::requestEngineMoveIfDue() {
  if (m_manager.isThinking() || m_manager.isHumanTurn() || m_manager.gameResult()) return;
  if (m_engine_failed || m_engine.hasExited()) return;

  m_manager.setThinking(true);
  try {
    m_engine.requestMove(m_manager.currentFen());
  } catch (const engine::uci::EngineError& e) {
    std::cerr << "[GameController] move request failed: " << e.what() << "\n";
    m_engine_failed = true;
    m_manager.setThinking(false);
    m_manager.setMessage(std::string("Engine error: ") + e.what());
  }
}

void GameController::checkEngineHealth() {
  if (m_exit_reported || !m_engine.hasExited()) return;
  m_exit_reported = true;
  std::cerr << "[GameController] engine process exited\n";
  if (m_manager.isThinking()) {
    m_manager.setThinking(false);
    m_manager.setMessage("Engine error: engine process exited");
  }
}

bool GameController::announceResult() {
  auto res = m_manager.gameResult();
  if (!res) return false;
  m_manager.setMessage("Game over: " + std::string(core::resultName(*res)));
  return true;
}

}  // namespace gambit::controller
