#pragma once

#include <vector>

#include "gambit/controller/game_controller_types.hpp"

namespace gambit::controller {

class GameManager;
struct IPlayer;

// Drives one game between the human (through input events) and an engine player.
class GameController {
 public:
  GameController(GameManager& manager, IPlayer& engine);

  // Requests the engine's move when it is to play first.
  void start();

  // One interaction-loop iteration. Returns false once the user asked to quit.
  bool tick(const std::vector<InputEvent>& events);

  [[nodiscard]] bool quitRequested() const { return m_quit; }

 private:
  void pollEngine();
  void handleInput(const std::vector<InputEvent>& events);
  void requestEngineMoveIfDue();
  void checkEngineHealth();
  bool announceResult();

  GameManager& m_manager;
  IPlayer& m_engine;
  bool m_quit{false};
  bool m_exit_reported{false};
  bool m_engine_failed{false};  // a failed request ends the session
};

}  // namespace gambit::controller
