#pragma once

#include <chrono>
#include <vector>

#include <termios.h>

#include "../controller/board_input.hpp"
#include "../controller/game_controller_types.hpp"

namespace gambit::view {

// Keystroke source for the terminal front end. Puts a tty into non-canonical, no-echo
// mode for its lifetime so single keys arrive without Enter.
class TerminalInput {
 public:
  explicit TerminalInput(int fd);
  ~TerminalInput();

  TerminalInput(const TerminalInput&) = delete;
  TerminalInput& operator=(const TerminalInput&) = delete;

  // Waits up to `timeout` for keys and returns the events they completed. End of input
  // is reported as Quit.
  std::vector<controller::InputEvent> poll(std::chrono::milliseconds timeout);

 private:
  int m_fd;
  bool m_restore{false};
  termios m_saved{};
  controller::BoardInput m_keys;
  std::vector<controller::InputEvent> m_pending;
};

}  // namespace gambit::view
