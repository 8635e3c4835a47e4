#pragma once

#include <iosfwd>

#include "../controller/game_controller_types.hpp"

namespace gambit::view {

// Text board for a terminal: White at the bottom, the selection in brackets, legal
// destinations marked, then the turn and the status message.
class TerminalView {
 public:
  explicit TerminalView(std::ostream& out, bool clearScreen = true);

  void render(const controller::GameSnapshot& snap);

 private:
  std::ostream& m_out;
  bool m_clear;
};

}  // namespace gambit::view
