#include "gambit/controller/board_input.hpp"

#include <cctype>

namespace gambit::controller {

void BoardInput::setOnSquare(SquareCallback cb) {
  m_on_square = std::move(cb);
}

void BoardInput::setOnQuit(QuitCallback cb) {
  m_on_quit = std::move(cb);
}

void BoardInput::reset() {
  m_state = State::AwaitingFile;
  m_pending_file = -1;
}

void BoardInput::processKey(char key) {
  const unsigned char uc = static_cast<unsigned char>(key);
  if (std::isspace(uc)) return;
  const char c = static_cast<char>(std::tolower(uc));

  if (c == 'q') {
    reset();
    if (m_on_quit) m_on_quit();
    return;
  }

  switch (m_state) {
    case State::AwaitingFile:
      if (c >= 'a' && c <= 'h') {
        m_pending_file = c - 'a';
        m_state = State::AwaitingRank;
      }
      break;

    case State::AwaitingRank:
      if (c >= '1' && c <= '8') {
        auto sq = core::makeSquare(m_pending_file, c - '1');
        reset();
        if (sq && m_on_square) m_on_square(*sq);
      } else {
        reset();
      }
      break;
  }
}

}  // namespace gambit::controller
