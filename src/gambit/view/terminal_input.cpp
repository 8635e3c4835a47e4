#include "gambit/view/terminal_input.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>

namespace gambit::view {

TerminalInput::TerminalInput(int fd) : m_fd(fd) {
  m_keys.setOnSquare([this](core::Square sq) {
    m_pending.push_back({controller::InputKind::Square, sq});
  });
  m_keys.setOnQuit([this]() { m_pending.push_back({controller::InputKind::Quit, core::NO_SQUARE}); });

  if (::isatty(m_fd) && ::tcgetattr(m_fd, &m_saved) == 0) {
    termios raw = m_saved;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(m_fd, TCSANOW, &raw) == 0)
      m_restore = true;
    else
      std::cerr << "[TerminalInput] could not switch terminal to raw mode\n";
  }
}

TerminalInput::~TerminalInput() {
  if (m_restore) ::tcsetattr(m_fd, TCSANOW, &m_saved);
}

std::vector<controller::InputEvent> TerminalInput::poll(std::chrono::milliseconds timeout) {
  pollfd pfd{m_fd, POLLIN, 0};
  int pr = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (pr > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR))) {
    char buf[64];
    ssize_t n = ::read(m_fd, buf, sizeof(buf));
    if (n > 0) {
      for (ssize_t i = 0; i < n; ++i) m_keys.processKey(buf[i]);
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
      m_pending.push_back({controller::InputKind::Quit, core::NO_SQUARE});
    }
  }

  std::vector<controller::InputEvent> out;
  out.swap(m_pending);
  return out;
}

}  // namespace gambit::view
