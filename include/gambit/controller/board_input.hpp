#pragma once

#include <functional>

#include "gambit/chess_types.hpp"

namespace gambit::controller
{

  // Two-keystroke square entry: a file letter followed by a rank digit.
  class BoardInput
  {
  public:
    enum class State
    {
      AwaitingFile,
      AwaitingRank
    };

    using SquareCallback = std::function<void(core::Square)>;
    using QuitCallback = std::function<void()>;

    void setOnSquare(SquareCallback cb);
    void setOnQuit(QuitCallback cb);

    void processKey(char key);
    void reset();

    [[nodiscard]] State state() const { return m_state; }

  private:
    State m_state = State::AwaitingFile;
    int m_pending_file = -1; // File chosen while awaiting the rank.

    SquareCallback m_on_square = nullptr;
    QuitCallback m_on_quit = nullptr;
  };

} // namespace gambit::controller
