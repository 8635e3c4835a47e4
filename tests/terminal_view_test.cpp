#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "gambit/controller/game_manager.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/view/terminal_view.hpp"

using namespace gambit;

static core::Square sq(char file, int rank)
{
  return static_cast<core::Square>((rank - 1) * 8 + (file - 'a'));
}

int main()
{
  model::ChessGame game;
  controller::GameManager gm(game);

  // Start position, no selection
  {
    std::ostringstream os;
    view::TerminalView tv(os, false);
    tv.render(gm.snapshot());
    const std::string out = os.str();
    assert(out.find("Turn: White") != std::string::npos);
    assert(out.find("8   r  n  b  q  k  b  n  r  8") != std::string::npos);
    assert(out.find("1   R  N  B  Q  K  B  N  R  1") != std::string::npos);
    assert(out.find("Welcome to Chess Terminal! You play as White.") != std::string::npos);
    assert(out.find("\x1b[2J") == std::string::npos);
  }

  // Selection in brackets, destinations marked
  {
    gm.select(sq('e', 2));
    std::ostringstream os;
    view::TerminalView tv(os, false);
    tv.render(gm.snapshot());
    const std::string out = os.str();
    assert(out.find("2   P  P  P  P [P] P  P  P  2") != std::string::npos);
    assert(out.find("3   .     .     *     .     3") != std::string::npos);
    assert(out.find("4      .     .  *  .     .  4") != std::string::npos);
  }

  // Screen clearing is on by default
  {
    std::ostringstream os;
    view::TerminalView tv(os);
    tv.render(gm.snapshot());
    assert(os.str().rfind("\x1b[2J\x1b[H", 0) == 0);
  }

  std::cout << "terminal_view_test passed\n";
  return 0;
}
