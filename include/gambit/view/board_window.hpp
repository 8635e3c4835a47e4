#pragma once

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <string>
#include <vector>

#include "../controller/board_input.hpp"
#include "../controller/game_controller_types.hpp"

namespace gambit::view {

namespace constant {
constexpr unsigned int BOARD_SIZE = 8;
constexpr unsigned int SQUARE_PX_SIZE = 80;
constexpr unsigned int WINDOW_PX_SIZE = SQUARE_PX_SIZE * BOARD_SIZE;
constexpr unsigned int STATUS_PX_HEIGHT = 40;
}  // namespace constant

// SFML front end: board with White at the bottom, left clicks select squares, typed
// file/rank keys work as in the terminal. Pieces are drawn as letters when a font is
// available, otherwise as discs.
class BoardWindow {
 public:
  explicit BoardWindow(const std::string& fontPath = {});

  [[nodiscard]] bool isOpen() const { return m_window.isOpen(); }

  std::vector<controller::InputEvent> pollEvents();
  void render(const controller::GameSnapshot& snap);

 private:
  [[nodiscard]] core::Square squareAt(int x, int y) const;
  void drawPiece(model::bb::Piece piece, float x, float y);

  sf::RenderWindow m_window;
  sf::Font m_font;
  bool m_has_font{false};
  std::string m_title;
  controller::BoardInput m_keys;
  std::vector<controller::InputEvent> m_pending;
};

}  // namespace gambit::view
