#include "gambit/view/board_window.hpp"

#include <SFML/Graphics/CircleShape.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Window/Event.hpp>
#include <algorithm>
#include <iostream>

#include "gambit/constants.hpp"
#include "gambit/view/piece_letter.hpp"

namespace gambit::view {

namespace {

const sf::Color COL_LIGHT(210, 180, 140);
const sf::Color COL_DARK(101, 67, 33);
const sf::Color COL_SELECTED(230, 200, 40);
const sf::Color COL_DESTINATION(144, 238, 144);
const sf::Color COL_STATUS_BG(30, 30, 30);

}  // namespace

BoardWindow::BoardWindow(const std::string& fontPath)
    : m_window(sf::VideoMode(constant::WINDOW_PX_SIZE,
                             constant::WINDOW_PX_SIZE + constant::STATUS_PX_HEIGHT),
               std::string(core::GAMBIT_VERSION), sf::Style::Titlebar | sf::Style::Close) {
  m_window.setFramerateLimit(60);
  if (!fontPath.empty()) {
    m_has_font = m_font.loadFromFile(fontPath);
    if (!m_has_font) std::cerr << "[BoardWindow] could not load font " << fontPath << "\n";
  }

  m_keys.setOnSquare([this](core::Square sq) {
    m_pending.push_back({controller::InputKind::Square, sq});
  });
  m_keys.setOnQuit([this]() { m_pending.push_back({controller::InputKind::Quit, core::NO_SQUARE}); });
}

core::Square BoardWindow::squareAt(int x, int y) const {
  const int file = x / static_cast<int>(constant::SQUARE_PX_SIZE);
  const int row = y / static_cast<int>(constant::SQUARE_PX_SIZE);
  if (x < 0 || y < 0) return core::NO_SQUARE;
  return core::makeSquare(file, 7 - row).value_or(core::NO_SQUARE);
}

std::vector<controller::InputEvent> BoardWindow::pollEvents() {
  sf::Event event;
  while (m_window.pollEvent(event)) {
    switch (event.type) {
      case sf::Event::Closed:
        m_pending.push_back({controller::InputKind::Quit, core::NO_SQUARE});
        break;
      case sf::Event::MouseButtonPressed:
        if (event.mouseButton.button == sf::Mouse::Left) {
          core::Square sq = squareAt(event.mouseButton.x, event.mouseButton.y);
          if (core::validSquare(sq)) {
            m_keys.reset();
            m_pending.push_back({controller::InputKind::Square, sq});
          }
        }
        break;
      case sf::Event::TextEntered:
        if (event.text.unicode < 128) m_keys.processKey(static_cast<char>(event.text.unicode));
        break;
      case sf::Event::KeyPressed:
        if (event.key.code == sf::Keyboard::Escape)
          m_pending.push_back({controller::InputKind::Quit, core::NO_SQUARE});
        break;
      default:
        break;
    }
  }

  std::vector<controller::InputEvent> out;
  out.swap(m_pending);
  return out;
}

void BoardWindow::drawPiece(model::bb::Piece piece, float x, float y) {
  const float sz = static_cast<float>(constant::SQUARE_PX_SIZE);
  const bool white = piece.color == core::Color::White;

  if (m_has_font) {
    sf::Text text(std::string(1, pieceLetter(piece)), m_font,
                  static_cast<unsigned int>(sz * 0.6f));
    text.setFillColor(white ? sf::Color::White : sf::Color::Black);
    text.setOutlineColor(white ? sf::Color::Black : sf::Color::White);
    text.setOutlineThickness(1.5f);
    auto b = text.getLocalBounds();
    text.setOrigin(b.left + b.width / 2.f, b.top + b.height / 2.f);
    text.setPosition(x + sz / 2.f, y + sz / 2.f);
    m_window.draw(text);
    return;
  }

  // Radius encodes the piece type.
  const float radius = sz * (0.18f + 0.04f * static_cast<float>(core::idx(piece.type)));
  sf::CircleShape disc(radius);
  disc.setOrigin(radius, radius);
  disc.setPosition(x + sz / 2.f, y + sz / 2.f);
  disc.setFillColor(white ? sf::Color::White : sf::Color::Black);
  disc.setOutlineColor(white ? sf::Color::Black : sf::Color::White);
  disc.setOutlineThickness(2.f);
  m_window.draw(disc);
}

void BoardWindow::render(const controller::GameSnapshot& snap) {
  const std::string title = std::string(core::GAMBIT_VERSION) + " - " + snap.message;
  if (title != m_title) {
    m_title = title;
    m_window.setTitle(m_title);
  }

  m_window.clear(sf::Color::Black);
  const float sz = static_cast<float>(constant::SQUARE_PX_SIZE);

  for (int rank = 0; rank < 8; ++rank) {
    for (int file = 0; file < 8; ++file) {
      const auto sq = static_cast<core::Square>(rank * 8 + file);
      const float x = file * sz;
      const float y = (7 - rank) * sz;

      sf::RectangleShape cell({sz, sz});
      cell.setPosition(x, y);
      if (sq == snap.selected)
        cell.setFillColor(COL_SELECTED);
      else if (std::find(snap.legalDestinations.begin(), snap.legalDestinations.end(), sq) !=
               snap.legalDestinations.end())
        cell.setFillColor(COL_DESTINATION);
      else
        cell.setFillColor((rank + file) % 2 == 0 ? COL_DARK : COL_LIGHT);
      m_window.draw(cell);

      if (!snap.pieces[sq].isNone()) drawPiece(snap.pieces[sq], x, y);
    }
  }

  sf::RectangleShape status({static_cast<float>(constant::WINDOW_PX_SIZE),
                             static_cast<float>(constant::STATUS_PX_HEIGHT)});
  status.setPosition(0.f, static_cast<float>(constant::WINDOW_PX_SIZE));
  status.setFillColor(COL_STATUS_BG);
  m_window.draw(status);

  if (m_has_font) {
    sf::Text text(snap.message, m_font, 18);
    text.setFillColor(sf::Color::White);
    text.setPosition(10.f, static_cast<float>(constant::WINDOW_PX_SIZE) + 8.f);
    m_window.draw(text);
  }

  m_window.display();
}

}  // namespace gambit::view
