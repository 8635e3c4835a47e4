#include "gambit/view/terminal_view.hpp"

#include <algorithm>
#include <ostream>
#include <string>

#include "gambit/view/piece_letter.hpp"

namespace gambit::view {

namespace {

const char* colorName(core::Color c) {
  return c == core::Color::White ? "White" : "Black";
}

}  // namespace

TerminalView::TerminalView(std::ostream& out, bool clearScreen) : m_out(out), m_clear(clearScreen) {}

void TerminalView::render(const controller::GameSnapshot& snap) {
  if (m_clear) m_out << "\x1b[2J\x1b[H";

  m_out << "Turn: " << colorName(snap.sideToMove) << "    You: " << colorName(snap.humanColor)
        << "\n\n";

  m_out << "   ";
  for (int file = 0; file < 8; ++file) m_out << ' ' << static_cast<char>('a' + file) << ' ';
  m_out << '\n';

  for (int rank = 7; rank >= 0; --rank) {
    m_out << rank + 1 << "  ";
    for (int file = 0; file < 8; ++file) {
      const auto sq = static_cast<core::Square>(rank * 8 + file);
      const auto piece = snap.pieces[sq];
      const bool isDest = std::find(snap.legalDestinations.begin(), snap.legalDestinations.end(),
                                    sq) != snap.legalDestinations.end();

      char glyph = piece.isNone() ? ((rank + file) % 2 == 0 ? '.' : ' ') : pieceLetter(piece);
      if (sq == snap.selected)
        m_out << '[' << glyph << ']';
      else if (isDest)
        m_out << (piece.isNone() ? " * " : std::string{'(', glyph, ')'});
      else
        m_out << ' ' << glyph << ' ';
    }
    m_out << ' ' << rank + 1 << '\n';
  }

  m_out << "   ";
  for (int file = 0; file < 8; ++file) m_out << ' ' << static_cast<char>('a' + file) << ' ';
  m_out << "\n\n";

  m_out << snap.message << '\n';
  if (!snap.result) m_out << "Enter a square as file then rank (e.g. e2), q to quit.\n";
  m_out.flush();
}

}  // namespace gambit::view
