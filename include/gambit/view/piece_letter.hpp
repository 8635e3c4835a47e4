#pragma once

#include "../model/core/model_types.hpp"

namespace gambit::view {

// FEN letter of a piece: uppercase for White, lowercase for Black, ' ' for none.
inline char pieceLetter(model::bb::Piece p) {
  static constexpr char LETTERS[] = {'p', 'n', 'b', 'r', 'q', 'k'};
  if (p.isNone()) return ' ';
  char c = LETTERS[core::idx(p.type)];
  return p.color == core::Color::White ? static_cast<char>(c - 'a' + 'A') : c;
}

}  // namespace gambit::view
