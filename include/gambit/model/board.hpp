#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/bitboard.hpp"

namespace gambit::model {

class Board {
 public:
  Board() { clear(); }

  void clear() noexcept {
    for (auto& byColor : m_bb) byColor.fill(0);
    m_color_occ = {0, 0};
    m_all_occ = 0;
    m_piece_on.fill(bb::Piece{});
  }

  void setPiece(core::Square sq, bb::Piece p) noexcept {
    removePiece(sq);
    if (p.isNone()) return;
    const bb::Bitboard mask = bb::sq_bb(sq);
    m_bb[bb::ci(p.color)][core::idx(p.type)] |= mask;
    m_color_occ[bb::ci(p.color)] |= mask;
    m_all_occ |= mask;
    m_piece_on[sq] = p;
  }

  void removePiece(core::Square sq) noexcept {
    const bb::Piece old = m_piece_on[sq];
    if (old.isNone()) return;
    const bb::Bitboard mask = ~bb::sq_bb(sq);
    m_bb[bb::ci(old.color)][core::idx(old.type)] &= mask;
    m_color_occ[bb::ci(old.color)] &= mask;
    m_all_occ &= mask;
    m_piece_on[sq] = bb::Piece{};
  }

  // Moves whatever stands on `from` to `to`, replacing any occupant of `to`.
  void movePiece(core::Square from, core::Square to) noexcept {
    const bb::Piece p = m_piece_on[from];
    removePiece(from);
    setPiece(to, p);
  }

  [[nodiscard]] std::optional<bb::Piece> getPiece(core::Square sq) const noexcept {
    if (!core::validSquare(sq) || m_piece_on[sq].isNone()) return std::nullopt;
    return m_piece_on[sq];
  }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[bb::ci(c)];
  }
  [[nodiscard]] bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    if (t == core::PieceType::None) return 0;
    return m_bb[bb::ci(c)][core::idx(t)];
  }

 private:
  // [color][pieceType]
  std::array<std::array<bb::Bitboard, 6>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;

  // O(1) lookup per square
  std::array<bb::Piece, 64> m_piece_on{};
};

}  // namespace gambit::model
