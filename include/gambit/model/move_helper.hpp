#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"

namespace gambit::model {

// ---------------- Attack query ----------------
[[nodiscard]] inline bool attackedBy(const Board& b, core::Square sq, core::Color by) noexcept {
  const bb::Bitboard target = bb::sq_bb(sq);
  const bb::Bitboard occ = b.getAllPieces();

  // Squares from which a pawn of 'by' attacks 'sq'
  if (bb::pawn_attacks(~by, target) & b.getPieces(by, core::PieceType::Pawn)) return true;
  if (bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight)) return true;
  if (bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King)) return true;

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);
  if (bb::bishop_attacks(sq, occ) & (b.getPieces(by, core::PieceType::Bishop) | q)) return true;
  return (bb::rook_attacks(sq, occ) & (b.getPieces(by, core::PieceType::Rook) | q)) != 0;
}

}  // namespace gambit::model
