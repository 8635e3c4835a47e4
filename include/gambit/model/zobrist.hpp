#pragma once
#include <cstdint>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"

namespace gambit::model {

namespace detail {

consteval std::uint64_t splitmix64(std::uint64_t& x) {
  std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

struct ZobristTables {
  bb::Bitboard piece[2][6][64];
  bb::Bitboard castling[16];
  bb::Bitboard epFile[8];
  bb::Bitboard side;
};

consteval ZobristTables generateZobrist() {
  ZobristTables t{};
  std::uint64_t seed = 0x5EED0F6A3B1752C9ULL;

  for (int c = 0; c < 2; ++c)
    for (int p = 0; p < 6; ++p)
      for (int s = 0; s < 64; ++s) t.piece[c][p][s] = splitmix64(seed);

  for (int i = 0; i < 16; ++i) t.castling[i] = splitmix64(seed);
  for (int f = 0; f < 8; ++f) t.epFile[f] = splitmix64(seed);
  t.side = splitmix64(seed);
  return t;
}

}  // namespace detail

struct Zobrist {
  static inline constexpr detail::ZobristTables tables = detail::generateZobrist();

  // Full recomputation. The en passant file only counts when a pawn of the side to
  // move could actually capture there, so transpositions compare equal.
  static bb::Bitboard compute(const Board& b, const GameState& st) noexcept {
    bb::Bitboard h = 0;
    for (auto c : {core::Color::White, core::Color::Black}) {
      for (int p = 0; p < 6; ++p) {
        bb::Bitboard pcs = b.getPieces(c, static_cast<core::PieceType>(p));
        while (pcs) {
          const core::Square s = bb::pop_lsb(pcs);
          h ^= tables.piece[bb::ci(c)][p][s];
        }
      }
    }
    h ^= tables.castling[st.castlingRights & 0xF];
    if (st.sideToMove == core::Color::Black) h ^= tables.side;

    if (st.enPassantSquare != core::NO_SQUARE) {
      const bb::Bitboard capturers =
          bb::pawn_attacks(~st.sideToMove, bb::sq_bb(st.enPassantSquare)) &
          b.getPieces(st.sideToMove, core::PieceType::Pawn);
      if (capturers) h ^= tables.epFile[core::fileOf(st.enPassantSquare)];
    }
    return h;
  }
};

}  // namespace gambit::model
