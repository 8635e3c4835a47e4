#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"
#include "move.hpp"

namespace gambit::model {

struct GameState {
  std::uint32_t fullmoveNumber = 1;
  std::uint16_t halfmoveClock = 0;
  std::uint8_t castlingRights =
      bb::Castling::WK | bb::Castling::WQ | bb::Castling::BK | bb::Castling::BQ;
  core::Color sideToMove = core::Color::White;
  core::Square enPassantSquare = core::NO_SQUARE;
};

// Everything needed to take a move back.
struct StateInfo {
  bb::Bitboard zobristKey{};  // full hash before move
  Move move{};
  bb::Piece captured{};
  std::uint32_t prevFullmoveNumber{1};
  std::uint16_t prevHalfmoveClock{};
  std::uint8_t prevCastlingRights{};
  core::Square prevEnPassantSquare{core::NO_SQUARE};
};

static_assert(std::is_trivially_copyable_v<GameState>, "GameState should be POD");
static_assert(std::is_trivially_copyable_v<StateInfo>, "StateInfo should be POD");

}  // namespace gambit::model
