#pragma once
#include <cstdint>
#include <optional>

namespace gambit::core
{
  using Square = std::uint8_t;
  constexpr Square NO_SQUARE = 64;

  inline bool validSquare(core::Square sq)
  {
    return sq < core::NO_SQUARE;
  }

  // Checked construction: out-of-range components yield nullopt, never a clamped square.
  inline std::optional<core::Square> makeSquare(int file, int rank)
  {
    if (file < 0 || file > 7 || rank < 0 || rank > 7)
      return std::nullopt;
    return static_cast<core::Square>(rank * 8 + file);
  }

  constexpr int fileOf(core::Square sq) noexcept
  {
    return sq & 7;
  }
  constexpr int rankOf(core::Square sq) noexcept
  {
    return sq >> 3;
  }

  constexpr std::uint8_t NUM_PIECE_TYPES = 6;
  enum class PieceType : std::uint8_t
  {
    Pawn = 0,
    Knight,
    Bishop,
    Rook,
    Queen,
    King,
    None
  };

  constexpr int idx(PieceType p) noexcept
  {
    return static_cast<int>(p);
  }

  enum class Color : std::uint8_t
  {
    White = 0,
    Black = 1
  };
  constexpr inline core::Color operator~(core::Color c)
  {
    return c == core::Color::White ? core::Color::Black : core::Color::White;
  }
} // namespace gambit::core
