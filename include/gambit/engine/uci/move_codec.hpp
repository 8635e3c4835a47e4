#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/model/move.hpp"

namespace gambit::engine::uci
{
  // "e2" -> square, nullopt unless file is a..h and rank is 1..8
  std::optional<core::Square> parseSquare(std::string_view sv) noexcept;
  std::string squareToString(core::Square sq);

  // <from><to>[q|r|b|n], e.g. "e2e4", "a7a8q"
  std::string encodeMove(const model::Move &m);

  // Looks the notation up among `legalMoves`; never builds a move that is not in the list.
  // Without a promotion letter any promotion variant of the from/to pair is accepted.
  std::optional<model::Move> decodeMove(std::string_view text,
                                        const std::vector<model::Move> &legalMoves);
} // namespace gambit::engine::uci
