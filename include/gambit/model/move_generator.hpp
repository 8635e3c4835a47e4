#pragma once

#include <vector>

#include "gambit/model/board.hpp"
#include "gambit/model/game_state.hpp"
#include "gambit/model/move.hpp"

namespace gambit::model {

class MoveGenerator {
 public:
  // Full pseudo-legal move generation (quiet moves + captures + promotions + en passant +
  // castling). Castling is only emitted when the king does not start on, pass or land on an
  // attacked square; every other self-check is left to Position::doMove().
  void generatePseudoLegalMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;

 private:
  void generatePawnMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;
  void generatePieceMoves(const Board& b, core::Color us, std::vector<Move>& out) const;
  void generateCastling(const Board& b, const GameState& st, std::vector<Move>& out) const;
};

}  // namespace gambit::model
