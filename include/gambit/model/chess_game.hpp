#pragma once

#include <string>
#include <vector>

#include "../constants.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace gambit::model {

// Rules engine: owns the current position, enumerates legal moves, applies moves and
// reports terminal results. Callers never edit the position directly.
class ChessGame {
 public:
  ChessGame();

  // Returns false (and keeps the current game) when the FEN is malformed.
  bool setPosition(const std::string& fen);
  std::string getFen() const;

  const std::vector<Move>& generateLegalMoves();
  // Applies `move` only if it is one of the legal moves (compared by from/to/promotion).
  bool doMove(const Move& move);

  bb::Piece getPiece(core::Square sq) const;
  const GameState& getGameState() const;
  bool isKingInCheck(core::Color color) const;

  core::GameResult getResult() const;
  void checkGameResult();

 private:
  MoveGenerator m_move_gen;
  Position m_position;
  core::GameResult m_result{core::GameResult::ONGOING};
  std::vector<Move> m_pseudo_moves;
  std::vector<Move> m_legal_moves;
};

}  // namespace gambit::model
