#pragma once
#include <cstdint>
#include <vector>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"
#include "zobrist.hpp"

namespace gambit::model {

class Position {
 public:
  Position() = default;

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  [[nodiscard]] std::uint64_t hash() const noexcept { return m_hash; }

  // Recompute the hash after the board/state were edited directly (FEN setup).
  void buildHash() { m_hash = Zobrist::compute(m_board, m_state); }

  // Make/Unmake. doMove rejects (and leaves no trace of) moves that leave the mover in check.
  bool doMove(const Move& m);
  void undoMove();

  // Status queries
  bool checkInsufficientMaterial() const;
  bool checkMoveRule() const;
  bool checkRepetition() const;

  bool inCheck() const;
  bool attackedBy(core::Square sq, core::Color by) const;

 private:
  Board m_board;
  GameState m_state;
  std::vector<StateInfo> m_history;
  bb::Bitboard m_hash = 0;

  void applyMove(const Move& m, StateInfo& st);
  void unapplyMove(const StateInfo& st);
};

}  // namespace gambit::model
