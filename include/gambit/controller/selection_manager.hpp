#pragma once

#include <optional>
#include <vector>

#include "../chess_types.hpp"
#include "../model/move.hpp"

namespace gambit::controller
{

  // Selected square plus the legal moves that start on it.
  // The cache is only ever replaced as a whole, together with the selection.
  class SelectionManager
  {
  public:
    SelectionManager() = default;

    void selectSquare(core::Square sq, const std::vector<model::Move> &legalMoves);
    void deselectSquare();

    [[nodiscard]] core::Square getSelectedSquare() const { return m_selected_sq; }
    [[nodiscard]] bool hasSelection() const { return m_selected_sq != core::NO_SQUARE; }
    [[nodiscard]] const std::vector<model::Move> &cachedMoves() const { return m_moves; }
    [[nodiscard]] std::vector<core::Square> destinations() const;

    // First cached move landing on `to`.
    [[nodiscard]] std::optional<model::Move> moveTo(core::Square to) const;

  private:
    core::Square m_selected_sq{core::NO_SQUARE};
    std::vector<model::Move> m_moves;
  };

} // namespace gambit::controller
