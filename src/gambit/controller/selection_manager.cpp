#include "gambit/controller/selection_manager.hpp"

#include <algorithm>

namespace gambit::controller {

void SelectionManager::selectSquare(core::Square sq, const std::vector<model::Move> &legalMoves) {
  m_selected_sq = sq;
  m_moves.clear();
  for (const auto &m : legalMoves) {
    if (m.from() == sq) m_moves.push_back(m);
  }
}

void SelectionManager::deselectSquare() {
  m_selected_sq = core::NO_SQUARE;
  m_moves.clear();
}

std::vector<core::Square> SelectionManager::destinations() const {
  std::vector<core::Square> out;
  for (const auto &m : m_moves) {
    // promotions list the same square four times
    if (std::find(out.begin(), out.end(), m.to()) == out.end()) out.push_back(m.to());
  }
  return out;
}

std::optional<model::Move> SelectionManager::moveTo(core::Square to) const {
  for (const auto &m : m_moves) {
    if (m.to() == to) return m;
  }
  return std::nullopt;
}

}  // namespace gambit::controller
