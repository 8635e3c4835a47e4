#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/constants.hpp"
#include "gambit/controller/game_controller_types.hpp"
#include "gambit/controller/selection_manager.hpp"
#include "gambit/model/move.hpp"

namespace gambit::model
{
  class ChessGame;
} // namespace gambit::model

namespace gambit::controller
{

  // Turn-taking and move selection on top of the rules engine. Single-threaded; the
  // engine's replies reach it only through applyEngineMove().
  class GameManager
  {
  public:
    static constexpr const char *THINKING_MESSAGE = "Engine is thinking...";

    explicit GameManager(model::ChessGame &game, core::Color humanColor = core::Color::White);

    // Resets selection, thinking flag and message. False (nothing changed) on a bad FEN.
    bool startGame(const std::string &fen);

    // Returns true only when the click completed a move.
    bool select(core::Square sq);

    // False, with no state change, unless `notation` is a legal move for the engine's side.
    bool applyEngineMove(const std::string &notation);

    void setThinking(bool thinking);
    [[nodiscard]] bool isThinking() const { return m_thinking; }

    void setMessage(std::string message) { m_message = std::move(message); }
    [[nodiscard]] const std::string &message() const { return m_message; }

    [[nodiscard]] core::Square selectedSquare() const { return m_selection.getSelectedSquare(); }
    [[nodiscard]] const std::vector<model::Move> &selectedMoves() const
    {
      return m_selection.cachedMoves();
    }
    [[nodiscard]] std::vector<core::Square> legalDestinations() const
    {
      return m_selection.destinations();
    }

    [[nodiscard]] std::optional<core::GameResult> gameResult() const;
    [[nodiscard]] core::Color sideToMove() const;
    [[nodiscard]] core::Color humanColor() const { return m_human; }
    [[nodiscard]] bool isHumanTurn() const { return sideToMove() == m_human; }
    [[nodiscard]] std::string currentFen() const;

    [[nodiscard]] GameSnapshot snapshot() const;

  private:
    bool ownsPiece(core::Square sq) const;

    model::ChessGame &m_game;
    SelectionManager m_selection;
    core::Color m_human;
    std::string m_message;
    bool m_thinking{false};
  };

} // namespace gambit::controller
