#include "gambit/controller/game_manager.hpp"

#include "gambit/engine/uci/move_codec.hpp"
#include "gambit/model/chess_game.hpp"

namespace gambit::controller {

namespace {

std::string welcomeMessage(core::Color human) {
  return std::string("Welcome to Chess Terminal! You play as ") +
         (human == core::Color::White ? "White." : "Black.");
}

}  // namespace

GameManager::GameManager(model::ChessGame &game, core::Color humanColor)
    : m_game(game), m_human(humanColor), m_message(welcomeMessage(humanColor)) {}

bool GameManager::startGame(const std::string &fen) {
  if (!m_game.setPosition(fen)) return false;
  m_selection.deselectSquare();
  m_thinking = false;
  m_message = welcomeMessage(m_human);
  return true;
}

bool GameManager::ownsPiece(core::Square sq) const {
  const auto piece = m_game.getPiece(sq);
  return !piece.isNone() && piece.color == sideToMove();
}

bool GameManager::select(core::Square sq) {
  if (!core::validSquare(sq) || gameResult() || !isHumanTurn()) return false;

  if (!m_selection.hasSelection()) {
    if (ownsPiece(sq)) m_selection.selectSquare(sq, m_game.generateLegalMoves());
    return false;
  }

  if (auto mv = m_selection.moveTo(sq)) {
    if (m_game.doMove(*mv)) {
      m_message = "Move: " + engine::uci::encodeMove(*mv);
      m_selection.deselectSquare();
      return true;
    }
    m_selection.deselectSquare();
    return false;
  }

  if (ownsPiece(sq))
    m_selection.selectSquare(sq, m_game.generateLegalMoves());
  else
    m_selection.deselectSquare();
  return false;
}

bool GameManager::applyEngineMove(const std::string &notation) {
  if (isHumanTurn() || gameResult()) return false;

  const auto mv = engine::uci::decodeMove(notation, m_game.generateLegalMoves());
  if (!mv || !m_game.doMove(*mv)) return false;

  m_selection.deselectSquare();
  m_thinking = false;
  m_message = "Engine moved: " + notation;
  return true;
}

void GameManager::setThinking(bool thinking) {
  m_thinking = thinking;
  if (thinking) m_message = THINKING_MESSAGE;
}

std::optional<core::GameResult> GameManager::gameResult() const {
  const core::GameResult res = m_game.getResult();
  if (res == core::GameResult::ONGOING) return std::nullopt;
  return res;
}

core::Color GameManager::sideToMove() const {
  return m_game.getGameState().sideToMove;
}

std::string GameManager::currentFen() const {
  return m_game.getFen();
}

GameSnapshot GameManager::snapshot() const {
  GameSnapshot snap;
  for (int sq = 0; sq < 64; ++sq) snap.pieces[sq] = m_game.getPiece(static_cast<core::Square>(sq));
  snap.fen = m_game.getFen();
  snap.selected = m_selection.getSelectedSquare();
  snap.legalDestinations = m_selection.destinations();
  snap.message = m_message;
  snap.thinking = m_thinking;
  snap.sideToMove = sideToMove();
  snap.humanColor = m_human;
  snap.result = gameResult();
  return snap;
}

}  // namespace gambit::controller
