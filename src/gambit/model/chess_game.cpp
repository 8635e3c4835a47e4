#include "gambit/model/chess_game.hpp"

#include <cctype>
#include <string_view>

#include "gambit/model/move_helper.hpp"

namespace gambit::model {

namespace {

inline core::PieceType pieceFromChar(char lo) noexcept {
  switch (lo) {
    case 'k':
      return core::PieceType::King;
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    case 'p':
      return core::PieceType::Pawn;
    default:
      return core::PieceType::None;
  }
}

inline char charFromPiece(core::PieceType t) noexcept {
  constexpr char chars[] = {'p', 'n', 'b', 'r', 'q', 'k'};
  return t == core::PieceType::None ? '?' : chars[core::idx(t)];
}

// Accepts digits only; anything else makes the field invalid.
inline bool parseUnsigned(std::string_view sv, int& out) noexcept {
  if (sv.empty() || sv.size() > 6) return false;
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return false;
    val = val * 10 + (c - '0');
  }
  out = val;
  return true;
}

bool parsePlacement(std::string_view board, Board& out) {
  int rank = 7, file = 0;
  for (char ch : board) {
    if (ch == '/') {
      if (file != 8 || rank == 0) return false;
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return false;
      continue;
    }
    const char lo = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    const core::PieceType type = pieceFromChar(lo);
    if (type == core::PieceType::None || file > 7) return false;
    const core::Color col = (ch == lo) ? core::Color::Black : core::Color::White;
    out.setPiece(static_cast<core::Square>(file + rank * 8), {type, col});
    ++file;
  }
  return rank == 0 && file == 8;
}

}  // namespace

// ---------------- Public API ----------------

ChessGame::ChessGame() {
  m_pseudo_moves.reserve(256);
  m_legal_moves.reserve(256);
  setPosition(core::START_FEN);
}

bool ChessGame::setPosition(const std::string& fen) {
  std::string_view sv{fen};
  std::string_view fields[6]{};
  int count = 0;
  while (!sv.empty() && count < 6) {
    const size_t sp = sv.find(' ');
    fields[count++] = sv.substr(0, sp);
    if (sp == std::string_view::npos) break;
    sv.remove_prefix(sp + 1);
    while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
  }
  if (count < 2) return false;

  Position pos;
  if (!parsePlacement(fields[0], pos.getBoard())) return false;

  const Board& board = pos.getBoard();
  if (bb::popcount(board.getPieces(core::Color::White, core::PieceType::King)) != 1 ||
      bb::popcount(board.getPieces(core::Color::Black, core::PieceType::King)) != 1)
    return false;

  GameState& st = pos.getState();
  if (fields[1] == "w")
    st.sideToMove = core::Color::White;
  else if (fields[1] == "b")
    st.sideToMove = core::Color::Black;
  else
    return false;

  // Castling rights (missing field => none)
  st.castlingRights = 0;
  for (char c : fields[2]) {
    switch (c) {
      case 'K':
        st.castlingRights |= bb::Castling::WK;
        break;
      case 'Q':
        st.castlingRights |= bb::Castling::WQ;
        break;
      case 'k':
        st.castlingRights |= bb::Castling::BK;
        break;
      case 'q':
        st.castlingRights |= bb::Castling::BQ;
        break;
      case '-':
        break;
      default:
        return false;
    }
  }

  st.enPassantSquare = core::NO_SQUARE;
  if (fields[3].size() == 2) {
    auto ep = core::makeSquare(fields[3][0] - 'a', fields[3][1] - '1');
    if (!ep) return false;
    st.enPassantSquare = *ep;
  } else if (!fields[3].empty() && fields[3] != "-") {
    return false;
  }

  int hm = 0, fm = 1;
  if (!fields[4].empty() && !parseUnsigned(fields[4], hm)) return false;
  if (!fields[5].empty() && !parseUnsigned(fields[5], fm)) return false;
  st.halfmoveClock = static_cast<std::uint16_t>(hm);
  st.fullmoveNumber = fm == 0 ? 1u : static_cast<std::uint32_t>(fm);

  // The side not to move must not be in check.
  const bb::Bitboard theirKing = board.getPieces(~st.sideToMove, core::PieceType::King);
  if (attackedBy(board, static_cast<core::Square>(bb::ctz64(theirKing)), st.sideToMove))
    return false;

  pos.buildHash();
  m_position = std::move(pos);
  m_result = core::GameResult::ONGOING;
  m_pseudo_moves.clear();
  m_legal_moves.clear();
  checkGameResult();
  return true;
}

const std::vector<Move>& ChessGame::generateLegalMoves() {
  m_pseudo_moves.clear();
  m_legal_moves.clear();

  m_move_gen.generatePseudoLegalMoves(m_position.getBoard(), m_position.getState(), m_pseudo_moves);

  // Filter legality by make/unmake
  for (const auto& m : m_pseudo_moves) {
    if (m_position.doMove(m)) {
      m_position.undoMove();
      m_legal_moves.push_back(m);
    }
  }
  return m_legal_moves;
}

bool ChessGame::doMove(const Move& move) {
  if (m_result != core::GameResult::ONGOING) return false;

  const auto& moves = generateLegalMoves();
  for (const auto& m : moves) {
    if (m == move) {
      // Play the generator's copy: it carries the capture/en passant/castle flags.
      const Move legal = m;
      if (!m_position.doMove(legal)) return false;
      checkGameResult();
      return true;
    }
  }
  return false;
}

bb::Piece ChessGame::getPiece(core::Square sq) const {
  return m_position.getBoard().getPiece(sq).value_or(bb::Piece{});
}

const GameState& ChessGame::getGameState() const {
  return m_position.getState();
}

bool ChessGame::isKingInCheck(core::Color color) const {
  const bb::Bitboard kbb = m_position.getBoard().getPieces(color, core::PieceType::King);
  if (!kbb) return false;
  return m_position.attackedBy(static_cast<core::Square>(bb::ctz64(kbb)), ~color);
}

core::GameResult ChessGame::getResult() const {
  return m_result;
}

void ChessGame::checkGameResult() {
  m_result = core::GameResult::ONGOING;
  if (generateLegalMoves().empty()) {
    m_result = isKingInCheck(m_position.getState().sideToMove) ? core::GameResult::CHECKMATE
                                                               : core::GameResult::STALEMATE;
    return;
  }
  if (m_position.checkInsufficientMaterial())
    m_result = core::GameResult::INSUFFICIENT;
  else if (m_position.checkMoveRule())
    m_result = core::GameResult::MOVERULE;
  else if (m_position.checkRepetition())
    m_result = core::GameResult::REPETITION;
}

std::string ChessGame::getFen() const {
  std::string fen;
  fen.reserve(100);
  const auto& board = m_position.getBoard();

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const auto piece = board.getPiece(static_cast<core::Square>(rank * 8 + file));
      if (!piece) {
        ++empty;
        continue;
      }
      if (empty) {
        fen.push_back(static_cast<char>('0' + empty));
        empty = 0;
      }
      const char ch = charFromPiece(piece->type);
      fen.push_back(piece->color == core::Color::White
                        ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch)))
                        : ch);
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  const auto& st = m_position.getState();
  fen.push_back(' ');
  fen.push_back(st.sideToMove == core::Color::White ? 'w' : 'b');
  fen.push_back(' ');

  if (st.castlingRights) {
    if (st.castlingRights & bb::Castling::WK) fen.push_back('K');
    if (st.castlingRights & bb::Castling::WQ) fen.push_back('Q');
    if (st.castlingRights & bb::Castling::BK) fen.push_back('k');
    if (st.castlingRights & bb::Castling::BQ) fen.push_back('q');
  } else {
    fen.push_back('-');
  }
  fen.push_back(' ');

  if (st.enPassantSquare == core::NO_SQUARE) {
    fen.push_back('-');
  } else {
    fen.push_back(static_cast<char>('a' + core::fileOf(st.enPassantSquare)));
    fen.push_back(static_cast<char>('1' + core::rankOf(st.enPassantSquare)));
  }
  fen.push_back(' ');
  fen.append(std::to_string(st.halfmoveClock));
  fen.push_back(' ');
  fen.append(std::to_string(st.fullmoveNumber));

  return fen;
}

}  // namespace gambit::model
