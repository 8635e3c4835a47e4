#include "gambit/model/position.hpp"

#include <algorithm>
#include <array>

#include "gambit/model/move_helper.hpp"

namespace gambit::model {

namespace {

// Castling rights lost when a move starts or ends on these squares.
constexpr std::array<std::uint8_t, 64> CR_CLEAR = [] {
  std::array<std::uint8_t, 64> a{};
  a[bb::E1] |= bb::Castling::WK | bb::Castling::WQ;
  a[bb::E8] |= bb::Castling::BK | bb::Castling::BQ;
  a[bb::H1] |= bb::Castling::WK;
  a[bb::A1] |= bb::Castling::WQ;
  a[bb::H8] |= bb::Castling::BK;
  a[bb::A8] |= bb::Castling::BQ;
  return a;
}();

struct RookHop {
  core::Square from;
  core::Square to;
};

RookHop castleRookHop(CastleSide side, core::Color us) {
  const bool white = us == core::Color::White;
  if (side == CastleSide::KingSide) return white ? RookHop{bb::H1, bb::F1} : RookHop{bb::H8, bb::F8};
  return white ? RookHop{bb::A1, bb::D1} : RookHop{bb::A8, bb::D8};
}

core::Square epCaptureSquare(const Move& m, core::Color us) {
  return static_cast<core::Square>(us == core::Color::White ? m.to() - 8 : m.to() + 8);
}

}  // namespace

// ---------------------- Utility Checks ----------------------

bool Position::checkInsufficientMaterial() const {
  using core::Color;
  using core::PieceType;
  const bb::Bitboard heavy = m_board.getPieces(Color::White, PieceType::Pawn) |
                             m_board.getPieces(Color::Black, PieceType::Pawn) |
                             m_board.getPieces(Color::White, PieceType::Rook) |
                             m_board.getPieces(Color::Black, PieceType::Rook) |
                             m_board.getPieces(Color::White, PieceType::Queen) |
                             m_board.getPieces(Color::Black, PieceType::Queen);
  if (heavy) return false;

  const bb::Bitboard bishops = m_board.getPieces(Color::White, PieceType::Bishop) |
                               m_board.getPieces(Color::Black, PieceType::Bishop);
  const int totalB = bb::popcount(bishops);
  const int totalN = bb::popcount(m_board.getPieces(Color::White, PieceType::Knight) |
                                  m_board.getPieces(Color::Black, PieceType::Knight));

  if (totalB + totalN <= 1) return true;  // KK, KNK, KBK

  // Bishops only, all on one square color
  if (totalN == 0) {
    constexpr bb::Bitboard DARK = 0xAA55AA55AA55AA55ULL;
    return (bishops & DARK) == 0 || (bishops & ~DARK) == 0;
  }
  return false;
}

bool Position::checkMoveRule() const {
  return m_state.halfmoveClock >= 100;
}

bool Position::checkRepetition() const {
  int count = 0;
  const int n = static_cast<int>(m_history.size());
  const int lim = std::min<int>(n, m_state.halfmoveClock);
  for (int back = 2; back <= lim; back += 2) {
    if (m_history[n - back].zobristKey == m_hash && ++count >= 2) return true;
  }
  return false;
}

bool Position::attackedBy(core::Square sq, core::Color by) const {
  return model::attackedBy(m_board, sq, by);
}

bool Position::inCheck() const {
  const bb::Bitboard kbb = m_board.getPieces(m_state.sideToMove, core::PieceType::King);
  if (!kbb) return false;
  return attackedBy(static_cast<core::Square>(bb::ctz64(kbb)), ~m_state.sideToMove);
}

// ================== Make/Unmake ==================

bool Position::doMove(const Move& m) {
  if (m.from() == m.to()) return false;

  const core::Color us = m_state.sideToMove;
  const auto fromPiece = m_board.getPiece(m.from());
  if (!fromPiece || fromPiece->color != us) return false;

  StateInfo st{};
  st.move = m;
  st.zobristKey = m_hash;
  st.prevCastlingRights = m_state.castlingRights;
  st.prevEnPassantSquare = m_state.enPassantSquare;
  st.prevHalfmoveClock = m_state.halfmoveClock;
  st.prevFullmoveNumber = m_state.fullmoveNumber;

  applyMove(m, st);

  const bb::Bitboard kbb = m_board.getPieces(us, core::PieceType::King);
  if (!kbb || attackedBy(static_cast<core::Square>(bb::ctz64(kbb)), ~us)) {
    unapplyMove(st);
    return false;
  }

  m_hash = Zobrist::compute(m_board, m_state);
  m_history.push_back(st);
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  const StateInfo st = m_history.back();
  m_history.pop_back();
  unapplyMove(st);
  m_hash = st.zobristKey;
}

void Position::applyMove(const Move& m, StateInfo& st) {
  const core::Color us = m_state.sideToMove;
  const bb::Piece mover = *m_board.getPiece(m.from());
  const bool movingPawn = mover.type == core::PieceType::Pawn;

  if (m.isEnPassant()) {
    const core::Square capSq = epCaptureSquare(m, us);
    st.captured = m_board.getPiece(capSq).value_or(bb::Piece{});
    m_board.removePiece(capSq);
  } else {
    st.captured = m_board.getPiece(m.to()).value_or(bb::Piece{});
  }

  m_board.movePiece(m.from(), m.to());
  if (m.isPromotion()) m_board.setPiece(m.to(), bb::Piece{m.promotion(), us});

  if (m.castle() != CastleSide::None) {
    const RookHop hop = castleRookHop(m.castle(), us);
    m_board.movePiece(hop.from, hop.to);
  }

  m_state.castlingRights &= static_cast<std::uint8_t>(~(CR_CLEAR[m.from()] | CR_CLEAR[m.to()]));

  m_state.enPassantSquare = core::NO_SQUARE;
  if (movingPawn && (m.to() == m.from() + 16 || m.from() == m.to() + 16))
    m_state.enPassantSquare = static_cast<core::Square>((m.from() + m.to()) / 2);

  if (movingPawn || !st.captured.isNone())
    m_state.halfmoveClock = 0;
  else
    ++m_state.halfmoveClock;

  if (us == core::Color::Black) ++m_state.fullmoveNumber;
  m_state.sideToMove = ~us;
}

void Position::unapplyMove(const StateInfo& st) {
  const Move& m = st.move;
  const core::Color us = ~m_state.sideToMove;
  m_state.sideToMove = us;

  if (m.castle() != CastleSide::None) {
    const RookHop hop = castleRookHop(m.castle(), us);
    m_board.movePiece(hop.to, hop.from);
  }

  m_board.movePiece(m.to(), m.from());
  if (m.isPromotion()) m_board.setPiece(m.from(), bb::Piece{core::PieceType::Pawn, us});

  if (!st.captured.isNone()) {
    const core::Square capSq = m.isEnPassant() ? epCaptureSquare(m, us) : m.to();
    m_board.setPiece(capSq, st.captured);
  }

  m_state.castlingRights = st.prevCastlingRights;
  m_state.enPassantSquare = st.prevEnPassantSquare;
  m_state.halfmoveClock = st.prevHalfmoveClock;
  m_state.fullmoveNumber = st.prevFullmoveNumber;
}

}  // namespace gambit::model
