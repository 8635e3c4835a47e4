#include "gambit/model/move_generator.hpp"

#include "gambit/model/move_helper.hpp"

namespace gambit::model {

namespace {

constexpr core::PieceType PROMO_ORDER[4] = {core::PieceType::Queen, core::PieceType::Rook,
                                            core::PieceType::Bishop, core::PieceType::Knight};

inline void pushPawnMove(core::Square from, core::Square to, bool capture, bool promote,
                         std::vector<Move>& out) {
  if (!promote) {
    out.emplace_back(from, to, core::PieceType::None, capture);
    return;
  }
  for (auto pt : PROMO_ORDER) out.emplace_back(from, to, pt, capture);
}

inline void pushTargets(core::Square from, bb::Bitboard targets, bb::Bitboard enemy,
                        std::vector<Move>& out) {
  while (targets) {
    const core::Square to = bb::pop_lsb(targets);
    out.emplace_back(from, to, core::PieceType::None, (enemy & bb::sq_bb(to)) != 0);
  }
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const GameState& st,
                                             std::vector<Move>& out) const {
  generatePawnMoves(b, st, out);
  generatePieceMoves(b, st.sideToMove, out);
  generateCastling(b, st, out);
}

void MoveGenerator::generatePawnMoves(const Board& b, const GameState& st,
                                      std::vector<Move>& out) const {
  const core::Color us = st.sideToMove;
  const bool white = us == core::Color::White;
  const bb::Bitboard empty = ~b.getAllPieces();
  const bb::Bitboard enemy = b.getPieces(~us);
  const bb::Bitboard promoRank = white ? bb::RANK_8 : bb::RANK_1;
  const int forward = white ? 8 : -8;

  bb::Bitboard pawns = b.getPieces(us, core::PieceType::Pawn);
  while (pawns) {
    const core::Square from = bb::pop_lsb(pawns);
    const bb::Bitboard fromBB = bb::sq_bb(from);

    // Pushes
    const bb::Bitboard one = (white ? bb::north(fromBB) : bb::south(fromBB)) & empty;
    if (one) {
      const auto to = static_cast<core::Square>(from + forward);
      pushPawnMove(from, to, false, (one & promoRank) != 0, out);

      const bb::Bitboard startRank = white ? bb::RANK_2 : bb::RANK_7;
      if (fromBB & startRank) {
        const bb::Bitboard two = (white ? bb::north(one) : bb::south(one)) & empty;
        if (two) out.emplace_back(from, static_cast<core::Square>(from + 2 * forward));
      }
    }

    // Captures
    bb::Bitboard caps = bb::pawn_attacks(us, fromBB) & enemy;
    while (caps) {
      const core::Square to = bb::pop_lsb(caps);
      pushPawnMove(from, to, true, (bb::sq_bb(to) & promoRank) != 0, out);
    }

    if (st.enPassantSquare != core::NO_SQUARE &&
        (bb::pawn_attacks(us, fromBB) & bb::sq_bb(st.enPassantSquare)))
      out.emplace_back(from, st.enPassantSquare, core::PieceType::None, true, true);
  }
}

void MoveGenerator::generatePieceMoves(const Board& b, core::Color us,
                                       std::vector<Move>& out) const {
  const bb::Bitboard own = b.getPieces(us);
  const bb::Bitboard enemy = b.getPieces(~us);
  const bb::Bitboard occ = b.getAllPieces();

  for (auto pt : {core::PieceType::Knight, core::PieceType::Bishop, core::PieceType::Rook,
                  core::PieceType::Queen, core::PieceType::King}) {
    bb::Bitboard pieces = b.getPieces(us, pt);
    while (pieces) {
      const core::Square from = bb::pop_lsb(pieces);
      bb::Bitboard targets = 0;
      switch (pt) {
        case core::PieceType::Knight:
          targets = bb::knight_attacks_from(from);
          break;
        case core::PieceType::Bishop:
          targets = bb::bishop_attacks(from, occ);
          break;
        case core::PieceType::Rook:
          targets = bb::rook_attacks(from, occ);
          break;
        case core::PieceType::Queen:
          targets = bb::queen_attacks(from, occ);
          break;
        default:
          targets = bb::king_attacks_from(from);
          break;
      }
      pushTargets(from, targets & ~own, enemy, out);
    }
  }
}

void MoveGenerator::generateCastling(const Board& b, const GameState& st,
                                     std::vector<Move>& out) const {
  const core::Color us = st.sideToMove;
  const core::Color them = ~us;
  const bool white = us == core::Color::White;
  const core::Square kingSq = white ? bb::E1 : bb::E8;
  const std::uint8_t kRight = white ? bb::Castling::WK : bb::Castling::BK;
  const std::uint8_t qRight = white ? bb::Castling::WQ : bb::Castling::BQ;

  if (!(st.castlingRights & (kRight | qRight))) return;
  if (!(b.getPieces(us, core::PieceType::King) & bb::sq_bb(kingSq))) return;
  if (attackedBy(b, kingSq, them)) return;

  const bb::Bitboard occ = b.getAllPieces();
  const bb::Bitboard rooks = b.getPieces(us, core::PieceType::Rook);

  if (st.castlingRights & kRight) {
    const core::Square f = white ? bb::F1 : bb::F8;
    const core::Square g = white ? bb::G1 : bb::G8;
    const core::Square h = white ? bb::H1 : bb::H8;
    if ((rooks & bb::sq_bb(h)) && !(occ & (bb::sq_bb(f) | bb::sq_bb(g))) &&
        !attackedBy(b, f, them) && !attackedBy(b, g, them))
      out.emplace_back(kingSq, g, core::PieceType::None, false, false, CastleSide::KingSide);
  }

  if (st.castlingRights & qRight) {
    const core::Square d = white ? bb::D1 : bb::D8;
    const core::Square c = white ? bb::C1 : bb::C8;
    const core::Square bSq = white ? bb::B1 : bb::B8;
    const core::Square a = white ? bb::A1 : bb::A8;
    if ((rooks & bb::sq_bb(a)) && !(occ & (bb::sq_bb(d) | bb::sq_bb(c) | bb::sq_bb(bSq))) &&
        !attackedBy(b, d, them) && !attackedBy(b, c, them))
      out.emplace_back(kingSq, c, core::PieceType::None, false, false, CastleSide::QueenSide);
  }
}

}  // namespace gambit::model
