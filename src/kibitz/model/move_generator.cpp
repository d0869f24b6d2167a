#include "kibitz/model/move_generator.hpp"

#include <cstdint>

#include "kibitz/model/move_helper.hpp"

namespace kibitz::model {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

using PT = core::PieceType;

struct SideSets {
  bb::Bitboard pawns, knights, bishops, rooks, queens, king, all, noKing;
};

KIBITZ_ALWAYS_INLINE SideSets side_sets(const Board& b, Color c) noexcept {
  const bb::Bitboard pawns = b.getPieces(c, PT::Pawn);
  const bb::Bitboard knights = b.getPieces(c, PT::Knight);
  const bb::Bitboard bishops = b.getPieces(c, PT::Bishop);
  const bb::Bitboard rooks = b.getPieces(c, PT::Rook);
  const bb::Bitboard queens = b.getPieces(c, PT::Queen);
  const bb::Bitboard king = b.getPieces(c, PT::King);
  const bb::Bitboard all = b.getPieces(c);
  return SideSets{pawns, knights, bishops, rooks, queens, king, all, all & ~king};
}

constexpr PT promoOrder[4] = {PT::Queen, PT::Rook, PT::Bishop, PT::Knight};

// ---------------- Piece generators ----------------

template <Color Side, class Emit>
void genPawnMoves_T(const GameState& st, bb::Bitboard occ, const SideSets& our,
                    const SideSets& opp, Emit&& emit) {
  if (!our.pawns) return;

  constexpr bool W = (Side == Color::White);
  constexpr int push = W ? 8 : -8;
  constexpr bb::Bitboard promoRank = W ? bb::RANK_8 : bb::RANK_1;
  constexpr bb::Bitboard dblRank = W ? bb::RANK_3 : bb::RANK_6;

  const bb::Bitboard empty = ~occ;
  const bb::Bitboard them = opp.noKing;

  const bb::Bitboard one = (W ? bb::north(our.pawns) : bb::south(our.pawns)) & empty;
  const bb::Bitboard dbl = (W ? bb::north(one & dblRank) : bb::south(one & dblRank)) & empty;

  auto emitPawn = [&](Square from, Square to, bool cap) {
    if (bb::sq_bb(to) & promoRank) {
      for (PT promo : promoOrder) emit(Move{from, to, promo, cap, false, CastleSide::None});
    } else {
      emit(Move{from, to, PT::None, cap, false, CastleSide::None});
    }
  };

  for (bb::Bitboard q = one; q;) {
    const Square to = bb::pop_lsb(q);
    emitPawn(static_cast<Square>(to - push), to, false);
  }
  for (bb::Bitboard d = dbl; d;) {
    const Square to = bb::pop_lsb(d);
    emit(Move{static_cast<Square>(to - 2 * push), to, PT::None, false, false, CastleSide::None});
  }

  // Captures towards the a-file and towards the h-file
  const bb::Bitboard capL = (W ? bb::nw(our.pawns) : bb::sw(our.pawns)) & them;
  const bb::Bitboard capR = (W ? bb::ne(our.pawns) : bb::se(our.pawns)) & them;
  constexpr int stepL = W ? 7 : -9;
  constexpr int stepR = W ? 9 : -7;

  for (bb::Bitboard c = capL; c;) {
    const Square to = bb::pop_lsb(c);
    emitPawn(static_cast<Square>(to - stepL), to, true);
  }
  for (bb::Bitboard c = capR; c;) {
    const Square to = bb::pop_lsb(c);
    emitPawn(static_cast<Square>(to - stepR), to, true);
  }

  // En passant
  if (st.enPassantSquare != core::NO_SQUARE) {
    const Square epSq = st.enPassantSquare;
    const Square victim = static_cast<Square>(epSq - push);
    if (!(opp.pawns & bb::sq_bb(victim)) || (occ & bb::sq_bb(epSq))) return;
    // our pawns that attack epSq are those a pawn of the other colour on epSq would attack
    for (bb::Bitboard from = bb::pawn_attacks_from(~Side, epSq) & our.pawns; from;) {
      emit(Move{bb::pop_lsb(from), epSq, PT::None, true, true, CastleSide::None});
    }
  }
}

template <class Emit>
void genLeaperOrSlider(bb::Bitboard pieces, const SideSets& our, const SideSets& opp,
                       bb::Bitboard occ, bb::Bitboard (*attacks)(Square, bb::Bitboard),
                       Emit&& emit) {
  for (bb::Bitboard p = pieces; p;) {
    const Square from = bb::pop_lsb(p);
    const bb::Bitboard atk = attacks(from, occ) & ~our.all;

    for (bb::Bitboard caps = atk & opp.noKing; caps;) {
      emit(Move{from, bb::pop_lsb(caps), PT::None, true, false, CastleSide::None});
    }
    for (bb::Bitboard quiet = atk & ~occ; quiet;) {
      emit(Move{from, bb::pop_lsb(quiet), PT::None, false, false, CastleSide::None});
    }
  }
}

bb::Bitboard knightAtk(Square s, bb::Bitboard) {
  return bb::knight_attacks_from(s);
}
bb::Bitboard bishopAtk(Square s, bb::Bitboard occ) {
  return bb::bishop_attacks(s, occ);
}
bb::Bitboard rookAtk(Square s, bb::Bitboard occ) {
  return bb::rook_attacks(s, occ);
}
bb::Bitboard queenAtk(Square s, bb::Bitboard occ) {
  return bb::queen_attacks(s, occ);
}
bb::Bitboard kingAtk(Square s, bb::Bitboard) {
  return bb::king_attacks_from(s);
}

template <class Emit>
void genCastling(const Board& board, const GameState& st, Color side, const SideSets& our,
                 bb::Bitboard occ, Emit&& emit) {
  // Through-check tests live here because Position::doMove() validates only the final king square.
  const Color enemySide = ~side;
  auto safe = [&](Square a, Square b, Square c) {
    return !attackedBy(board, a, enemySide, occ) && !attackedBy(board, b, enemySide, occ) &&
           !attackedBy(board, c, enemySide, occ);
  };

  if (side == Color::White) {
    if (!(our.king & bb::sq_bb(bb::E1))) return;
    if ((st.castlingRights & bb::Castling::WK) && (our.rooks & bb::sq_bb(bb::H1)) &&
        !(occ & (bb::sq_bb(bb::F1) | bb::sq_bb(bb::G1))) && safe(bb::E1, bb::F1, bb::G1)) {
      emit(Move{bb::E1, bb::G1, PT::None, false, false, CastleSide::KingSide});
    }
    if ((st.castlingRights & bb::Castling::WQ) && (our.rooks & bb::sq_bb(bb::A1)) &&
        !(occ & (bb::sq_bb(bb::D1) | bb::sq_bb(bb::C1) | bb::sq_bb(bb::B1))) &&
        safe(bb::E1, bb::D1, bb::C1)) {
      emit(Move{bb::E1, bb::C1, PT::None, false, false, CastleSide::QueenSide});
    }
  } else {
    if (!(our.king & bb::sq_bb(bb::E8))) return;
    if ((st.castlingRights & bb::Castling::BK) && (our.rooks & bb::sq_bb(bb::H8)) &&
        !(occ & (bb::sq_bb(bb::F8) | bb::sq_bb(bb::G8))) && safe(bb::E8, bb::F8, bb::G8)) {
      emit(Move{bb::E8, bb::G8, PT::None, false, false, CastleSide::KingSide});
    }
    if ((st.castlingRights & bb::Castling::BQ) && (our.rooks & bb::sq_bb(bb::A8)) &&
        !(occ & (bb::sq_bb(bb::D8) | bb::sq_bb(bb::C8) | bb::sq_bb(bb::B8))) &&
        safe(bb::E8, bb::D8, bb::C8)) {
      emit(Move{bb::E8, bb::C8, PT::None, false, false, CastleSide::QueenSide});
    }
  }
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const GameState& st,
                                             std::vector<Move>& out) const {
  if (out.capacity() < 128) out.reserve(128);
  out.clear();
  auto emit = [&](const Move& m) { out.push_back(m); };

  const Color side = st.sideToMove;
  const SideSets our = side_sets(b, side);
  const SideSets opp = side_sets(b, ~side);
  const bb::Bitboard occ = b.getAllPieces();

  if (side == Color::White)
    genPawnMoves_T<Color::White>(st, occ, our, opp, emit);
  else
    genPawnMoves_T<Color::Black>(st, occ, our, opp, emit);

  genLeaperOrSlider(our.knights, our, opp, occ, knightAtk, emit);
  genLeaperOrSlider(our.bishops, our, opp, occ, bishopAtk, emit);
  genLeaperOrSlider(our.rooks, our, opp, occ, rookAtk, emit);
  genLeaperOrSlider(our.queens, our, opp, occ, queenAtk, emit);
  genLeaperOrSlider(our.king, our, opp, occ, kingAtk, emit);
  genCastling(b, st, side, our, occ, emit);
}

}  // namespace kibitz::model
