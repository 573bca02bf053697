#include "tadpole/position.hpp"

namespace Tadpole {

namespace {

void add_pawn_move(MoveList& moves, Square from, Square to) {
    if (rank_of(to) == 7 || rank_of(to) == 0) {
        // Promotion
        moves.push_back(Move{from, to, QUEEN});
        moves.push_back(Move{from, to, ROOK});
        moves.push_back(Move{from, to, BISHOP});
        moves.push_back(Move{from, to, KNIGHT});
    } else {
        moves.push_back(Move{from, to, NO_PIECE_TYPE});
    }
}

}

// Pseudo-legal moves: may leave the own king in check, legal_moves() filters
void Position::generate_pseudo_legal(MoveList& moves) const {
    const Color us = sideToMove;
    const Color them = ~us;
    const Bitboard occ = occupied();
    const Bitboard empty = ~occ;
    const int up = us == WHITE ? 8 : -8;
    const int startRank = us == WHITE ? 1 : 6;

    // Pawn pushes, captures and en passant
    Bitboard pawns = pieces(us, PAWN);
    while (pawns) {
        const Square from = pop_lsb(&pawns);
        const Square single = Square(from + up);

        if (empty & square_bb(single)) {
            add_pawn_move(moves, from, single);

            const Square twice = Square(single + up);
            if (rank_of(from) == startRank && (empty & square_bb(twice)))
                moves.push_back(Move{from, twice, NO_PIECE_TYPE});
        }

        Bitboard captures = PawnAttacks[us][from] & pieces(them);
        while (captures)
            add_pawn_move(moves, from, pop_lsb(&captures));

        if (epSquare != SQ_NONE && (PawnAttacks[us][from] & square_bb(epSquare)))
            moves.push_back(Move{from, epSquare, NO_PIECE_TYPE});
    }

    // Knights, sliders and king
    for (PieceType pt = KNIGHT; pt <= KING; ++pt) {
        Bitboard bb = pieces(us, pt);
        while (bb) {
            const Square from = pop_lsb(&bb);
            Bitboard targets = attacks_bb(pt, from, occ) & ~pieces(us);
            while (targets)
                moves.push_back(Move{from, pop_lsb(&targets), NO_PIECE_TYPE});
        }
    }

    generate_castling(moves);
}

// The king may not castle out of, through or into check. The destination
// square is checked again by the legality filter.
void Position::generate_castling(MoveList& moves) const {
    const Color us = sideToMove;
    const Color them = ~us;
    const uint8_t kingSide = us == WHITE ? WHITE_OO : BLACK_OO;
    const uint8_t queenSide = us == WHITE ? WHITE_OOO : BLACK_OOO;

    if (!(castling & (kingSide | queenSide)) || in_check())
        return;

    const Bitboard occ = occupied();
    const Square ksq = us == WHITE ? SQ_E1 : SQ_E8;
    const int r = rank_of(ksq);

    if (castling & kingSide) {
        const Square f = make_square(5, r), g = make_square(6, r);
        if (!(occ & (square_bb(f) | square_bb(g)))
            && !attacked_by(f, them) && !attacked_by(g, them))
            moves.push_back(Move{ksq, g, NO_PIECE_TYPE});
    }

    if (castling & queenSide) {
        const Square b = make_square(1, r), c = make_square(2, r), d = make_square(3, r);
        if (!(occ & (square_bb(b) | square_bb(c) | square_bb(d)))
            && !attacked_by(d, them) && !attacked_by(c, them))
            moves.push_back(Move{ksq, c, NO_PIECE_TYPE});
    }
}

}
