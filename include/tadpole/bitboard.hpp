#pragma once
#include <cstdint>
#include <string>

namespace Tadpole {

// Compile-time constants
constexpr int SQUARE_NB = 64;
constexpr int PIECE_TYPE_NB = 6;
constexpr int COLOR_NB = 2;

// Bitboard type
using Bitboard = uint64_t;

enum Color : uint8_t { WHITE, BLACK };

enum PieceType : uint8_t { PAWN, KNIGHT, BISHOP, ROOK, QUEEN, KING, NO_PIECE_TYPE };

enum Square : int8_t {
    SQ_A1, SQ_B1, SQ_C1, SQ_D1, SQ_E1, SQ_F1, SQ_G1, SQ_H1,
    SQ_A2, SQ_B2, SQ_C2, SQ_D2, SQ_E2, SQ_F2, SQ_G2, SQ_H2,
    SQ_A3, SQ_B3, SQ_C3, SQ_D3, SQ_E3, SQ_F3, SQ_G3, SQ_H3,
    SQ_A4, SQ_B4, SQ_C4, SQ_D4, SQ_E4, SQ_F4, SQ_G4, SQ_H4,
    SQ_A5, SQ_B5, SQ_C5, SQ_D5, SQ_E5, SQ_F5, SQ_G5, SQ_H5,
    SQ_A6, SQ_B6, SQ_C6, SQ_D6, SQ_E6, SQ_F6, SQ_G6, SQ_H6,
    SQ_A7, SQ_B7, SQ_C7, SQ_D7, SQ_E7, SQ_F7, SQ_G7, SQ_H7,
    SQ_A8, SQ_B8, SQ_C8, SQ_D8, SQ_E8, SQ_F8, SQ_G8, SQ_H8,
    SQ_NONE
};

// Castling rights bits
enum CastlingRights : uint8_t {
    NO_CASTLING = 0,
    WHITE_OO = 1,
    WHITE_OOO = 2,
    BLACK_OO = 4,
    BLACK_OOO = 8,
    ANY_CASTLING = 15
};

constexpr Bitboard Rank1BB = 0xFFull;
constexpr Bitboard Rank2BB = Rank1BB << 8;
constexpr Bitboard Rank7BB = Rank1BB << 48;
constexpr Bitboard Rank8BB = Rank1BB << 56;

constexpr Color operator~(Color c) { return Color(c ^ BLACK); }

inline Square& operator++(Square& s) { return s = Square(int(s) + 1); }
inline PieceType& operator++(PieceType& pt) { return pt = PieceType(int(pt) + 1); }

constexpr Square make_square(int file, int rank) { return Square(rank * 8 + file); }
constexpr int file_of(Square s) { return s & 7; }
constexpr int rank_of(Square s) { return s >> 3; }
constexpr bool is_ok(Square s) { return s >= SQ_A1 && s <= SQ_H8; }

constexpr Bitboard square_bb(Square s) { return 1ull << s; }

inline int popcount(Bitboard b) { return __builtin_popcountll(b); }
inline Square lsb(Bitboard b) { return Square(__builtin_ctzll(b)); }
inline Square msb(Bitboard b) { return Square(63 ^ __builtin_clzll(b)); }

inline Square pop_lsb(Bitboard* b) {
    const Square s = lsb(*b);
    *b &= *b - 1;
    return s;
}

// Pre-computed attack tables, filled once by init_bitboards()
extern Bitboard PawnAttacks[COLOR_NB][SQUARE_NB];
extern Bitboard KnightAttacks[SQUARE_NB];
extern Bitboard KingAttacks[SQUARE_NB];

void init_bitboards();

// Sliding attacks by classical ray scan; occupied includes the blockers
Bitboard bishop_attacks_bb(Square s, Bitboard occupied);
Bitboard rook_attacks_bb(Square s, Bitboard occupied);

inline Bitboard attacks_bb(PieceType pt, Square s, Bitboard occupied) {
    switch (pt) {
        case KNIGHT: return KnightAttacks[s];
        case BISHOP: return bishop_attacks_bb(s, occupied);
        case ROOK:   return rook_attacks_bb(s, occupied);
        case QUEEN:  return bishop_attacks_bb(s, occupied) | rook_attacks_bb(s, occupied);
        case KING:   return KingAttacks[s];
        default:     return 0;
    }
}

std::string square_to_string(Square s);
Square square_from_string(const std::string& str);

}
