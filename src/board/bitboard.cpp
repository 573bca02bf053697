#include "tadpole/bitboard.hpp"
#include <mutex>
#include <stdexcept>

namespace Tadpole {

Bitboard PawnAttacks[COLOR_NB][SQUARE_NB];
Bitboard KnightAttacks[SQUARE_NB];
Bitboard KingAttacks[SQUARE_NB];

namespace {

// Ray directions as (file, rank) steps. The first four grow the square
// index, so the nearest blocker on them is the least significant bit.
enum Direction { NORTH, EAST, NORTH_EAST, NORTH_WEST, SOUTH, WEST, SOUTH_EAST, SOUTH_WEST, DIRECTION_NB };

constexpr int DirFile[DIRECTION_NB] = { 0, 1, 1, -1, 0, -1, 1, -1 };
constexpr int DirRank[DIRECTION_NB] = { 1, 0, 1, 1, -1, 0, -1, -1 };

Bitboard RayBB[DIRECTION_NB][SQUARE_NB];

Bitboard step_bb(Square s, int df, int dr) {
    const int f = file_of(s) + df;
    const int r = rank_of(s) + dr;
    return (f >= 0 && f < 8 && r >= 0 && r < 8) ? square_bb(make_square(f, r)) : 0;
}

Bitboard ray_attacks(Direction d, Square s, Bitboard occupied) {
    Bitboard attacks = RayBB[d][s];
    const Bitboard blockers = attacks & occupied;
    if (blockers) {
        const Square b = d < SOUTH ? lsb(blockers) : msb(blockers);
        attacks ^= RayBB[d][b];
    }
    return attacks;
}

}

// Initialize all attack tables (called once at startup)
void init_bitboards() {
    static std::once_flag flag;
    std::call_once(flag, [](){
        constexpr int knightSteps[8][2] = { {1, 2}, {2, 1}, {2, -1}, {1, -2},
                                            {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2} };

        for (Square s = SQ_A1; s <= SQ_H8; ++s) {
            PawnAttacks[WHITE][s] = step_bb(s, -1, 1) | step_bb(s, 1, 1);
            PawnAttacks[BLACK][s] = step_bb(s, -1, -1) | step_bb(s, 1, -1);

            KnightAttacks[s] = 0;
            for (const auto& st : knightSteps)
                KnightAttacks[s] |= step_bb(s, st[0], st[1]);

            KingAttacks[s] = 0;
            for (int d = 0; d < DIRECTION_NB; ++d) {
                KingAttacks[s] |= step_bb(s, DirFile[d], DirRank[d]);

                Bitboard ray = 0;
                int f = file_of(s) + DirFile[d];
                int r = rank_of(s) + DirRank[d];
                while (f >= 0 && f < 8 && r >= 0 && r < 8) {
                    ray |= square_bb(make_square(f, r));
                    f += DirFile[d];
                    r += DirRank[d];
                }
                RayBB[d][s] = ray;
            }
        }
    });
}

Bitboard bishop_attacks_bb(Square s, Bitboard occupied) {
    return ray_attacks(NORTH_EAST, s, occupied) | ray_attacks(NORTH_WEST, s, occupied)
         | ray_attacks(SOUTH_EAST, s, occupied) | ray_attacks(SOUTH_WEST, s, occupied);
}

Bitboard rook_attacks_bb(Square s, Bitboard occupied) {
    return ray_attacks(NORTH, s, occupied) | ray_attacks(EAST, s, occupied)
         | ray_attacks(SOUTH, s, occupied) | ray_attacks(WEST, s, occupied);
}

std::string square_to_string(Square s) {
    return std::string{ char('a' + file_of(s)), char('1' + rank_of(s)) };
}

Square square_from_string(const std::string& str) {
    if (str.size() != 2 || str[0] < 'a' || str[0] > 'h' || str[1] < '1' || str[1] > '8')
        throw std::invalid_argument("bad square: " + str);
    return make_square(str[0] - 'a', str[1] - '1');
}

}
