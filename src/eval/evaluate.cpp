#include "tadpole/evaluate.hpp"
#include "tadpole/position.hpp"

namespace Tadpole {

namespace {

int material(const Position& pos, Color c) {
    int total = 0;
    for (PieceType pt = PAWN; pt <= QUEEN; ++pt)
        total += PieceValue[pt] * popcount(pos.pieces(c, pt));
    return total;
}

}

int evaluate(const Position& pos) {
    const MoveList moves = pos.legal_moves();

    switch (pos.status(moves)) {
        case GameStatus::Won:     return -VALUE_MATE;
        case GameStatus::Drawn:   return VALUE_DRAW;
        case GameStatus::Ongoing: break;
    }

    const Color us = pos.side_to_move();
    int score = material(pos, us) - material(pos, ~us);

    // Opponent mobility is counted on the null move, skipped while in check
    if (const auto passed = pos.null_move()) {
        const int mobility = int(moves.size()) - int(passed->legal_moves().size());
        score += MobilityWeight * mobility;
    }

    return score;
}

}
