#pragma once

namespace Tadpole {

class Position;

constexpr int VALUE_DRAW = 0;
constexpr int VALUE_MATE = 20000;
constexpr int VALUE_INFINITE = 30000;

constexpr int PieceValue[] = { 100, 320, 330, 500, 900, 0 };
constexpr int MobilityWeight = 4;

// Static score from the point of view of the side to move. A checkmated
// side to move scores -VALUE_MATE, any draw scores VALUE_DRAW.
int evaluate(const Position& pos);

}
