#pragma once
#include <atomic>
#include <functional>
#include <optional>

#include "tadpole/evaluate.hpp"
#include "tadpole/position.hpp"
#include "tadpole/thread.hpp"
#include "tadpole/transposition.hpp"

namespace Tadpole {

namespace Search {

struct Limits {
    int maxDepth = 7;
    int aspirationDelta = 100;
};

// Best move and its score from the point of view of the side to move at
// the root. depth is the last completed iteration, 0 for the seed move.
struct Outcome {
    Move move;
    int score = 0;
    int depth = 0;
};

using InfoCallback = std::function<void(const Outcome&)>;

// Negamax alpha-beta, fail-hard. depth counts plies from the search root,
// the leaves sit at maxDepth. Returns nullopt once stop has been raised.
std::optional<int> alpha_beta(int alpha, int beta, int depth, int maxDepth,
                              const Position& pos, TranspositionTable& tt,
                              const std::atomic<bool>& stop);

// Iterative deepening driver. Returns nullopt when the root has no legal
// move, otherwise the result of the deepest completed iteration.
std::optional<Outcome> search(const Position& root, TranspositionTable& tt, ThreadPool& pool,
                              const Limits& limits, const std::atomic<bool>& stop,
                              const InfoCallback& onInfo = nullptr);

}

}
