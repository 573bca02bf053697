#include "tadpole/search.hpp"
#include "tadpole/misc.hpp"
#include <algorithm>
#include <vector>

namespace Tadpole {

namespace Search {

namespace {

struct RootMove {
    Move move;
    int score; // opponent's point of view, the lowest is our best
};

// Puts the given move first, the others keep their relative order
void order_first(MoveList& moves, const Move& first) {
    auto it = std::find(moves.begin(), moves.end(), first);
    if (it != moves.end())
        std::rotate(moves.begin(), it, it + 1);
}

// Searches every root move in parallel with the same window and returns
// them sorted by score, ties in move list order. nullopt if any of the
// subtrees was cancelled.
std::optional<std::vector<RootMove>> search_root(const Position& root, const MoveList& moves,
                                                 int depth, int alpha, int beta,
                                                 TranspositionTable& tt, ThreadPool& pool,
                                                 const std::atomic<bool>& stop) {
    std::vector<std::optional<int>> scores(moves.size());
    std::vector<Task> tasks;
    tasks.reserve(moves.size());

    for (size_t i = 0; i < moves.size(); ++i) {
        tasks.push_back([&, i]() {
            scores[i] = alpha_beta(-beta, -alpha, 1, depth, root.apply(moves[i]), tt, stop);
        });
    }
    pool.run_batch(std::move(tasks));

    std::vector<RootMove> rootMoves;
    rootMoves.reserve(moves.size());
    for (size_t i = 0; i < moves.size(); ++i) {
        if (!scores[i])
            return std::nullopt;
        rootMoves.push_back(RootMove{moves[i], *scores[i]});
    }

    std::stable_sort(rootMoves.begin(), rootMoves.end(),
                     [](const RootMove& a, const RootMove& b) { return a.score < b.score; });
    return rootMoves;
}

}

std::optional<int> alpha_beta(int alpha, int beta, int depth, int maxDepth,
                              const Position& pos, TranspositionTable& tt,
                              const std::atomic<bool>& stop) {
    if (stop.load(std::memory_order_relaxed))
        return std::nullopt;

    if (depth >= maxDepth)
        return evaluate(pos);

    MoveList moves = pos.legal_moves();

    // Checkmate, stalemate and rule draws are scored on the spot
    if (pos.status(moves) != GameStatus::Ongoing)
        return evaluate(pos);

    const unsigned draft = unsigned(maxDepth - depth);
    const ProbeResult probe = tt.probe(pos, draft, alpha, beta);

    if (const auto* hit = std::get_if<SearchResult>(&probe))
        return hit->score;

    if (const auto* hint = std::get_if<OrderingHint>(&probe))
        order_first(moves, hint->move);

    const int alphaOrig = alpha;
    Move bestMove = moves.front();

    for (const Move& m : moves) {
        const std::optional<int> child = alpha_beta(-beta, -alpha, depth + 1, maxDepth,
                                                    pos.apply(m), tt, stop);
        if (!child)
            return std::nullopt;

        const int score = -*child;

        if (score >= beta) {
            tt.insert(pos, TableEntry{m, draft, beta, NodeType::Cut, 0});
            return beta;
        }

        if (score > alpha) {
            alpha = score;
            bestMove = m;
        }
    }

    tt.insert(pos, TableEntry{bestMove, draft, alpha,
                              alpha > alphaOrig ? NodeType::PV : NodeType::All, 0});
    return alpha;
}

std::optional<Outcome> search(const Position& root, TranspositionTable& tt, ThreadPool& pool,
                              const Limits& limits, const std::atomic<bool>& stop,
                              const InfoCallback& onInfo) {
    MoveList moves = root.legal_moves();
    if (moves.empty()) {
        Log::error("No legal moves in ", root.fen());
        return std::nullopt;
    }

    if (const auto known = tt.peek(root))
        order_first(moves, known->best_response);

    // Answer for a stop that arrives before depth 1 completes
    Outcome best{moves.front(), -evaluate(root.apply(moves.front())), 0};

    int alpha = -VALUE_INFINITE;
    int beta = VALUE_INFINITE;

    auto narrow_window = [&](int score) {
        alpha = std::max(score - limits.aspirationDelta, -VALUE_INFINITE);
        beta = std::min(score + limits.aspirationDelta, VALUE_INFINITE);
    };

    for (int depth = 1; depth <= limits.maxDepth; ++depth) {
        if (stop.load())
            break;

        // Only an exact root score is final. A bound hit carries alpha or
        // beta, not a ranked move, so it merely orders the fan-out.
        const ProbeResult probe = tt.probe(root, unsigned(depth), alpha, beta);
        const std::optional<TableEntry> stored =
            std::holds_alternative<Miss>(probe) ? std::nullopt : tt.peek(root);

        if (stored && stored->node == NodeType::PV && stored->depth >= unsigned(depth)) {
            best = Outcome{stored->best_response, stored->score, depth};
            order_first(moves, best.move);
            narrow_window(best.score);
            Log::debug("depth ", depth, " from cache: ", best.move, " score ", best.score);
            if (onInfo)
                onInfo(best);
            continue;
        }

        if (stored)
            order_first(moves, stored->best_response);

        auto rootMoves = search_root(root, moves, depth, alpha, beta, tt, pool, stop);
        if (!rootMoves)
            break;

        int score = -rootMoves->front().score;

        // The best score sits on the window edge, so it is only a bound
        if ((score <= alpha && alpha > -VALUE_INFINITE) || (score >= beta && beta < VALUE_INFINITE)) {
            Log::debug("depth ", depth, " failed ", score <= alpha ? "low" : "high",
                       " in [", alpha, ", ", beta, "], searching again");
            alpha = -VALUE_INFINITE;
            beta = VALUE_INFINITE;
            rootMoves = search_root(root, moves, depth, alpha, beta, tt, pool, stop);
            if (!rootMoves)
                break;
            score = -rootMoves->front().score;
        }

        best = Outcome{rootMoves->front().move, score, depth};
        tt.insert(root, TableEntry{best.move, unsigned(depth), score, NodeType::PV, 0});
        narrow_window(score);

        Log::debug("depth ", depth, " best ", best.move, " score ", best.score);
        if (onInfo)
            onInfo(best);
    }

    return best;
}

}

}
