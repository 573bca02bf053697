#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "tadpole/transposition.hpp"

using namespace Tadpole;

namespace {

// Positions two plies from the start, all distinct
std::vector<Position> sample_positions() {
    std::vector<Position> result;
    const Position root = Position::startpos();
    for (const Move& m : root.legal_moves()) {
        const Position child = root.apply(m);
        for (const Move& reply : child.legal_moves())
            result.push_back(child.apply(reply));
    }
    return result;
}

Move move_of(const Position& pos, const char* uci) {
    return pos.parse_move(uci);
}

}

TEST(TranspositionTest, EmptyTableMisses) {
    TranspositionTable tt(16);
    const ProbeResult r = tt.probe(Position::startpos(), 1, -100, 100);
    EXPECT_TRUE(std::holds_alternative<Miss>(r));
    EXPECT_EQ(tt.probes(), 1u);
    EXPECT_EQ(tt.hits(), 0u);
}

TEST(TranspositionTest, ExactEntryAnswersAnyShallowerDepth) {
    TranspositionTable tt(16);
    const Position pos = Position::startpos();
    const Move m = move_of(pos, "e2e4");
    tt.insert(pos, TableEntry{m, 3, 50, NodeType::PV, 0});

    for (unsigned depth : { 1u, 2u, 3u }) {
        const ProbeResult r = tt.probe(pos, depth, -1000, 1000);
        ASSERT_TRUE(std::holds_alternative<SearchResult>(r));
        EXPECT_EQ(std::get<SearchResult>(r).move, m);
        EXPECT_EQ(std::get<SearchResult>(r).score, 50);
    }

    const ProbeResult deeper = tt.probe(pos, 4, -1000, 1000);
    ASSERT_TRUE(std::holds_alternative<OrderingHint>(deeper));
    EXPECT_EQ(std::get<OrderingHint>(deeper).move, m);
    EXPECT_EQ(tt.hits(), 4u);
}

TEST(TranspositionTest, UpperBoundCutsOnlyBelowAlpha) {
    TranspositionTable tt(16);
    const Position pos = Position::startpos();
    const Move m = move_of(pos, "d2d4");
    tt.insert(pos, TableEntry{m, 2, -10, NodeType::All, 0});

    const ProbeResult low = tt.probe(pos, 2, 0, 100);
    ASSERT_TRUE(std::holds_alternative<SearchResult>(low));
    EXPECT_EQ(std::get<SearchResult>(low).score, 0);

    const ProbeResult wide = tt.probe(pos, 2, -50, 100);
    EXPECT_TRUE(std::holds_alternative<OrderingHint>(wide));
}

TEST(TranspositionTest, LowerBoundCutsOnlyAboveBeta) {
    TranspositionTable tt(16);
    const Position pos = Position::startpos();
    const Move m = move_of(pos, "g1f3");
    tt.insert(pos, TableEntry{m, 2, 200, NodeType::Cut, 0});

    const ProbeResult high = tt.probe(pos, 1, -100, 100);
    ASSERT_TRUE(std::holds_alternative<SearchResult>(high));
    EXPECT_EQ(std::get<SearchResult>(high).move, m);
    EXPECT_EQ(std::get<SearchResult>(high).score, 100);

    const ProbeResult wide = tt.probe(pos, 1, -100, 300);
    EXPECT_TRUE(std::holds_alternative<OrderingHint>(wide));
}

TEST(TranspositionTest, DeeperEntriesAreKept) {
    TranspositionTable tt(16);
    const Position pos = Position::startpos();
    const Move deep = move_of(pos, "e2e4");
    const Move shallow = move_of(pos, "a2a3");

    tt.insert(pos, TableEntry{deep, 5, 30, NodeType::PV, 0});
    tt.insert(pos, TableEntry{shallow, 2, -30, NodeType::PV, 0});
    ASSERT_TRUE(tt.peek(pos).has_value());
    EXPECT_EQ(tt.peek(pos)->best_response, deep);
    EXPECT_EQ(tt.peek(pos)->depth, 5u);

    tt.insert(pos, TableEntry{shallow, 5, -30, NodeType::All, 0});
    EXPECT_EQ(tt.peek(pos)->best_response, shallow);
    EXPECT_EQ(tt.size(), 1u);
}

TEST(TranspositionTest, AgingAndPruning) {
    TranspositionTable tt(16);
    const std::vector<Position> positions = sample_positions();
    const Position& a = positions[0];
    const Position& b = positions[1];

    tt.insert(a, TableEntry{Move::none(), 1, 0, NodeType::PV, 0});
    tt.age();
    tt.age();
    tt.insert(b, TableEntry{Move::none(), 1, 0, NodeType::PV, 0});
    tt.age();

    EXPECT_EQ(tt.oldest_age(), 3);
    EXPECT_EQ(tt.peek(a)->age, 3);
    EXPECT_EQ(tt.peek(b)->age, 1);

    tt.prune();
    EXPECT_FALSE(tt.peek(a).has_value());
    ASSERT_TRUE(tt.peek(b).has_value());
    EXPECT_EQ(tt.size(), 1u);
    EXPECT_EQ(tt.oldest_age(), 2);

    // Every prune reaches one cycle further back
    tt.prune();
    EXPECT_TRUE(tt.peek(b).has_value());
    tt.prune();
    EXPECT_FALSE(tt.peek(b).has_value());
    EXPECT_EQ(tt.size(), 0u);
}

TEST(TranspositionTest, NeverGrowsPastCapacity) {
    TranspositionTable tt(8);
    const std::vector<Position> positions = sample_positions();

    for (size_t i = 0; i < 100; ++i) {
        tt.insert(positions[i], TableEntry{Move::none(), unsigned(i % 4), int(i), NodeType::PV, 0});
        EXPECT_LE(tt.size(), tt.capacity());
        if (i % 10 == 9)
            tt.age();
    }

    // The entry written last always survives
    ASSERT_TRUE(tt.peek(positions[99]).has_value());
    EXPECT_EQ(tt.peek(positions[99])->score, 99);
}

TEST(TranspositionTest, PruneKeepsEntriesWrittenSinceTheLastAge) {
    TranspositionTable tt(16);
    const std::vector<Position> positions = sample_positions();

    for (size_t i = 0; i < 4; ++i)
        tt.insert(positions[i], TableEntry{Move::none(), 1, 0, NodeType::PV, 0});

    tt.prune();
    tt.prune();
    EXPECT_EQ(tt.size(), 4u);

    // Repeated aging of an empty table must not lower the bar for fresh entries
    TranspositionTable aged(16);
    for (int i = 0; i < 5; ++i)
        aged.age();
    aged.insert(positions[0], TableEntry{Move::none(), 1, 0, NodeType::PV, 0});
    for (int i = 0; i < 8; ++i)
        aged.prune();
    EXPECT_TRUE(aged.peek(positions[0]).has_value());
}

TEST(TranspositionTest, FullTableOfYoungEntriesKeepsDeepOnes) {
    TranspositionTable tt(8);
    const std::vector<Position> positions = sample_positions();

    for (int i = 0; i < 5; ++i)
        tt.age();
    for (size_t i = 0; i < 8; ++i)
        tt.insert(positions[i], TableEntry{Move::none(), 6, int(i), NodeType::PV, 0});
    ASSERT_EQ(tt.size(), 8u);

    // Nothing is old enough to prune and everything is deeper: the newcomer is dropped
    tt.insert(positions[8], TableEntry{Move::none(), 0, 8, NodeType::PV, 0});
    EXPECT_EQ(tt.size(), 8u);
    EXPECT_FALSE(tt.peek(positions[8]).has_value());
    for (size_t i = 0; i < 8; ++i)
        EXPECT_TRUE(tt.peek(positions[i]).has_value()) << i;

    // A deeper newcomer displaces one of the shallowest entries
    tt.insert(positions[9], TableEntry{Move::none(), 7, 9, NodeType::PV, 0});
    EXPECT_EQ(tt.size(), 8u);
    ASSERT_TRUE(tt.peek(positions[9]).has_value());
    EXPECT_EQ(tt.peek(positions[9])->depth, 7u);

    size_t survivors = 0;
    for (size_t i = 0; i < 8; ++i)
        survivors += tt.peek(positions[i]).has_value();
    EXPECT_EQ(survivors, 7u);
}

TEST(TranspositionTest, ClearResetsEverything) {
    TranspositionTable tt(16);
    const Position pos = Position::startpos();
    tt.insert(pos, TableEntry{Move::none(), 1, 0, NodeType::PV, 0});
    tt.age();
    (void)tt.probe(pos, 1, -1, 1);

    tt.clear();
    EXPECT_EQ(tt.size(), 0u);
    EXPECT_EQ(tt.oldest_age(), 0);
    EXPECT_EQ(tt.probes(), 0u);
    EXPECT_FALSE(tt.peek(pos).has_value());
}

TEST(TranspositionTest, CapacityFromMegabytes) {
    EXPECT_GT(TranspositionTable::capacity_for_mb(1), 1000u);
    EXPECT_LT(TranspositionTable::capacity_for_mb(1), TranspositionTable::capacity_for_mb(2));
    EXPECT_EQ(TranspositionTable::capacity_for_mb(0), 1u);
}

TEST(TranspositionTest, ConcurrentWritersKeepTheDeepestEntry) {
    TranspositionTable tt(1024);
    const std::vector<Position> positions = sample_positions();
    constexpr unsigned NumThreads = 4;

    std::vector<std::thread> threads;
    for (unsigned t = 0; t < NumThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t i = 0; i < positions.size(); ++i) {
                // Each thread walks the positions in a different order
                const Position& pos = positions[(i * 7 + t * 101) % positions.size()];
                tt.insert(pos, TableEntry{Move::none(), t + 1, int(t), NodeType::PV, 0});
                (void)tt.probe(pos, 1, -1000, 1000);
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(tt.size(), positions.size());
    for (const Position& pos : positions) {
        const std::optional<TableEntry> e = tt.peek(pos);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->depth, NumThreads);
        EXPECT_EQ(e->score, int(NumThreads - 1));
    }
    EXPECT_EQ(tt.probes(), NumThreads * positions.size());
    EXPECT_EQ(tt.hits(), NumThreads * positions.size());
}
