#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <variant>

#include <tbb/concurrent_hash_map.h>

#include "tadpole/position.hpp"

namespace Tadpole {

enum class NodeType : uint8_t {
    PV,  // exact score
    All, // upper bound, no move raised alpha
    Cut  // lower bound, a move failed high
};

struct TableEntry {
    Move best_response;
    unsigned depth = 0; // remaining depth searched below the position
    int score = 0;
    NodeType node = NodeType::All;
    int age = 0;        // go cycles since the entry was written
};

// Outcome of a cache lookup
struct Miss {};
struct OrderingHint { Move move; };
struct SearchResult { Move move; int score; };

using ProbeResult = std::variant<Miss, OrderingHint, SearchResult>;

struct PositionHashCompare {
    size_t hash(const Position& pos) const noexcept { return size_t(pos.key()); }
    bool equal(const Position& lhs, const Position& rhs) const noexcept { return lhs == rhs; }
};

// Shared by every search thread. probe() and insert() may run concurrently
// from any number of threads; each entry is read and written under its own
// TBB accessor lock. age(), prune() and clear() walk the whole table and
// exclude the per-entry operations while they run.
class TranspositionTable {
private:
    using Table = tbb::concurrent_hash_map<Position, TableEntry, PositionHashCompare>;

    Table table;
    size_t maxEntries;
    std::atomic<size_t> entryCount;
    std::atomic<int> oldestEntry;
    mutable std::shared_mutex passMutex;

    mutable std::atomic<uint64_t> probeCount;
    mutable std::atomic<uint64_t> hitCount;

    void prune_locked();
    bool evict_shallowest_locked(unsigned depth);

public:
    static constexpr size_t DefaultHashMB = 64;

    explicit TranspositionTable(size_t capacity = capacity_for_mb(DefaultHashMB));

    TranspositionTable(const TranspositionTable&) = delete;
    TranspositionTable& operator=(const TranspositionTable&) = delete;

    // Number of entries that fit in the given amount of memory
    static size_t capacity_for_mb(size_t mb);

    ProbeResult probe(const Position& pos, unsigned depth, int alpha, int beta) const;
    void insert(const Position& pos, const TableEntry& entry);
    void age();
    void prune();
    void clear();

    // Stored entry without touching the probe statistics
    std::optional<TableEntry> peek(const Position& pos) const;

    size_t size() const { return entryCount.load(); }
    size_t capacity() const { return maxEntries; }
    int oldest_age() const { return oldestEntry.load(); }

    uint64_t probes() const { return probeCount.load(); }
    uint64_t hits() const { return hitCount.load(); }
    void reset_stats();
};

}
