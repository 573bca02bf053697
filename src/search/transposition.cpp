#include "tadpole/transposition.hpp"
#include "tadpole/misc.hpp"
#include <algorithm>
#include <limits>
#include <mutex>
#include <vector>

namespace Tadpole {

namespace {

// Rough heap cost of one map node: key, value and TBB bucket overhead
constexpr size_t EntryFootprint = sizeof(Position) + sizeof(TableEntry) + 32;

}

TranspositionTable::TranspositionTable(size_t capacity)
    : maxEntries(std::max<size_t>(capacity, 1)),
      entryCount(0),
      oldestEntry(0),
      probeCount(0),
      hitCount(0) {}

size_t TranspositionTable::capacity_for_mb(size_t mb) {
    return std::max<size_t>(mb * 1024 * 1024 / EntryFootprint, 1);
}

ProbeResult TranspositionTable::probe(const Position& pos, unsigned depth, int alpha, int beta) const {
    std::shared_lock lock(passMutex);
    probeCount.fetch_add(1, std::memory_order_relaxed);

    Table::const_accessor acc;
    if (!table.find(acc, pos))
        return Miss{};

    hitCount.fetch_add(1, std::memory_order_relaxed);
    const TableEntry& e = acc->second;

    // Too shallow to trust the score, the move still orders the search
    if (e.depth < depth)
        return OrderingHint{e.best_response};

    switch (e.node) {
        case NodeType::PV:
            return SearchResult{e.best_response, e.score};
        case NodeType::All:
            if (e.score <= alpha)
                return SearchResult{e.best_response, alpha};
            break;
        case NodeType::Cut:
            if (e.score >= beta)
                return SearchResult{e.best_response, beta};
            break;
    }
    return OrderingHint{e.best_response};
}

void TranspositionTable::insert(const Position& pos, const TableEntry& entry) {
    bool pruned = false;

    for (;;) {
        {
            std::shared_lock lock(passMutex);
            Table::accessor acc;

            // Known position: depth-preferred replacement
            if (table.find(acc, pos)) {
                if (acc->second.depth <= entry.depth)
                    acc->second = entry;
                return;
            }

            // New position: reserve a slot below the ceiling first
            if (entryCount.fetch_add(1) < maxEntries) {
                if (!table.insert(acc, pos)) {
                    // Another thread stored it in the meantime
                    entryCount.fetch_sub(1);
                    if (acc->second.depth > entry.depth)
                        return;
                }
                acc->second = entry;
                return;
            }
            entryCount.fetch_sub(1);
        }

        std::unique_lock lock(passMutex);
        if (entryCount.load() < maxEntries)
            continue;

        // One aging pass per insert, after that only shallow entries make room
        if (!pruned) {
            Log::debug("Pruning transposition table at ", entryCount.load(), " entries");
            prune_locked();
            pruned = true;
            if (entryCount.load() < maxEntries)
                continue;
        }

        if (!evict_shallowest_locked(entry.depth))
            return;
    }
}

void TranspositionTable::age() {
    std::unique_lock lock(passMutex);
    for (auto& kv : table)
        ++kv.second.age;
    oldestEntry.fetch_add(1);
}

void TranspositionTable::prune() {
    std::unique_lock lock(passMutex);
    prune_locked();
}

// Removes every entry aged at least as often as the threshold, then lowers
// the threshold so the next pass reaches one cycle further. Entries written
// since the last age() are never removed here.
void TranspositionTable::prune_locked() {
    const int oldest = oldestEntry.load();
    const int threshold = std::max(oldest, 1);

    std::vector<Position> stale;
    for (const auto& kv : table)
        if (kv.second.age >= threshold)
            stale.push_back(kv.first);

    for (const Position& pos : stale)
        table.erase(pos);

    entryCount.fetch_sub(stale.size());
    oldestEntry.store(std::max(oldest - 1, 0));
}

// Frees a slot for an entry of the given depth by dropping a batch of the
// shallowest entries. Returns false when every stored entry is deeper, the
// new entry is then not worth a slot.
bool TranspositionTable::evict_shallowest_locked(unsigned depth) {
    if (table.empty())
        return false;

    unsigned shallowest = std::numeric_limits<unsigned>::max();
    for (const auto& kv : table)
        shallowest = std::min(shallowest, kv.second.depth);

    if (shallowest > depth)
        return false;

    const size_t batch = std::max<size_t>(maxEntries / 8, 1);
    std::vector<Position> victims;
    for (const auto& kv : table) {
        if (kv.second.depth != shallowest)
            continue;
        victims.push_back(kv.first);
        if (victims.size() == batch)
            break;
    }

    for (const Position& pos : victims)
        table.erase(pos);

    entryCount.fetch_sub(victims.size());
    return true;
}

void TranspositionTable::clear() {
    std::unique_lock lock(passMutex);
    table.clear();
    entryCount.store(0);
    oldestEntry.store(0);
    reset_stats();
}

std::optional<TableEntry> TranspositionTable::peek(const Position& pos) const {
    std::shared_lock lock(passMutex);
    Table::const_accessor acc;
    if (!table.find(acc, pos))
        return std::nullopt;
    return acc->second;
}

void TranspositionTable::reset_stats() {
    probeCount.store(0);
    hitCount.store(0);
}

}
