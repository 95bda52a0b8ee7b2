#pragma once

#include <cstdint>
#include <string>

#include "cache.hpp"
#include "error.hpp"
#include "keyed_lock.hpp"
#include "store.hpp"
#include "utils.hpp"

// Remembers which event and activity ids were already processed. An id
// recorded within the retention window is always reported as seen; the
// persisted record is the source of truth and the in-memory map only
// saves store round trips.
class DedupIndex
{
public:
    DedupIndex(StoreInterface& store, size_t memory_capacity,
               int64_t retention_seconds);

    // Records the id and returns true if it was not seen within the
    // retention window; returns false for a duplicate.
    E<bool> markFirstSeen(const std::string& id, int64_t now = nowSeconds());
    E<bool> contains(const std::string& id, int64_t now = nowSeconds());
    // Deletes records older than the retention window.
    E<int> purge(int64_t now = nowSeconds());

    int64_t retention() const { return retention_seconds; }

private:
    bool withinWindow(int64_t first_seen, int64_t now) const
    {
        return now - first_seen < retention_seconds;
    }
    E<std::optional<int64_t>> lookup(const std::string& id);

    StoreInterface& store;
    int64_t retention_seconds;
    ShardedLruCache<std::string, int64_t> recent;
    KeyedLock locks;
};
