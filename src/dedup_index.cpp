#include "dedup_index.hpp"

#include <spdlog/spdlog.h>

DedupIndex::DedupIndex(StoreInterface& store, size_t memory_capacity,
                       int64_t retention_seconds)
    : store(store), retention_seconds(retention_seconds),
      recent(memory_capacity, std::chrono::seconds(retention_seconds))
{
}

E<std::optional<int64_t>> DedupIndex::lookup(const std::string& id)
{
    if(auto cached = recent.get(id); cached.has_value())
    {
        return cached;
    }
    ASSIGN_OR_RETURN(auto persisted, store.getSeen(id));
    if(persisted.has_value())
    {
        recent.put(id, *persisted);
    }
    return persisted;
}

E<bool> DedupIndex::markFirstSeen(const std::string& id, int64_t now)
{
    auto guard = locks.lock(id);
    ASSIGN_OR_RETURN(auto first_seen, lookup(id));
    if(first_seen.has_value() && withinWindow(*first_seen, now))
    {
        return false;
    }
    DO_OR_RETURN(store.putSeen(id, now));
    recent.put(id, now);
    return true;
}

E<bool> DedupIndex::contains(const std::string& id, int64_t now)
{
    ASSIGN_OR_RETURN(auto first_seen, lookup(id));
    return first_seen.has_value() && withinWindow(*first_seen, now);
}

E<int> DedupIndex::purge(int64_t now)
{
    recent.evictExpired();
    ASSIGN_OR_RETURN(int purged, store.purgeSeenBefore(now - retention_seconds));
    if(purged > 0)
    {
        spdlog::debug("Purged {} dedup records", purged);
    }
    return purged;
}
