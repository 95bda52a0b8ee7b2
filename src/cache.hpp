#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

// A bounded LRU map with optional expiry, split into independently
// locked shards so unrelated keys do not contend. Capacity is divided
// evenly between the shards.
template<typename K, typename V, typename Hash = std::hash<K>>
class ShardedLruCache
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    // A ttl of zero means entries only leave by eviction.
    ShardedLruCache(size_t capacity, std::chrono::seconds ttl,
                    size_t shard_count = 8)
        : ttl(ttl), now([] { return Clock::now(); })
    {
        if(shard_count == 0)
        {
            shard_count = 1;
        }
        if(capacity < shard_count)
        {
            shard_count = capacity == 0 ? 1 : capacity;
        }
        size_t per_shard = std::max<size_t>(1, capacity / shard_count);
        shards.reserve(shard_count);
        for(size_t i = 0; i < shard_count; i++)
        {
            shards.push_back(std::make_unique<Shard>());
            shards.back()->capacity = per_shard;
        }
    }

    std::optional<V> get(const K& key)
    {
        Shard& s = shardFor(key);
        std::lock_guard<std::mutex> lock(s.lock);
        auto it = s.index.find(key);
        if(it == s.index.end())
        {
            return std::nullopt;
        }
        if(expired(*it->second))
        {
            s.entries.erase(it->second);
            s.index.erase(it);
            return std::nullopt;
        }
        s.entries.splice(s.entries.begin(), s.entries, it->second);
        return it->second->value;
    }

    void put(const K& key, V value)
    {
        Shard& s = shardFor(key);
        std::lock_guard<std::mutex> lock(s.lock);
        auto it = s.index.find(key);
        if(it != s.index.end())
        {
            it->second->value = std::move(value);
            it->second->expires_at = expiry();
            s.entries.splice(s.entries.begin(), s.entries, it->second);
            return;
        }
        s.entries.push_front(Entry{key, std::move(value), expiry()});
        s.index.emplace(key, s.entries.begin());
        while(s.entries.size() > s.capacity)
        {
            s.index.erase(s.entries.back().key);
            s.entries.pop_back();
        }
    }

    void erase(const K& key)
    {
        Shard& s = shardFor(key);
        std::lock_guard<std::mutex> lock(s.lock);
        auto it = s.index.find(key);
        if(it != s.index.end())
        {
            s.entries.erase(it->second);
            s.index.erase(it);
        }
    }

    // Drops every expired entry; returns how many.
    size_t evictExpired()
    {
        size_t count = 0;
        for(auto& s : shards)
        {
            std::lock_guard<std::mutex> lock(s->lock);
            for(auto it = s->entries.begin(); it != s->entries.end();)
            {
                if(expired(*it))
                {
                    s->index.erase(it->key);
                    it = s->entries.erase(it);
                    count++;
                }
                else
                {
                    ++it;
                }
            }
        }
        return count;
    }

    size_t size() const
    {
        size_t total = 0;
        for(const auto& s : shards)
        {
            std::lock_guard<std::mutex> lock(s->lock);
            total += s->entries.size();
        }
        return total;
    }

    void clear()
    {
        for(auto& s : shards)
        {
            std::lock_guard<std::mutex> lock(s->lock);
            s->index.clear();
            s->entries.clear();
        }
    }

    // For tests.
    void setClock(NowFn fn) { now = std::move(fn); }

private:
    struct Entry
    {
        K key;
        V value;
        std::optional<Clock::time_point> expires_at;
    };

    struct Shard
    {
        mutable std::mutex lock;
        size_t capacity = 1;
        std::list<Entry> entries;
        std::unordered_map<K, typename std::list<Entry>::iterator, Hash> index;
    };

    Shard& shardFor(const K& key)
    {
        return *shards[Hash{}(key) % shards.size()];
    }

    std::optional<Clock::time_point> expiry() const
    {
        if(ttl.count() == 0)
        {
            return std::nullopt;
        }
        return now() + ttl;
    }

    bool expired(const Entry& e) const
    {
        return e.expires_at.has_value() && now() >= *e.expires_at;
    }

    std::chrono::seconds ttl;
    NowFn now;
    std::vector<std::unique_ptr<Shard>> shards;
};
