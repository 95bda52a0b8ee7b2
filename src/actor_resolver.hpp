#pragma once

#include <optional>
#include <string>

#include <mw/crypto.hpp>
#include <nlohmann/json.hpp>

#include "cache.hpp"
#include "config.hpp"
#include "error.hpp"
#include "http_client_pool.hpp"
#include "identity_mapper.hpp"
#include "single_flight.hpp"
#include "store.hpp"
#include "types.hpp"
#include "url_manager.hpp"

// Fetches federation documents with GET requests signed by the system
// actor, and keeps remote actors in the cache and the store.
class ActorResolver
{
public:
    ActorResolver(StoreInterface& store, HttpClientPool& http,
                  mw::CryptoInterface& crypto, const URLManager& urls,
                  SystemKeys system_keys, const CacheConfig& cache_conf);

    // Cached or stored actor, of any age. Never fetches.
    E<std::optional<RemoteActor>> lookup(const std::string& uri);
    // Fetches the actor document. Nothing is remembered; use remember()
    // once the result is trusted.
    E<RemoteActor> fetch(const std::string& uri);
    E<void> remember(const RemoteActor& actor);
    // A fresh record if there is one, otherwise fetches and remembers.
    // Falls back to a stale record if the fetch fails.
    E<RemoteActor> resolve(const std::string& uri);

    // Fetches any federation document. NOT_FOUND for 404 and 410.
    E<nlohmann::json> fetchObject(const std::string& uri);

private:
    bool fresh(const RemoteActor& actor) const;

    StoreInterface& store;
    HttpClientPool& http;
    mw::CryptoInterface& crypto;
    const URLManager& urls;
    SystemKeys system_keys;
    int64_t ttl_seconds;
    ShardedLruCache<std::string, RemoteActor> actors;
    SingleFlight<std::string, E<RemoteActor>> fetch_flight;
};
