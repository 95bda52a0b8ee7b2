#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "error.hpp"

struct NodeInfoConfig
{
    std::string name = "nostap";
    std::string description;
};

struct DeliveryConfig
{
    // Total attempts per (activity, inbox) pair, first try included.
    int max_attempts = 5;
    int64_t backoff_base_ms = 30 * 1000;
    int64_t backoff_max_ms = 30 * 60 * 1000;
    int max_concurrent_per_domain = 4;
};

struct RelayBackoffConfig
{
    int64_t base_ms = 1000;
    int64_t max_ms = 5 * 60 * 1000;
};

struct CacheConfig
{
    size_t actor_capacity = 1000;
    int64_t actor_ttl_seconds = 60 * 60;
    size_t profile_capacity = 1000;
    int64_t profile_ttl_seconds = 10 * 60;
    size_t seen_capacity = 100000;
};

struct Config
{
    // Root of every URI this bridge mints, e.g. “https://bridge.example”.
    std::string server_url_root;
    std::string bind_address = "0.0.0.0";
    int port = 8080;
    std::string data_dir = ".";
    std::string db_path;
    // Seed for the native keys derived for federated actors. Filled
    // from the store on first start when left empty.
    std::string secret_key;
    std::string log_level = "info";

    std::vector<std::string> relays;
    std::vector<std::string> metadata_relays;

    int worker_threads = 4;
    DeliveryConfig delivery;
    RelayBackoffConfig relay_backoff;
    int64_t dedup_retention_seconds = 24 * 60 * 60;
    int64_t subscription_lookback_seconds = 3 * 60;
    CacheConfig cache;
    size_t contact_list_limit = 500;
    int max_thread_depth = 100;
    int query_timeout_seconds = 10;
    int signature_max_skew_seconds = 300;
    // Profile pages for native users are linked as
    // web_client_url + npub.
    std::string web_client_url = "https://njump.me/";
    NodeInfoConfig nodeinfo;

    static E<Config> fromFile(const std::string& path);
    static E<Config> fromYaml(const std::string& content);

    // Host (and port, if any) of server_url_root.
    std::string domain() const;
};
