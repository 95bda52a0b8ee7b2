#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <mw/url.hpp>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

#include "config.hpp"
#include "error.hpp"

namespace {

E<std::string> readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        return std::unexpected(invalidInput(
            std::format("Cannot open config file: {}", path)));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<std::string> readList(ryml::ConstNodeRef node)
{
    std::vector<std::string> result;
    for(ryml::ConstNodeRef child : node.children())
    {
        std::string value;
        child >> value;
        if(!value.empty())
        {
            result.push_back(std::move(value));
        }
    }
    return result;
}

template<typename T>
void readValue(ryml::ConstNodeRef node, const char* key, T& dest)
{
    if(node.has_child(ryml::to_csubstr(key)))
    {
        node[ryml::to_csubstr(key)] >> dest;
    }
}

} // namespace

E<Config> Config::fromFile(const std::string& path)
{
    ASSIGN_OR_RETURN(std::string content, readFile(path));
    return fromYaml(content);
}

E<Config> Config::fromYaml(const std::string& content)
{
    Config config;
    // parse_in_arena copies the buffer into the tree, so the values
    // can be read out after content goes away.
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::ConstNodeRef root = tree.crootref();
    if(!root.is_map())
    {
        return std::unexpected(invalidInput("Config root is not a mapping"));
    }

    readValue(root, "server_url_root", config.server_url_root);
    readValue(root, "bind_address", config.bind_address);
    readValue(root, "port", config.port);
    readValue(root, "data_dir", config.data_dir);
    readValue(root, "db_path", config.db_path);
    readValue(root, "secret_key", config.secret_key);
    readValue(root, "log_level", config.log_level);
    readValue(root, "worker_threads", config.worker_threads);
    readValue(root, "dedup_retention_seconds", config.dedup_retention_seconds);
    readValue(root, "subscription_lookback_seconds",
              config.subscription_lookback_seconds);
    readValue(root, "contact_list_limit", config.contact_list_limit);
    readValue(root, "max_thread_depth", config.max_thread_depth);
    readValue(root, "query_timeout_seconds", config.query_timeout_seconds);
    readValue(root, "signature_max_skew_seconds",
              config.signature_max_skew_seconds);
    readValue(root, "web_client_url", config.web_client_url);

    if(root.has_child("relays"))
    {
        config.relays = readList(root["relays"]);
    }
    if(root.has_child("metadata_relays"))
    {
        config.metadata_relays = readList(root["metadata_relays"]);
    }
    if(root.has_child("delivery"))
    {
        auto node = root["delivery"];
        readValue(node, "max_attempts", config.delivery.max_attempts);
        readValue(node, "backoff_base_ms", config.delivery.backoff_base_ms);
        readValue(node, "backoff_max_ms", config.delivery.backoff_max_ms);
        readValue(node, "max_concurrent_per_domain",
                  config.delivery.max_concurrent_per_domain);
    }
    if(root.has_child("relay_backoff"))
    {
        auto node = root["relay_backoff"];
        readValue(node, "base_ms", config.relay_backoff.base_ms);
        readValue(node, "max_ms", config.relay_backoff.max_ms);
    }
    if(root.has_child("cache"))
    {
        auto node = root["cache"];
        readValue(node, "actor_capacity", config.cache.actor_capacity);
        readValue(node, "actor_ttl_seconds", config.cache.actor_ttl_seconds);
        readValue(node, "profile_capacity", config.cache.profile_capacity);
        readValue(node, "profile_ttl_seconds",
                  config.cache.profile_ttl_seconds);
        readValue(node, "seen_capacity", config.cache.seen_capacity);
    }
    if(root.has_child("nodeinfo"))
    {
        auto node = root["nodeinfo"];
        readValue(node, "name", config.nodeinfo.name);
        readValue(node, "description", config.nodeinfo.description);
    }

    if(config.server_url_root.empty())
    {
        return std::unexpected(invalidInput("server_url_root is required"));
    }
    while(config.server_url_root.ends_with('/'))
    {
        config.server_url_root.pop_back();
    }
    if(config.db_path.empty())
    {
        config.db_path =
            (std::filesystem::path(config.data_dir) / "nostap.db").string();
    }
    if(config.delivery.max_attempts < 1)
    {
        return std::unexpected(invalidInput(
            "delivery.max_attempts must be at least 1"));
    }
    if(config.worker_threads < 2)
    {
        config.worker_threads = 2;
    }
    return config;
}

std::string Config::domain() const
{
    auto url = mw::URL::fromStr(server_url_root);
    if(!url.has_value())
    {
        return "";
    }
    if(url->port().empty())
    {
        return url->host();
    }
    return std::format("{}:{}", url->host(), url->port());
}
