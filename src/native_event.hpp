#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace kind
{
constexpr int METADATA = 0;
constexpr int TEXT_NOTE = 1;
constexpr int CONTACT_LIST = 3;
constexpr int DELETION = 5;
constexpr int REPOST = 6;
constexpr int REACTION = 7;
} // namespace kind

using Tag = std::vector<std::string>;

// A signed event as it travels between relays. Keys, ids and
// signatures are lowercase hex.
struct NativeEvent
{
    std::string id;
    std::string pubkey;
    int64_t created_at = 0;
    int kind = 0;
    std::vector<Tag> tags;
    std::string content;
    std::string sig;

    bool operator==(const NativeEvent&) const = default;

    // SHA-256 over the canonical serialization, in hex.
    std::string computeId() const;
    // Fills pubkey, id and sig from a secret key.
    E<void> sign(std::string_view secret_hex);
    // Checks the id and the signature.
    bool verify() const;

    // First tag with this name, if any.
    const Tag* findTag(std::string_view name) const;
    // Second element of every tag with this name.
    std::vector<std::string> tagValues(std::string_view name) const;

    // Whether the bridge published this on behalf of a federated actor.
    bool isFromFederation() const;

    nlohmann::json toJson() const;
    static E<NativeEvent> fromJson(const nlohmann::json& j);
};

// A subscription filter. Tag filters are keyed by the single-letter
// tag name, without the “#”.
struct Filter
{
    std::vector<std::string> ids;
    std::vector<std::string> authors;
    std::vector<int> kinds;
    std::map<char, std::vector<std::string>> tags;
    std::optional<int64_t> since;
    std::optional<int64_t> until;
    std::optional<int> limit;

    bool operator==(const Filter&) const = default;

    bool matches(const NativeEvent& event) const;
    nlohmann::json toJson() const;
};

// Messages a relay sends to a client.
namespace relay_msg
{

struct Event
{
    std::string subscription;
    NativeEvent event;
};

struct Eose
{
    std::string subscription;
};

struct Ok
{
    std::string event_id;
    bool accepted = false;
    std::string message;
};

struct Notice
{
    std::string message;
};

struct Closed
{
    std::string subscription;
    std::string message;
};

} // namespace relay_msg

using RelayMessage = std::variant<relay_msg::Event, relay_msg::Eose,
                                  relay_msg::Ok, relay_msg::Notice,
                                  relay_msg::Closed>;

E<RelayMessage> parseRelayMessage(std::string_view text);

// Messages a client sends to a relay, serialized.
std::string reqMessage(const std::string& subscription,
                       const std::vector<Filter>& filters);
std::string closeMessage(const std::string& subscription);
std::string eventMessage(const NativeEvent& event);
