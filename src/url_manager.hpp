#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"

// Mints and parses every URI this bridge serves.
class URLManager
{
public:
    explicit URLManager(const Config& conf) : config(conf) {}

    const std::string& root() const { return config.server_url_root; }
    std::string domain() const { return config.domain(); }

    std::string actor(std::string_view pubkey) const;
    std::string inbox(std::string_view pubkey) const;
    std::string outbox(std::string_view pubkey) const;
    std::string followers(std::string_view pubkey) const;
    std::string note(std::string_view event_id) const;
    std::string sharedInbox() const;
    std::string systemActor() const;
    std::string systemActorKeyId() const;
    // Id for an activity the bridge generates, e.g. a Follow or an
    // Accept. kind is lower case, unique_part makes it distinct.
    std::string activity(std::string_view kind,
                         std::string_view unique_part) const;
    // Native web client page of a key.
    std::string webProfile(std::string_view pubkey) const;

    // Inverse of actor(): the hex key, if uri is one of our actors.
    std::optional<std::string> pubkeyFromActor(std::string_view uri) const;
    // Inverse of note().
    std::optional<std::string> eventIdFromNote(std::string_view uri) const;
    // Whether the URI points at this server.
    bool isLocal(std::string_view uri) const;

    // Path patterns for the HTTP router.
    static constexpr char USER_PATH[] = "/users/:npub";
    static constexpr char USER_INBOX_PATH[] = "/users/:npub/inbox";
    static constexpr char USER_OUTBOX_PATH[] = "/users/:npub/outbox";
    static constexpr char USER_FOLLOWERS_PATH[] = "/users/:npub/followers";
    static constexpr char NOTE_PATH[] = "/notes/:id";
    static constexpr char SHARED_INBOX_PATH[] = "/inbox";
    static constexpr char SYSTEM_ACTOR_PATH[] = "/actor";

private:
    const Config& config;
};
