#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"

// An account handle as used by WebFinger, “name@server.com”.
struct AccountHandle
{
    std::string name;
    std::string server;

    // Accepts “name@server.com”, “@name@server.com” and
    // “acct:name@server.com”.
    static E<AccountHandle> fromStr(std::string_view s);

    std::string idStr() const;
};

// The federated face of a native key. Everything except the profile
// fields is fixed at first materialization.
struct VirtualActor
{
    // Hex x-only public key.
    std::string pubkey;
    std::string uri;
    std::string display_name;
    std::string summary;
    std::string avatar;
    std::string public_key_pem;
    std::string private_key_pem;
    int64_t created_at = 0;
    // created_at of the metadata event the profile fields come from.
    int64_t profile_updated_at = 0;

    std::string inbox() const { return uri + "/inbox"; }
    std::string outbox() const { return uri + "/outbox"; }
    std::string followers() const { return uri + "/followers"; }
    std::string keyId() const { return uri + "#main-key"; }

    bool operator==(const VirtualActor&) const = default;
};

// The native key derived for a federated actor.
struct DerivedIdentity
{
    std::string actor_uri;
    std::string pubkey;
    std::string secret_key;

    bool operator==(const DerivedIdentity&) const = default;
};

// Profile fields carried by a metadata event.
struct ProfileUpdate
{
    std::string display_name;
    std::string summary;
    std::string avatar;
    int64_t created_at = 0;

    bool operator==(const ProfileUpdate&) const = default;
};

// A federated actor living on another server, as last fetched.
struct RemoteActor
{
    std::string uri;
    std::string preferred_username;
    std::string name;
    std::string summary;
    std::string icon;
    std::string url;
    std::string inbox;
    std::string shared_inbox;
    std::string followers;
    std::string key_id;
    std::string public_key_pem;
    int64_t fetched_at = 0;

    // Shared inbox if the server has one.
    const std::string& deliveryInbox() const
    {
        return shared_inbox.empty() ? inbox : shared_inbox;
    }

    bool operator==(const RemoteActor&) const = default;
};

// Which side of the bridge observed a follow relationship.
enum class FollowSource
{
    RELAY = 0,
    FEDERATION = 1,
};

enum class FollowState
{
    ACTIVE = 0,
    REMOVED = 1,
};

// “follower_uri follows the virtual actor of subject_pubkey”.
struct FollowerRecord
{
    std::string subject_pubkey;
    std::string follower_uri;
    FollowSource source = FollowSource::FEDERATION;
    FollowState state = FollowState::ACTIVE;
    int64_t updated_at = 0;

    bool operator==(const FollowerRecord&) const = default;
};

enum class FollowingState
{
    PENDING = 0,
    ACCEPTED = 1,
    REJECTED = 2,
};

// “The virtual actor of pubkey follows target_uri”.
struct FollowingRecord
{
    std::string pubkey;
    std::string target_uri;
    // Id of the Follow activity, so Accept, Reject and Undo can refer
    // to it.
    std::string follow_id;
    FollowingState state = FollowingState::PENDING;
    int64_t updated_at = 0;

    bool operator==(const FollowingRecord&) const = default;
};

// A federation object or activity id and the native event standing for
// it.
// An inbound Follow activity, so an Undo that only names its id can be
// traced back.
struct InboundFollow
{
    std::string follow_id;
    std::string subject_pubkey;
    std::string follower_uri;

    bool operator==(const InboundFollow&) const = default;
};

struct ObjectMapping
{
    std::string ap_id;
    std::string event_id;

    bool operator==(const ObjectMapping&) const = default;
};
