#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <mw/database.hpp>

#include "error.hpp"
#include "keyed_lock.hpp"
#include "types.hpp"

// Durable state of the bridge. Every method is safe to call from any
// thread and each call is atomic. Calls run concurrently; only
// check-then-insert writes of the same key wait for each other.
class StoreInterface
{
public:
    virtual ~StoreInterface() = default;
    virtual E<void> init() = 0;

    // Virtual actors, keyed by native public key.
    virtual E<std::optional<VirtualActor>>
    getVirtualActor(const std::string& pubkey) = 0;
    // Returns false and leaves the existing record alone if one is
    // already there.
    virtual E<bool> insertVirtualActor(const VirtualActor& actor) = 0;
    virtual E<void> updateVirtualActorProfile(const VirtualActor& actor) = 0;

    // Native keys derived for federated actors.
    virtual E<std::optional<DerivedIdentity>>
    getDerivedIdentityByUri(const std::string& actor_uri) = 0;
    virtual E<std::optional<DerivedIdentity>>
    getDerivedIdentityByPubkey(const std::string& pubkey) = 0;
    virtual E<bool> insertDerivedIdentity(const DerivedIdentity& id) = 0;
    virtual E<std::vector<std::string>> derivedPubkeys() = 0;

    // Cached remote actor documents.
    virtual E<std::optional<RemoteActor>>
    getRemoteActor(const std::string& uri) = 0;
    virtual E<void> putRemoteActor(const RemoteActor& actor) = 0;

    // Dedup index: id -> first-seen time.
    virtual E<std::optional<int64_t>> getSeen(const std::string& id) = 0;
    virtual E<void> putSeen(const std::string& id, int64_t first_seen) = 0;
    virtual E<int> purgeSeenBefore(int64_t cutoff) = 0;

    // Followers of virtual actors.
    virtual E<std::optional<FollowerRecord>>
    getFollower(const std::string& subject_pubkey,
                const std::string& follower_uri) = 0;
    virtual E<void> putFollower(const FollowerRecord& record) = 0;
    virtual E<std::vector<FollowerRecord>>
    activeFollowers(const std::string& subject_pubkey) = 0;
    // Public keys whose virtual actors follower_uri currently follows.
    virtual E<std::vector<std::string>>
    followedBy(const std::string& follower_uri) = 0;
    // Public keys with at least one active follower.
    virtual E<std::vector<std::string>> followedSubjects() = 0;
    // Ids of the Follow activities behind follower records.
    virtual E<void> putInboundFollow(const InboundFollow& follow) = 0;
    virtual E<std::optional<InboundFollow>>
    getInboundFollow(const std::string& follow_id) = 0;

    // Federated actors followed by virtual actors.
    virtual E<std::optional<FollowingRecord>>
    getFollowing(const std::string& pubkey, const std::string& target_uri) = 0;
    virtual E<std::optional<FollowingRecord>>
    getFollowingById(const std::string& follow_id) = 0;
    virtual E<void> putFollowing(const FollowingRecord& record) = 0;
    virtual E<void> deleteFollowing(const std::string& pubkey,
                                    const std::string& target_uri) = 0;
    virtual E<std::vector<FollowingRecord>>
    followingOf(const std::string& pubkey) = 0;

    // Federation id <-> native event id.
    virtual E<std::optional<std::string>>
    eventIdForObject(const std::string& ap_id) = 0;
    virtual E<std::optional<std::string>>
    objectForEventId(const std::string& event_id) = 0;
    virtual E<void> putObjectMapping(const ObjectMapping& mapping) = 0;

    // Newest created_at seen per relay.
    virtual E<std::optional<int64_t>>
    getRelayCursor(const std::string& relay_url) = 0;
    // Only ever moves the cursor forward.
    virtual E<void> advanceRelayCursor(const std::string& relay_url,
                                       int64_t created_at) = 0;

    virtual E<std::optional<std::string>>
    getSystemConfig(const std::string& key) = 0;
    virtual E<void> setSystemConfig(const std::string& key,
                                    const std::string& value) = 0;
};

class Store : public StoreInterface
{
public:
    // “:memory:” opens a private in-memory database.
    explicit Store(const std::string& path);
    E<void> init() override;

    E<std::optional<VirtualActor>>
    getVirtualActor(const std::string& pubkey) override;
    E<bool> insertVirtualActor(const VirtualActor& actor) override;
    E<void> updateVirtualActorProfile(const VirtualActor& actor) override;

    E<std::optional<DerivedIdentity>>
    getDerivedIdentityByUri(const std::string& actor_uri) override;
    E<std::optional<DerivedIdentity>>
    getDerivedIdentityByPubkey(const std::string& pubkey) override;
    E<bool> insertDerivedIdentity(const DerivedIdentity& id) override;
    E<std::vector<std::string>> derivedPubkeys() override;

    E<std::optional<RemoteActor>>
    getRemoteActor(const std::string& uri) override;
    E<void> putRemoteActor(const RemoteActor& actor) override;

    E<std::optional<int64_t>> getSeen(const std::string& id) override;
    E<void> putSeen(const std::string& id, int64_t first_seen) override;
    E<int> purgeSeenBefore(int64_t cutoff) override;

    E<std::optional<FollowerRecord>>
    getFollower(const std::string& subject_pubkey,
                const std::string& follower_uri) override;
    E<void> putFollower(const FollowerRecord& record) override;
    E<std::vector<FollowerRecord>>
    activeFollowers(const std::string& subject_pubkey) override;
    E<std::vector<std::string>>
    followedBy(const std::string& follower_uri) override;
    E<std::vector<std::string>> followedSubjects() override;
    E<void> putInboundFollow(const InboundFollow& follow) override;
    E<std::optional<InboundFollow>>
    getInboundFollow(const std::string& follow_id) override;

    E<std::optional<FollowingRecord>>
    getFollowing(const std::string& pubkey,
                 const std::string& target_uri) override;
    E<std::optional<FollowingRecord>>
    getFollowingById(const std::string& follow_id) override;
    E<void> putFollowing(const FollowingRecord& record) override;
    E<void> deleteFollowing(const std::string& pubkey,
                            const std::string& target_uri) override;
    E<std::vector<FollowingRecord>>
    followingOf(const std::string& pubkey) override;

    E<std::optional<std::string>>
    eventIdForObject(const std::string& ap_id) override;
    E<std::optional<std::string>>
    objectForEventId(const std::string& event_id) override;
    E<void> putObjectMapping(const ObjectMapping& mapping) override;

    E<std::optional<int64_t>>
    getRelayCursor(const std::string& relay_url) override;
    E<void> advanceRelayCursor(const std::string& relay_url,
                               int64_t created_at) override;

    E<std::optional<std::string>>
    getSystemConfig(const std::string& key) override;
    E<void> setSystemConfig(const std::string& key,
                            const std::string& value) override;

private:
    // A connection checked out for the span of one call. A file database
    // hands every caller its own connection, so reads run side by side;
    // an in-memory database has exactly one, which SQLite serializes.
    class Connection
    {
    public:
        Connection(Store* owner, std::unique_ptr<mw::SQLite> own,
                   mw::SQLite* shared);
        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&& other) noexcept;
        ~Connection();

        mw::SQLite* operator->() const { return conn; }

    private:
        Store* owner;
        std::unique_ptr<mw::SQLite> own;
        mw::SQLite* conn;
    };

    E<Connection> connection();
    E<std::unique_ptr<mw::SQLite>> openConnection() const;
    void giveBack(std::unique_ptr<mw::SQLite> conn);
    E<void> migrate(mw::SQLite& db);

    std::string db_path;
    std::atomic<bool> ready = false;
    std::unique_ptr<mw::SQLite> shared;
    // Only guards the idle list, never a query.
    std::mutex idle_lock;
    std::vector<std::unique_ptr<mw::SQLite>> idle;
    // Check-then-insert writes of the same key.
    KeyedLock writes;
};
