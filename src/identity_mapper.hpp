#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <mw/crypto.hpp>

#include "cache.hpp"
#include "config.hpp"
#include "error.hpp"
#include "keyed_lock.hpp"
#include "single_flight.hpp"
#include "store.hpp"
#include "types.hpp"
#include "url_manager.hpp"

// RSA key pair of the system actor, which signs the bridge's own
// fetches.
struct SystemKeys
{
    std::string public_key_pem;
    std::string private_key_pem;
};

// Maps native keys to virtual actors and federated actors to derived
// native keys. Both directions create their record on first use and
// return the persisted one from then on; concurrent first uses of the
// same key share one creation.
class IdentityMapper
{
public:
    // secret_key seeds the derived native keys; it must stay the same
    // for the lifetime of the store.
    IdentityMapper(StoreInterface& store, mw::CryptoInterface& crypto,
                   const URLManager& urls, std::string secret_key,
                   const CacheConfig& cache_conf);

    // The virtual actor of a native key (hex).
    E<VirtualActor> resolveOrCreateActor(const std::string& pubkey);
    // The native identity standing for a federated actor URI.
    E<DerivedIdentity> resolveOrCreateIdentity(const std::string& actor_uri);

    // Lookups that never create.
    E<std::optional<VirtualActor>> findActor(const std::string& pubkey);
    // Whether pubkey was derived by this bridge, and for whom.
    E<std::optional<DerivedIdentity>>
    findIdentityByPubkey(const std::string& pubkey);

    // Applies profile fields from a metadata event unless a newer one
    // was applied before. Returns the actor and whether it changed.
    E<std::pair<VirtualActor, bool>>
    updateProfile(const std::string& pubkey, const ProfileUpdate& profile);

    // Merges one observation of “follower_uri follows pubkey”. Per
    // (pubkey, follower) pair the newest observation from a source
    // wins, except that a record made from a federation activity is
    // never overwritten by one observed on relays. Returns whether the
    // stored state changed.
    E<bool> applyFollower(const std::string& pubkey,
                          const std::string& follower_uri,
                          FollowSource source, FollowState state,
                          int64_t observed_at);
    E<std::vector<std::string>> followerUris(const std::string& pubkey);

    // Loads the system actor key pair, generating and persisting it on
    // first use.
    E<SystemKeys> systemKeys();

    // Derives the native secret for an actor URI. Pure function of the
    // URI and the bridge secret.
    E<std::string> deriveSecret(const std::string& actor_uri) const;

private:
    E<VirtualActor> createActor(const std::string& pubkey);
    E<DerivedIdentity> createIdentity(const std::string& actor_uri);

    StoreInterface& store;
    mw::CryptoInterface& crypto;
    const URLManager& urls;
    std::string secret_key;

    ShardedLruCache<std::string, VirtualActor> actors;
    ShardedLruCache<std::string, DerivedIdentity> identities_by_uri;
    SingleFlight<std::string, E<VirtualActor>> actor_flight;
    SingleFlight<std::string, E<DerivedIdentity>> identity_flight;
    KeyedLock record_locks;
    std::mutex system_keys_lock;
    std::optional<SystemKeys> system_keys;
};
