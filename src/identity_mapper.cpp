#include "identity_mapper.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <spdlog/spdlog.h>

#include "schnorr.hpp"
#include "utils.hpp"

IdentityMapper::IdentityMapper(StoreInterface& store,
                               mw::CryptoInterface& crypto,
                               const URLManager& urls, std::string secret_key,
                               const CacheConfig& cache_conf)
    : store(store), crypto(crypto), urls(urls),
      secret_key(std::move(secret_key)),
      actors(cache_conf.actor_capacity,
             std::chrono::seconds(cache_conf.actor_ttl_seconds)),
      identities_by_uri(cache_conf.actor_capacity,
                        std::chrono::seconds(cache_conf.actor_ttl_seconds))
{
}

E<VirtualActor> IdentityMapper::resolveOrCreateActor(const std::string& pubkey)
{
    if(!isLowerHex(pubkey, 64))
    {
        return std::unexpected(invalidInput("Invalid public key: " + pubkey));
    }
    if(auto cached = actors.get(pubkey); cached.has_value())
    {
        return *cached;
    }
    return actor_flight.run(pubkey, [&]() -> E<VirtualActor>
    {
        ASSIGN_OR_RETURN(auto stored, store.getVirtualActor(pubkey));
        if(stored.has_value())
        {
            actors.put(pubkey, *stored);
            return *stored;
        }
        return createActor(pubkey);
    });
}

E<VirtualActor> IdentityMapper::createActor(const std::string& pubkey)
{
    auto keys = crypto.generateKeyPair(mw::KeyType::RSA);
    if(!keys.has_value())
    {
        return std::unexpected(fromInternalError(keys.error()));
    }

    VirtualActor actor;
    actor.pubkey = pubkey;
    actor.uri = urls.actor(pubkey);
    actor.public_key_pem = keys->public_key;
    actor.private_key_pem = keys->private_key;
    actor.created_at = nowSeconds();

    ASSIGN_OR_RETURN(bool inserted, store.insertVirtualActor(actor));
    if(!inserted)
    {
        // Someone else got there first (another process on the same
        // store); theirs is the one that counts.
        ASSIGN_OR_RETURN(auto stored, store.getVirtualActor(pubkey));
        if(!stored.has_value())
        {
            return std::unexpected(
                storeUnavailable("Virtual actor vanished after insert"));
        }
        actor = *stored;
    }
    else
    {
        spdlog::info("Created virtual actor {}", actor.uri);
    }
    actors.put(pubkey, actor);
    return actor;
}

E<DerivedIdentity>
IdentityMapper::resolveOrCreateIdentity(const std::string& actor_uri)
{
    if(actor_uri.empty())
    {
        return std::unexpected(invalidInput("Empty actor URI"));
    }
    if(auto cached = identities_by_uri.get(actor_uri); cached.has_value())
    {
        return *cached;
    }
    return identity_flight.run(actor_uri, [&]() -> E<DerivedIdentity>
    {
        ASSIGN_OR_RETURN(auto stored, store.getDerivedIdentityByUri(actor_uri));
        if(stored.has_value())
        {
            identities_by_uri.put(actor_uri, *stored);
            return *stored;
        }
        return createIdentity(actor_uri);
    });
}

E<DerivedIdentity> IdentityMapper::createIdentity(const std::string& actor_uri)
{
    DerivedIdentity id;
    id.actor_uri = actor_uri;
    ASSIGN_OR_RETURN(id.secret_key, deriveSecret(actor_uri));
    ASSIGN_OR_RETURN(id.pubkey, schnorr::publicKeyFor(id.secret_key));

    ASSIGN_OR_RETURN(bool inserted, store.insertDerivedIdentity(id));
    if(!inserted)
    {
        ASSIGN_OR_RETURN(auto stored, store.getDerivedIdentityByUri(actor_uri));
        if(!stored.has_value())
        {
            return std::unexpected(
                storeUnavailable("Derived identity vanished after insert"));
        }
        id = *stored;
    }
    identities_by_uri.put(actor_uri, id);
    return id;
}

E<std::string> IdentityMapper::deriveSecret(const std::string& actor_uri) const
{
    std::vector<unsigned char> mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;
    if(HMAC(EVP_sha256(), secret_key.data(), static_cast<int>(secret_key.size()),
            reinterpret_cast<const unsigned char*>(actor_uri.data()),
            actor_uri.size(), mac.data(), &mac_len) == nullptr)
    {
        return std::unexpected(internalError("HMAC failed"));
    }
    mac.resize(mac_len);
    return schnorr::secretFromSeed(mac);
}

E<std::optional<VirtualActor>>
IdentityMapper::findActor(const std::string& pubkey)
{
    if(auto cached = actors.get(pubkey); cached.has_value())
    {
        return cached;
    }
    ASSIGN_OR_RETURN(auto stored, store.getVirtualActor(pubkey));
    if(stored.has_value())
    {
        actors.put(pubkey, *stored);
    }
    return stored;
}

E<std::optional<DerivedIdentity>>
IdentityMapper::findIdentityByPubkey(const std::string& pubkey)
{
    return store.getDerivedIdentityByPubkey(pubkey);
}

E<std::pair<VirtualActor, bool>>
IdentityMapper::updateProfile(const std::string& pubkey,
                              const ProfileUpdate& profile)
{
    ASSIGN_OR_RETURN(VirtualActor actor, resolveOrCreateActor(pubkey));
    auto guard = record_locks.lock("profile:" + pubkey);
    // Re-read under the lock; the cached copy may predate a concurrent
    // update.
    ASSIGN_OR_RETURN(auto stored, store.getVirtualActor(pubkey));
    if(stored.has_value())
    {
        actor = *stored;
    }
    if(profile.created_at <= actor.profile_updated_at)
    {
        return std::make_pair(actor, false);
    }
    actor.display_name = profile.display_name;
    actor.summary = profile.summary;
    actor.avatar = profile.avatar;
    actor.profile_updated_at = profile.created_at;
    DO_OR_RETURN(store.updateVirtualActorProfile(actor));
    actors.put(pubkey, actor);
    return std::make_pair(actor, true);
}

E<bool> IdentityMapper::applyFollower(const std::string& pubkey,
                                      const std::string& follower_uri,
                                      FollowSource source, FollowState state,
                                      int64_t observed_at)
{
    auto guard = record_locks.lock(pubkey + " " + follower_uri);
    ASSIGN_OR_RETURN(auto existing, store.getFollower(pubkey, follower_uri));
    if(existing.has_value())
    {
        if(existing->source == FollowSource::FEDERATION &&
           source == FollowSource::RELAY)
        {
            return false;
        }
        if(existing->source == source && observed_at < existing->updated_at)
        {
            return false;
        }
        if(existing->state == state && existing->source == source)
        {
            return false;
        }
    }
    else if(state == FollowState::REMOVED)
    {
        return false;
    }

    FollowerRecord record;
    record.subject_pubkey = pubkey;
    record.follower_uri = follower_uri;
    record.source = source;
    record.state = state;
    record.updated_at = observed_at;
    DO_OR_RETURN(store.putFollower(record));
    return true;
}

E<std::vector<std::string>>
IdentityMapper::followerUris(const std::string& pubkey)
{
    ASSIGN_OR_RETURN(auto records, store.activeFollowers(pubkey));
    std::vector<std::string> uris;
    uris.reserve(records.size());
    for(const auto& r : records)
    {
        uris.push_back(r.follower_uri);
    }
    return uris;
}

E<SystemKeys> IdentityMapper::systemKeys()
{
    std::lock_guard<std::mutex> lock(system_keys_lock);
    if(system_keys.has_value())
    {
        return *system_keys;
    }
    ASSIGN_OR_RETURN(auto public_pem,
                     store.getSystemConfig("system_actor_public_key"));
    ASSIGN_OR_RETURN(auto private_pem,
                     store.getSystemConfig("system_actor_private_key"));
    if(public_pem.has_value() && private_pem.has_value())
    {
        system_keys = SystemKeys{*public_pem, *private_pem};
        return *system_keys;
    }

    auto keys = crypto.generateKeyPair(mw::KeyType::RSA);
    if(!keys.has_value())
    {
        return std::unexpected(fromInternalError(keys.error()));
    }
    DO_OR_RETURN(store.setSystemConfig("system_actor_private_key",
                                       keys->private_key));
    DO_OR_RETURN(store.setSystemConfig("system_actor_public_key",
                                       keys->public_key));
    spdlog::info("Generated the system actor key");
    system_keys = SystemKeys{keys->public_key, keys->private_key};
    return *system_keys;
}
