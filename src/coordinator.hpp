#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "actor_resolver.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "dedup_index.hpp"
#include "delivery_engine.hpp"
#include "error.hpp"
#include "identity_mapper.hpp"
#include "keyed_lock.hpp"
#include "native_event.hpp"
#include "relay_pool.hpp"
#include "single_flight.hpp"
#include "store.hpp"
#include "text_transform.hpp"
#include "translator.hpp"
#include "types.hpp"
#include "url_manager.hpp"

// Routes native events to federation delivery and federation
// activities to relay publication. This is the only place that writes
// mapping state shared by both directions (object map, follower and
// following records).
class BridgeCoordinator
{
public:
    BridgeCoordinator(const Config& conf, StoreInterface& store,
                      IdentityMapper& identities, ActorResolver& actors,
                      DedupIndex& dedup, RelayPool& relays,
                      DeliveryEngine& delivery, const URLManager& urls,
                      const TextTransformInterface& transform);
    ~BridgeCoordinator();
    BridgeCoordinator(const BridgeCoordinator&) = delete;
    BridgeCoordinator& operator=(const BridgeCoordinator&) = delete;

    // Hooks the relay pool up to ingestNativeEvent(), issues the
    // subscriptions and arms the housekeeping timer. Events are
    // processed on work_ex, which must not be the relay pool's
    // executor.
    void start(boost::asio::any_io_executor timer_ex,
               boost::asio::any_io_executor work_ex);
    void stop();

    // A native event seen for the first time on a relay. Translates it
    // and delivers the result to the federation.
    E<void> ingestNativeEvent(const NativeEvent& event,
                              const std::string& relay);
    // An activity whose HTTP signature was verified to be by signer.
    // Translates it and publishes the result to the relays.
    E<void> ingestFederationActivity(const nlohmann::json& doc,
                                     const RemoteActor& signer);

    // Re-issues the relay subscriptions from the current follower and
    // identity tables.
    E<void> refreshSubscriptions();

    // The federation object of a native note, for GET /notes/<id>.
    E<nlohmann::json> noteObject(const std::string& event_id);
    // A native event by id, from recent traffic or a relay query.
    E<std::optional<NativeEvent>> findNativeEvent(const std::string& id);

    // Purges old dedup records and reports locks that look stuck.
    void runHousekeeping();

private:
    // Federation object and actor a native event maps to.
    struct ObjectRef
    {
        std::string object;
        std::string actor;
    };

    struct NoteAddressing
    {
        OutboundNoteContext ctx;
        // Inboxes of mentioned and replied-to remote actors.
        std::vector<std::string> inboxes;
    };

    // Outbound, one per bridged kind.
    E<void> sendNote(const native::Note& note);
    E<void> sendReaction(const native::Reaction& reaction);
    E<void> sendRepost(const native::Repost& repost);
    E<void> sendProfile(const native::Metadata& metadata);
    E<void> sendFollows(const native::ContactList& list);
    E<void> sendDeletion(const native::Deletion& deletion);
    // A delivery that ran out of attempts. A Follow that never arrived
    // is dropped from the following table.
    void onDeliveryExhausted(const DeliveryFailure& failure);
    // Contact list published for a federated actor.
    E<void> observeFollowerList(const DerivedIdentity& follower,
                                const NativeEvent& event);

    // Inbound, one per activity type.
    E<void> onCreate(const activity::Create& create, const RemoteActor& signer);
    E<void> onUpdate(const activity::Update& update, const RemoteActor& signer);
    E<void> onDelete(const activity::Delete& del, const RemoteActor& signer);
    E<void> onFollow(const activity::Follow& follow, const RemoteActor& signer);
    E<void> onFollowResponse(const std::string& follow_id,
                             const RemoteActor& signer, FollowingState state);
    E<void> onLike(const activity::Like& like, const RemoteActor& signer);
    E<void> onAnnounce(const activity::Announce& announce,
                       const RemoteActor& signer);
    E<void> onUndo(const activity::Undo& undo, const RemoteActor& signer);
    E<void> undoFollow(const std::string& pubkey, const RemoteActor& signer);

    E<NoteAddressing> addressNote(const native::Note& note);
    // author_hint, the hex key of the event's author if known, saves a
    // relay query.
    E<std::optional<ObjectRef>>
    objectRefForEvent(const std::string& event_id,
                      const std::string& author_hint = "");
    E<std::vector<std::string>> followerInboxes(const std::string& pubkey);
    void deliver(const nlohmann::json& activity,
                 const std::vector<std::string>& inboxes,
                 const VirtualActor& sender);

    // The native event standing for a federation object, without
    // fetching anything.
    E<std::optional<NativeEvent>> knownEventForObject(const std::string& uri);
    // The native event standing for a federation object, bridging it
    // and the thread above it first if needed.
    E<NativeEvent> bridgeThread(const nlohmann::json& object);
    E<NativeEvent> bridgeObject(const nlohmann::json& object,
                                const std::optional<NativeEvent>& parent);
    // Target of a Like or Announce.
    E<NativeEvent> resolveTarget(const std::string& uri);

    // Publishes the kind 0 of a federated actor unless it was published
    // recently.
    void mirrorProfile(const RemoteActor& actor, bool force = false);
    E<void> publishFollowerList(const std::string& follower_uri);
    E<void> signAndPublish(NativeEvent& event, const std::string& secret_key);
    // Sends a signed event to every connected relay.
    void publish(const NativeEvent& event);
    E<std::string> derivedActivityId(std::string_view kind,
                                     const std::string& seed) const;
    void scheduleHousekeeping();

    const Config& config;
    StoreInterface& store;
    IdentityMapper& identities;
    ActorResolver& actors;
    DedupIndex& dedup;
    RelayPool& relays;
    DeliveryEngine& delivery;
    const URLManager& urls;
    const TextTransformInterface& transform;
    std::string label_namespace;

    ShardedLruCache<std::string, NativeEvent> recent_events;
    // Actors whose profile was published recently.
    ShardedLruCache<std::string, bool> mirrored_profiles;
    SingleFlight<std::string, E<NativeEvent>> object_flight;
    // Held only around store reads and writes of one key, never across
    // an HTTP call or a relay round trip.
    KeyedLock locks;
    // Activity ids being processed. Only ever tried, so nobody waits.
    KeyedLock in_flight;

    std::unique_ptr<boost::asio::steady_timer> housekeeping_timer;
};
