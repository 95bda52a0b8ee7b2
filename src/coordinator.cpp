#include "coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <map>
#include <set>
#include <variant>

#include <boost/asio/post.hpp>
#include <mw/crypto.hpp>
#include <spdlog/spdlog.h>

#include "bech32.hpp"
#include "json_ld.hpp"
#include "utils.hpp"

namespace net = boost::asio;

namespace
{

constexpr size_t RECENT_EVENT_CAPACITY = 10000;
constexpr std::chrono::seconds RECENT_EVENT_TTL{60 * 60};
constexpr std::chrono::seconds HOUSEKEEPING_INTERVAL{60};
constexpr std::chrono::milliseconds STUCK_LOCK_THRESHOLD{30 * 1000};

const std::vector<int> AUTHOR_KINDS{
    kind::METADATA, kind::TEXT_NOTE, kind::CONTACT_LIST,
    kind::DELETION, kind::REPOST,    kind::REACTION};
const std::vector<int> MENTION_KINDS{
    kind::TEXT_NOTE, kind::CONTACT_LIST, kind::REPOST, kind::REACTION};

void logDegradations(const std::string& id,
                     const std::vector<Degradation>& degradations)
{
    for(const auto& d : degradations)
    {
        spdlog::info("Translation of {} degraded: {} ({})", id,
                     degradationName(d.kind), d.detail);
    }
}

void logFailure(std::string_view what, const BridgeError& e)
{
    if(e.kind == ErrorKind::INVALID_INPUT || e.kind == ErrorKind::NOT_FOUND)
    {
        spdlog::debug("Dropped {}: {}", what, errorMsg(e));
    }
    else
    {
        spdlog::warn("Failed to process {}: {}", what, errorMsg(e));
    }
}

std::string quoteOf(const nlohmann::json& object)
{
    for(const char* key : {"quoteUrl", "_misskey_quote", "quoteUri"})
    {
        std::string url = json_ld::getString(object, key);
        if(!url.empty())
        {
            return url;
        }
    }
    return "";
}

} // namespace

BridgeCoordinator::BridgeCoordinator(
    const Config& conf, StoreInterface& store, IdentityMapper& identities,
    ActorResolver& actors, DedupIndex& dedup, RelayPool& relays,
    DeliveryEngine& delivery, const URLManager& urls,
    const TextTransformInterface& transform)
    : config(conf), store(store), identities(identities), actors(actors),
      dedup(dedup), relays(relays), delivery(delivery), urls(urls),
      transform(transform), label_namespace(reverseDomain(hostOf(urls.root()))),
      recent_events(RECENT_EVENT_CAPACITY, RECENT_EVENT_TTL),
      mirrored_profiles(conf.cache.profile_capacity,
                        std::chrono::seconds(conf.cache.profile_ttl_seconds))
{
}

BridgeCoordinator::~BridgeCoordinator()
{
    stop();
}

void BridgeCoordinator::start(net::any_io_executor timer_ex,
                              net::any_io_executor work_ex)
{
    relays.setEventHandler(
        [this, work_ex](const std::string& relay, const NativeEvent& event)
        {
            net::post(work_ex, [this, relay, event]()
            {
                auto result = ingestNativeEvent(event, relay);
                if(!result.has_value())
                {
                    logFailure("event " + event.id, result.error());
                }
            });
        });
    delivery.setExhaustedHandler([this](const DeliveryFailure& failure)
    {
        onDeliveryExhausted(failure);
    });
    housekeeping_timer = std::make_unique<net::steady_timer>(timer_ex);
    scheduleHousekeeping();
    auto subscribed = refreshSubscriptions();
    if(!subscribed.has_value())
    {
        spdlog::error("Failed to subscribe to relays: {}",
                      errorMsg(subscribed.error()));
    }
}

void BridgeCoordinator::stop()
{
    relays.setEventHandler(nullptr);
    delivery.setExhaustedHandler(nullptr);
    if(housekeeping_timer)
    {
        housekeeping_timer->cancel();
    }
}

void BridgeCoordinator::scheduleHousekeeping()
{
    housekeeping_timer->expires_after(HOUSEKEEPING_INTERVAL);
    housekeeping_timer->async_wait([this](boost::system::error_code ec)
    {
        if(ec)
        {
            return;
        }
        runHousekeeping();
        scheduleHousekeeping();
    });
}

void BridgeCoordinator::runHousekeeping()
{
    auto purged = dedup.purge();
    if(!purged.has_value())
    {
        spdlog::warn("Failed to purge the dedup index: {}",
                     errorMsg(purged.error()));
    }
    else if(*purged > 0)
    {
        spdlog::debug("Purged {} dedup records", *purged);
    }
    recent_events.evictExpired();
    mirrored_profiles.evictExpired();
    for(const auto& holder : locks.heldLongerThan(STUCK_LOCK_THRESHOLD))
    {
        spdlog::warn("Lock on “{}” has been held for {} ms", holder.key,
                     holder.held_for.count());
    }
}

E<void> BridgeCoordinator::refreshSubscriptions()
{
    ASSIGN_OR_RETURN(auto subjects, store.followedSubjects());
    ASSIGN_OR_RETURN(auto derived, store.derivedPubkeys());

    // Start where the slowest relay left off, but never further back
    // than the lookback window.
    int64_t since = nowSeconds() - config.subscription_lookback_seconds;
    std::optional<int64_t> oldest_cursor;
    bool all_have_cursor = true;
    for(const auto& relay : relays.relays())
    {
        ASSIGN_OR_RETURN(auto cursor, store.getRelayCursor(relay));
        if(!cursor.has_value())
        {
            all_have_cursor = false;
            break;
        }
        if(!oldest_cursor.has_value() || *cursor < *oldest_cursor)
        {
            oldest_cursor = *cursor;
        }
    }
    if(all_have_cursor && oldest_cursor.has_value())
    {
        since = std::max(since, *oldest_cursor);
    }

    if(subjects.empty())
    {
        relays.unsubscribe("follows");
    }
    else
    {
        Filter f;
        f.authors = subjects;
        f.kinds = AUTHOR_KINDS;
        f.since = since;
        relays.subscribe("follows", {f});
    }

    if(derived.empty())
    {
        relays.unsubscribe("mentions");
        relays.unsubscribe("bridged");
    }
    else
    {
        Filter mentions;
        mentions.tags['p'] = derived;
        mentions.kinds = MENTION_KINDS;
        mentions.since = since;
        relays.subscribe("mentions", {mentions});

        Filter lists;
        lists.authors = derived;
        lists.kinds = {kind::CONTACT_LIST};
        lists.since = since;
        relays.subscribe("bridged", {lists});
    }
    spdlog::debug("Subscribed to {} native authors and {} derived keys",
                  subjects.size(), derived.size());
    return {};
}

E<std::optional<NativeEvent>>
BridgeCoordinator::findNativeEvent(const std::string& id)
{
    if(auto cached = recent_events.get(id); cached.has_value())
    {
        return cached;
    }
    if(!isLowerHex(id, 64))
    {
        return std::unexpected(invalidInput("Invalid event id: " + id));
    }
    Filter f;
    f.ids = {id};
    auto found = relays.querySync(
        {f}, std::chrono::seconds(config.query_timeout_seconds));
    for(const auto& event : found)
    {
        if(event.id == id)
        {
            recent_events.put(id, event);
            return std::optional<NativeEvent>(event);
        }
    }
    return std::nullopt;
}

// ========== Native to federation ==================================>

E<void> BridgeCoordinator::ingestNativeEvent(const NativeEvent& event,
                                             const std::string& relay)
{
    recent_events.put(event.id, event);
    if(!relay.empty())
    {
        // Authors choose created_at; a cursor in the future would hide
        // everything published until then.
        DO_OR_RETURN(store.advanceRelayCursor(
            relay, std::min(event.created_at, nowSeconds())));
    }

    ASSIGN_OR_RETURN(auto derived, identities.findIdentityByPubkey(event.pubkey));
    if(derived.has_value())
    {
        if(event.kind == kind::CONTACT_LIST)
        {
            return observeFollowerList(*derived, event);
        }
        return {};
    }
    if(event.isFromFederation())
    {
        spdlog::debug("Event {} came from the federation, not bridging it back",
                      event.id);
        return {};
    }

    ASSIGN_OR_RETURN(NativeContent content, classifyEvent(event));
    return std::visit(Overloaded{
            [this](const native::Note& c) { return sendNote(c); },
            [this](const native::Reaction& c) { return sendReaction(c); },
            [this](const native::Repost& c) { return sendRepost(c); },
            [this](const native::Metadata& c) { return sendProfile(c); },
            [this](const native::ContactList& c) { return sendFollows(c); },
            [this](const native::Deletion& c) { return sendDeletion(c); },
        }, content);
}

E<void> BridgeCoordinator::sendNote(const native::Note& note)
{
    ASSIGN_OR_RETURN(VirtualActor author,
                     identities.resolveOrCreateActor(note.event.pubkey));
    ASSIGN_OR_RETURN(NoteAddressing addressing, addressNote(note));
    ASSIGN_OR_RETURN(std::vector<std::string> inboxes,
                     followerInboxes(author.pubkey));
    inboxes.insert(inboxes.end(), addressing.inboxes.begin(),
                   addressing.inboxes.end());
    if(inboxes.empty())
    {
        spdlog::debug("Nobody on the federation side to send {} to",
                      note.event.id);
        return {};
    }

    auto object = noteToObject(note, author, addressing.ctx, urls, transform);
    logDegradations(note.event.id, object.degradations);
    deliver(createActivity(object.value, urls.activity("create", note.event.id)),
            inboxes, author);
    return {};
}

E<BridgeCoordinator::NoteAddressing>
BridgeCoordinator::addressNote(const native::Note& note)
{
    NoteAddressing out;
    auto add_inbox = [&](const std::string& actor_uri)
    {
        if(urls.isLocal(actor_uri))
        {
            return;
        }
        auto remote = actors.resolve(actor_uri);
        if(!remote.has_value())
        {
            spdlog::debug("Cannot resolve {}: {}", actor_uri,
                          errorMsg(remote.error()));
            return;
        }
        out.inboxes.push_back(remote->deliveryInbox());
    };

    if(note.reply_to.has_value())
    {
        ASSIGN_OR_RETURN(auto parent, objectRefForEvent(*note.reply_to));
        if(parent.has_value())
        {
            out.ctx.parent_object = parent->object;
            if(!parent->actor.empty())
            {
                out.ctx.parent_actor = parent->actor;
                add_inbox(parent->actor);
            }
        }
    }
    if(note.quote.has_value())
    {
        ASSIGN_OR_RETURN(auto quoted, objectRefForEvent(*note.quote));
        if(quoted.has_value())
        {
            out.ctx.quote_object = quoted->object;
        }
    }

    for(const auto& pubkey : note.mentions)
    {
        ASSIGN_OR_RETURN(auto derived, identities.findIdentityByPubkey(pubkey));
        if(!derived.has_value())
        {
            out.ctx.mentions[pubkey] = MentionTarget{
                urls.actor(pubkey),
                bech32::encodeHex("npub", pubkey) + "@" + urls.domain()};
            continue;
        }
        auto remote = actors.resolve(derived->actor_uri);
        if(!remote.has_value())
        {
            spdlog::debug("Dropping mention of {}: {}", derived->actor_uri,
                          errorMsg(remote.error()));
            continue;
        }
        std::string name = remote->preferred_username.empty()
            ? remote->name : remote->preferred_username;
        out.ctx.mentions[pubkey] =
            MentionTarget{remote->uri, name + "@" + hostOf(remote->uri)};
        out.inboxes.push_back(remote->deliveryInbox());
    }
    return out;
}

E<std::optional<BridgeCoordinator::ObjectRef>>
BridgeCoordinator::objectRefForEvent(const std::string& event_id,
                                     const std::string& author_hint)
{
    ASSIGN_OR_RETURN(auto mapped, store.objectForEventId(event_id));
    std::string author = author_hint;
    if(author.empty())
    {
        ASSIGN_OR_RETURN(auto event, findNativeEvent(event_id));
        if(event.has_value())
        {
            author = event->pubkey;
        }
        else if(!mapped.has_value())
        {
            return std::nullopt;
        }
    }

    if(mapped.has_value())
    {
        ObjectRef ref{*mapped, ""};
        if(!author.empty())
        {
            ASSIGN_OR_RETURN(auto derived, identities.findIdentityByPubkey(author));
            if(derived.has_value())
            {
                ref.actor = derived->actor_uri;
            }
        }
        return ref;
    }
    return ObjectRef{urls.note(event_id), urls.actor(author)};
}

E<std::vector<std::string>>
BridgeCoordinator::followerInboxes(const std::string& pubkey)
{
    ASSIGN_OR_RETURN(auto followers, identities.followerUris(pubkey));
    std::vector<std::string> inboxes;
    for(const auto& uri : followers)
    {
        auto remote = actors.resolve(uri);
        if(!remote.has_value())
        {
            spdlog::debug("Skipping follower {}: {}", uri,
                          errorMsg(remote.error()));
            continue;
        }
        inboxes.push_back(remote->deliveryInbox());
    }
    return inboxes;
}

void BridgeCoordinator::deliver(const nlohmann::json& activity,
                                const std::vector<std::string>& inboxes,
                                const VirtualActor& sender)
{
    size_t queued = delivery.deliver(activity, inboxes, sender.keyId(),
                                     sender.private_key_pem);
    spdlog::debug("Queued {} for {} inboxes",
                  json_ld::getString(activity, "id"), queued);
}

E<void> BridgeCoordinator::sendReaction(const native::Reaction& reaction)
{
    const NativeEvent& event = reaction.event;
    ASSIGN_OR_RETURN(auto target, objectRefForEvent(reaction.target_id,
                                                    reaction.target_author));
    if(!target.has_value())
    {
        return std::unexpected(notFound(std::format(
            "Target {} of reaction {} is unknown", reaction.target_id, event.id)));
    }
    if(target->actor.empty() || urls.isLocal(target->actor))
    {
        spdlog::debug("Reaction {} targets a native post, nothing to send",
                      event.id);
        return {};
    }
    ASSIGN_OR_RETURN(VirtualActor author,
                     identities.resolveOrCreateActor(event.pubkey));
    ASSIGN_OR_RETURN(nlohmann::json like,
                     reactionToLike(reaction, author, target->object,
                                    target->actor, urls));
    ASSIGN_OR_RETURN(RemoteActor owner, actors.resolve(target->actor));
    DO_OR_RETURN(store.putObjectMapping(
        {json_ld::getString(like, "id"), event.id}));
    deliver(like, {owner.deliveryInbox()}, author);
    return {};
}

E<void> BridgeCoordinator::sendRepost(const native::Repost& repost)
{
    const NativeEvent& event = repost.event;
    ASSIGN_OR_RETURN(auto target, objectRefForEvent(repost.target_id,
                                                    repost.target_author));
    if(!target.has_value())
    {
        return std::unexpected(notFound(std::format(
            "Target {} of repost {} is unknown", repost.target_id, event.id)));
    }
    ASSIGN_OR_RETURN(VirtualActor author,
                     identities.resolveOrCreateActor(event.pubkey));
    ASSIGN_OR_RETURN(std::vector<std::string> inboxes,
                     followerInboxes(author.pubkey));
    if(!target->actor.empty() && !urls.isLocal(target->actor))
    {
        ASSIGN_OR_RETURN(RemoteActor owner, actors.resolve(target->actor));
        inboxes.push_back(owner.deliveryInbox());
    }
    if(inboxes.empty())
    {
        return {};
    }
    nlohmann::json announce = repostToAnnounce(repost, author, target->object,
                                               target->actor, urls);
    DO_OR_RETURN(store.putObjectMapping(
        {json_ld::getString(announce, "id"), event.id}));
    deliver(announce, inboxes, author);
    return {};
}

E<void> BridgeCoordinator::sendProfile(const native::Metadata& metadata)
{
    ASSIGN_OR_RETURN(auto updated,
                     identities.updateProfile(metadata.event.pubkey,
                                              metadata.profile));
    const auto& [actor, changed] = updated;
    if(!changed)
    {
        return {};
    }
    ASSIGN_OR_RETURN(std::vector<std::string> inboxes,
                     followerInboxes(actor.pubkey));
    if(inboxes.empty())
    {
        return {};
    }
    deliver(updateActivity(urls.activity("update", metadata.event.id), actor,
                           actorDocument(actor, urls, transform)),
            inboxes, actor);
    return {};
}

E<void> BridgeCoordinator::sendFollows(const native::ContactList& list)
{
    const NativeEvent& event = list.event;
    if(list.follows.size() > config.contact_list_limit)
    {
        spdlog::info("Ignoring contact list {} with {} entries", event.id,
                     list.follows.size());
        return {};
    }

    std::set<std::string> wanted;
    for(const auto& pubkey : list.follows)
    {
        ASSIGN_OR_RETURN(auto derived, identities.findIdentityByPubkey(pubkey));
        if(derived.has_value())
        {
            wanted.insert(derived->actor_uri);
        }
    }
    ASSIGN_OR_RETURN(VirtualActor actor,
                     identities.resolveOrCreateActor(event.pubkey));

    // Resolve the new targets before taking the lock; the table is
    // read again under it.
    std::map<std::string, RemoteActor> resolved;
    {
        ASSIGN_OR_RETURN(auto before, store.followingOf(event.pubkey));
        std::set<std::string> had;
        for(const auto& record : before)
        {
            had.insert(record.target_uri);
        }
        for(const auto& target : wanted)
        {
            if(had.contains(target))
            {
                continue;
            }
            auto remote = actors.resolve(target);
            if(!remote.has_value())
            {
                spdlog::warn("Cannot follow {}: {}", target,
                             errorMsg(remote.error()));
                continue;
            }
            resolved.emplace(target, std::move(*remote));
        }
    }

    std::vector<std::pair<std::string, std::string>> followed;
    std::vector<FollowingRecord> dropped;
    {
        auto guard = locks.lock("following " + event.pubkey);
        ASSIGN_OR_RETURN(auto current, store.followingOf(event.pubkey));
        for(const auto& record : current)
        {
            if(record.updated_at > event.created_at)
            {
                spdlog::debug("Contact list {} is older than what was applied",
                              event.id);
                return {};
            }
        }
        std::set<std::string> have;
        for(const auto& record : current)
        {
            have.insert(record.target_uri);
            if(!wanted.contains(record.target_uri))
            {
                DO_OR_RETURN(store.deleteFollowing(event.pubkey,
                                                   record.target_uri));
                dropped.push_back(record);
            }
        }
        for(const auto& target : wanted)
        {
            if(have.contains(target) || !resolved.contains(target))
            {
                continue;
            }
            ASSIGN_OR_RETURN(std::string follow_id, derivedActivityId(
                "follow", std::format("{} {} {}", event.pubkey, target,
                                      event.created_at)));
            DO_OR_RETURN(store.putFollowing(
                {event.pubkey, target, follow_id, FollowingState::PENDING,
                 event.created_at}));
            followed.emplace_back(target, follow_id);
        }
    }

    for(const auto& [target, follow_id] : followed)
    {
        spdlog::info("{} follows {}", actor.uri, target);
        deliver(followActivity(follow_id, actor.uri, target),
                {resolved.at(target).inbox}, actor);
    }
    for(const auto& record : dropped)
    {
        spdlog::info("{} unfollows {}", actor.uri, record.target_uri);
        auto remote = actors.resolve(record.target_uri);
        if(!remote.has_value())
        {
            spdlog::warn("Cannot tell {} about the unfollow: {}",
                         record.target_uri, errorMsg(remote.error()));
            continue;
        }
        ASSIGN_OR_RETURN(std::string undo_id,
                         derivedActivityId("undo", record.follow_id));
        deliver(undoActivity(undo_id, actor.uri,
                             followActivity(record.follow_id, actor.uri,
                                            record.target_uri)),
                {remote->inbox}, actor);
    }
    return {};
}

void BridgeCoordinator::onDeliveryExhausted(const DeliveryFailure& failure)
{
    auto record = store.getFollowingById(failure.activity_id);
    if(!record.has_value())
    {
        spdlog::warn("Cannot look up follow {}: {}", failure.activity_id,
                     errorMsg(record.error()));
        return;
    }
    if(!record->has_value() || (*record)->state != FollowingState::PENDING)
    {
        return;
    }

    // Forget the follow so the next contact list sends it again.
    auto guard = locks.lock("following " + (*record)->pubkey);
    auto current = store.getFollowing((*record)->pubkey, (*record)->target_uri);
    if(!current.has_value())
    {
        spdlog::warn("Cannot look up follow {}: {}", failure.activity_id,
                     errorMsg(current.error()));
        return;
    }
    if(!current->has_value() || (*current)->follow_id != failure.activity_id ||
       (*current)->state != FollowingState::PENDING)
    {
        return;
    }
    auto deleted = store.deleteFollowing((*record)->pubkey,
                                         (*record)->target_uri);
    if(!deleted.has_value())
    {
        spdlog::warn("Cannot drop follow {}: {}", failure.activity_id,
                     errorMsg(deleted.error()));
        return;
    }
    spdlog::info("Follow of {} by {} could not be delivered, dropped it",
                 (*record)->target_uri, urls.actor((*record)->pubkey));
}

E<void> BridgeCoordinator::sendDeletion(const native::Deletion& deletion)
{
    const NativeEvent& event = deletion.event;
    ASSIGN_OR_RETURN(VirtualActor actor,
                     identities.resolveOrCreateActor(event.pubkey));
    ASSIGN_OR_RETURN(std::vector<std::string> followers,
                     followerInboxes(actor.pubkey));
    const std::string like_prefix = urls.activity("like", "");
    const std::string announce_prefix = urls.activity("announce", "");

    for(const auto& id : deletion.event_ids)
    {
        ASSIGN_OR_RETURN(auto mapped, store.objectForEventId(id));
        if(!mapped.has_value())
        {
            if(followers.empty())
            {
                continue;
            }
            ASSIGN_OR_RETURN(std::string delete_id, derivedActivityId(
                "delete", event.id + " " + id));
            deliver(deleteActivity(delete_id, actor, urls.note(id)), followers,
                    actor);
            continue;
        }

        // Our own Like or Announce is retracted with an Undo. Anything
        // else mapped stands for a federation object this author does
        // not own.
        bool is_like = mapped->starts_with(like_prefix);
        if(!is_like && !mapped->starts_with(announce_prefix))
        {
            continue;
        }
        std::vector<std::string> inboxes = is_like
            ? std::vector<std::string>() : followers;
        ASSIGN_OR_RETURN(auto original, findNativeEvent(id));
        if(original.has_value())
        {
            auto owner_key = original->tagValues("p");
            if(!owner_key.empty())
            {
                ASSIGN_OR_RETURN(auto owner,
                                 identities.findIdentityByPubkey(owner_key.back()));
                if(owner.has_value())
                {
                    auto remote = actors.resolve(owner->actor_uri);
                    if(remote.has_value())
                    {
                        inboxes.push_back(remote->deliveryInbox());
                    }
                }
            }
        }
        if(inboxes.empty())
        {
            continue;
        }
        ASSIGN_OR_RETURN(std::string undo_id, derivedActivityId("undo", *mapped));
        nlohmann::json inner = {
            {"id", *mapped},
            {"type", is_like ? "Like" : "Announce"},
            {"actor", actor.uri},
        };
        deliver(undoActivity(undo_id, actor.uri, inner), inboxes, actor);
    }
    return {};
}

E<void> BridgeCoordinator::observeFollowerList(const DerivedIdentity& follower,
                                               const NativeEvent& event)
{
    std::set<std::string> listed;
    for(const auto& pubkey : event.tagValues("p"))
    {
        if(!isLowerHex(pubkey, 64) || listed.size() >= config.contact_list_limit)
        {
            continue;
        }
        ASSIGN_OR_RETURN(auto derived, identities.findIdentityByPubkey(pubkey));
        if(!derived.has_value())
        {
            listed.insert(pubkey);
        }
    }

    bool changed = false;
    {
        auto guard = locks.lock("followers " + follower.actor_uri);
        for(const auto& pubkey : listed)
        {
            ASSIGN_OR_RETURN(bool applied, identities.applyFollower(
                pubkey, follower.actor_uri, FollowSource::RELAY,
                FollowState::ACTIVE, event.created_at));
            changed = changed || applied;
        }
        ASSIGN_OR_RETURN(auto current, store.followedBy(follower.actor_uri));
        for(const auto& pubkey : current)
        {
            if(listed.contains(pubkey))
            {
                continue;
            }
            ASSIGN_OR_RETURN(bool applied, identities.applyFollower(
                pubkey, follower.actor_uri, FollowSource::RELAY,
                FollowState::REMOVED, event.created_at));
            changed = changed || applied;
        }
    }
    if(changed)
    {
        spdlog::debug("Follows of {} updated from contact list {}",
                      follower.actor_uri, event.id);
        return refreshSubscriptions();
    }
    return {};
}

// ========== Federation to native ==================================>

E<void> BridgeCoordinator::ingestFederationActivity(const nlohmann::json& doc,
                                                    const RemoteActor& signer)
{
    ASSIGN_OR_RETURN(Activity act, parseActivity(doc));
    const std::string& id = activityId(act);
    if(activityActor(act) != signer.uri)
    {
        return std::unexpected(signatureInvalid(std::format(
            "Activity {} is by {} but was signed by {}", id,
            activityActor(act), signer.uri)));
    }
    if(hostOf(id) != hostOf(signer.uri))
    {
        return std::unexpected(signatureInvalid(std::format(
            "Activity {} does not live on the server of {}", id, signer.uri)));
    }

    // A copy of the activity already being processed is dropped rather
    // than waited for.
    auto claim = in_flight.tryLock("activity " + id);
    if(!claim.has_value())
    {
        spdlog::debug("Activity {} is already being processed", id);
        return {};
    }
    ASSIGN_OR_RETURN(bool seen, dedup.contains(id));
    if(seen)
    {
        spdlog::debug("Activity {} was already processed", id);
        return {};
    }

    E<void> result = std::visit(Overloaded{
            [&](const activity::Create& a) { return onCreate(a, signer); },
            [&](const activity::Update& a) { return onUpdate(a, signer); },
            [&](const activity::Delete& a) { return onDelete(a, signer); },
            [&](const activity::Follow& a) { return onFollow(a, signer); },
            [&](const activity::Accept& a)
            {
                return onFollowResponse(a.follow_id, signer,
                                        FollowingState::ACCEPTED);
            },
            [&](const activity::Reject& a)
            {
                return onFollowResponse(a.follow_id, signer,
                                        FollowingState::REJECTED);
            },
            [&](const activity::Like& a) { return onLike(a, signer); },
            [&](const activity::Announce& a) { return onAnnounce(a, signer); },
            [&](const activity::Undo& a) { return onUndo(a, signer); },
        }, act);

    // Failures worth a retry by the sender leave the id unrecorded.
    if(result.has_value() || result.error().kind == ErrorKind::INVALID_INPUT ||
       result.error().kind == ErrorKind::NOT_FOUND)
    {
        auto marked = dedup.markFirstSeen(id);
        if(!marked.has_value())
        {
            return std::unexpected(marked.error());
        }
    }
    return result;
}

E<void> BridgeCoordinator::onCreate(const activity::Create& create,
                                    const RemoteActor& signer)
{
    nlohmann::json object = create.object;
    if(object.is_string())
    {
        ASSIGN_OR_RETURN(object, actors.fetchObject(object.get<std::string>()));
    }
    if(json_ld::getId(object, "attributedTo") != signer.uri)
    {
        return std::unexpected(invalidInput(std::format(
            "Create {} wraps an object not attributed to {}", create.id,
            signer.uri)));
    }
    ASSIGN_OR_RETURN(NativeEvent event, bridgeThread(object));
    spdlog::debug("Create {} bridged as {}", create.id, event.id);
    return {};
}

E<void> BridgeCoordinator::onUpdate(const activity::Update& update,
                                    const RemoteActor& signer)
{
    std::string object_id = update.object.is_string()
        ? update.object.get<std::string>()
        : json_ld::getString(update.object, "id");
    if(object_id != signer.uri)
    {
        spdlog::debug("Update {} of {} is not bridged", update.id, object_id);
        return {};
    }
    RemoteActor actor;
    if(update.object.is_object())
    {
        ASSIGN_OR_RETURN(actor, remoteActorFromJson(update.object, nowSeconds()));
    }
    else
    {
        ASSIGN_OR_RETURN(actor, actors.fetch(signer.uri));
    }
    DO_OR_RETURN(actors.remember(actor));
    mirrorProfile(actor, true);
    return {};
}

E<void> BridgeCoordinator::onDelete(const activity::Delete& del,
                                    const RemoteActor& signer)
{
    if(del.object_id == signer.uri)
    {
        spdlog::debug("Ignoring deletion of account {}", signer.uri);
        return {};
    }
    if(hostOf(del.object_id) != hostOf(signer.uri))
    {
        return std::unexpected(invalidInput(std::format(
            "{} cannot delete {}", signer.uri, del.object_id)));
    }
    ASSIGN_OR_RETURN(auto mapped, store.eventIdForObject(del.object_id));
    if(!mapped.has_value())
    {
        spdlog::debug("Deleted object {} was never bridged", del.object_id);
        return {};
    }
    ASSIGN_OR_RETURN(DerivedIdentity identity,
                     identities.resolveOrCreateIdentity(signer.uri));
    if(auto known = recent_events.get(*mapped);
       known.has_value() && known->pubkey != identity.pubkey)
    {
        return std::unexpected(invalidInput(std::format(
            "{} is not the author of {}", signer.uri, del.object_id)));
    }
    NativeEvent event = deletionEvent(del.id, identity.pubkey, {*mapped},
                                      label_namespace, nowSeconds());
    return signAndPublish(event, identity.secret_key);
}

E<void> BridgeCoordinator::onFollow(const activity::Follow& follow,
                                    const RemoteActor& signer)
{
    auto pubkey = urls.pubkeyFromActor(follow.object_id);
    if(!pubkey.has_value())
    {
        return std::unexpected(notFound(std::format(
            "{} is not an actor of this bridge", follow.object_id)));
    }
    ASSIGN_OR_RETURN(VirtualActor actor, identities.resolveOrCreateActor(*pubkey));
    ASSIGN_OR_RETURN(bool changed, identities.applyFollower(
        *pubkey, signer.uri, FollowSource::FEDERATION, FollowState::ACTIVE,
        nowSeconds()));
    DO_OR_RETURN(store.putInboundFollow({follow.id, *pubkey, signer.uri}));
    spdlog::info("{} follows {}", signer.uri, actor.uri);

    ASSIGN_OR_RETURN(std::string accept_id, derivedActivityId("accept", follow.id));
    deliver(acceptActivity(accept_id, actor.uri,
                           followActivity(follow.id, follow.actor,
                                          follow.object_id)),
            {signer.inbox}, actor);
    mirrorProfile(signer);
    DO_OR_RETURN(publishFollowerList(signer.uri));
    if(changed)
    {
        return refreshSubscriptions();
    }
    return {};
}

E<void> BridgeCoordinator::onFollowResponse(const std::string& follow_id,
                                            const RemoteActor& signer,
                                            FollowingState state)
{
    ASSIGN_OR_RETURN(auto record, store.getFollowingById(follow_id));
    if(!record.has_value())
    {
        return std::unexpected(notFound("Unknown follow " + follow_id));
    }
    if(record->target_uri != signer.uri)
    {
        return std::unexpected(invalidInput(std::format(
            "{} answered a follow of {}", signer.uri, record->target_uri)));
    }
    record->state = state;
    DO_OR_RETURN(store.putFollowing(*record));
    spdlog::info("{} {} the follow from {}", signer.uri,
                 state == FollowingState::ACCEPTED ? "accepted" : "rejected",
                 urls.actor(record->pubkey));
    return {};
}

E<void> BridgeCoordinator::onLike(const activity::Like& like,
                                  const RemoteActor& signer)
{
    ASSIGN_OR_RETURN(NativeEvent target, resolveTarget(like.object_id));
    ASSIGN_OR_RETURN(DerivedIdentity identity,
                     identities.resolveOrCreateIdentity(signer.uri));
    mirrorProfile(signer);
    NativeEvent event = likeToReaction(like, identity.pubkey, target,
                                       label_namespace, nowSeconds());
    DO_OR_RETURN(event.sign(identity.secret_key));
    DO_OR_RETURN(store.putObjectMapping({like.id, event.id}));
    publish(event);
    return {};
}

E<void> BridgeCoordinator::onAnnounce(const activity::Announce& announce,
                                      const RemoteActor& signer)
{
    if(!announce.is_public)
    {
        spdlog::debug("Announce {} is not public", announce.id);
        return {};
    }
    ASSIGN_OR_RETURN(NativeEvent target, resolveTarget(announce.object_id));
    ASSIGN_OR_RETURN(DerivedIdentity identity,
                     identities.resolveOrCreateIdentity(signer.uri));
    mirrorProfile(signer);
    NativeEvent event = announceToRepost(announce, identity.pubkey, target,
                                         label_namespace, nowSeconds());
    DO_OR_RETURN(event.sign(identity.secret_key));
    DO_OR_RETURN(store.putObjectMapping({announce.id, event.id}));
    publish(event);
    return {};
}

E<void> BridgeCoordinator::onUndo(const activity::Undo& undo,
                                  const RemoteActor& signer)
{
    if(undo.inner_type == "Follow")
    {
        auto pubkey = urls.pubkeyFromActor(undo.inner_object_id);
        if(!pubkey.has_value())
        {
            return std::unexpected(notFound(std::format(
                "{} is not an actor of this bridge", undo.inner_object_id)));
        }
        return undoFollow(*pubkey, signer);
    }
    if(undo.inner_type.empty())
    {
        // Only the id was given; it may name a Follow seen earlier.
        ASSIGN_OR_RETURN(auto follow, store.getInboundFollow(undo.inner_id));
        if(follow.has_value())
        {
            if(follow->follower_uri != signer.uri)
            {
                return std::unexpected(invalidInput(std::format(
                    "{} cannot undo {}", signer.uri, undo.inner_id)));
            }
            return undoFollow(follow->subject_pubkey, signer);
        }
    }

    if(!undo.inner_type.empty() && undo.inner_type != "Like" &&
       undo.inner_type != "EmojiReact" && undo.inner_type != "Announce")
    {
        spdlog::debug("Undo of {} is not bridged", undo.inner_type);
        return {};
    }
    if(hostOf(undo.inner_id) != hostOf(signer.uri))
    {
        return std::unexpected(invalidInput(std::format(
            "{} cannot undo {}", signer.uri, undo.inner_id)));
    }
    ASSIGN_OR_RETURN(auto mapped, store.eventIdForObject(undo.inner_id));
    if(!mapped.has_value())
    {
        spdlog::debug("Undone activity {} was never bridged", undo.inner_id);
        return {};
    }
    ASSIGN_OR_RETURN(DerivedIdentity identity,
                     identities.resolveOrCreateIdentity(signer.uri));
    NativeEvent event = deletionEvent(undo.id, identity.pubkey, {*mapped},
                                      label_namespace, nowSeconds());
    return signAndPublish(event, identity.secret_key);
}

E<void> BridgeCoordinator::undoFollow(const std::string& pubkey,
                                      const RemoteActor& signer)
{
    ASSIGN_OR_RETURN(bool changed, identities.applyFollower(
        pubkey, signer.uri, FollowSource::FEDERATION, FollowState::REMOVED,
        nowSeconds()));
    spdlog::info("{} unfollows {}", signer.uri, urls.actor(pubkey));
    DO_OR_RETURN(publishFollowerList(signer.uri));
    if(changed)
    {
        return refreshSubscriptions();
    }
    return {};
}

E<NativeEvent> BridgeCoordinator::resolveTarget(const std::string& uri)
{
    ASSIGN_OR_RETURN(auto known, knownEventForObject(uri));
    if(!known.has_value() && !urls.isLocal(uri))
    {
        ASSIGN_OR_RETURN(nlohmann::json object, actors.fetchObject(uri));
        ASSIGN_OR_RETURN(known, bridgeThread(object));
    }
    if(!known.has_value() || known->sig.empty())
    {
        return std::unexpected(notFound("No native event for " + uri));
    }
    return *known;
}

E<std::optional<NativeEvent>>
BridgeCoordinator::knownEventForObject(const std::string& uri)
{
    if(auto local = urls.eventIdFromNote(uri); local.has_value())
    {
        return findNativeEvent(*local);
    }
    ASSIGN_OR_RETURN(auto mapped, store.eventIdForObject(uri));
    if(!mapped.has_value())
    {
        return std::nullopt;
    }
    ASSIGN_OR_RETURN(auto event, findNativeEvent(*mapped));
    if(event.has_value())
    {
        return event;
    }
    // The id alone is enough to thread a reply under it.
    NativeEvent stub;
    stub.id = *mapped;
    return std::optional<NativeEvent>(std::move(stub));
}

E<NativeEvent> BridgeCoordinator::bridgeThread(const nlohmann::json& object)
{
    // Walk up the reply chain until a post that already has a native
    // counterpart, collecting what has to be bridged on the way.
    std::vector<nlohmann::json> chain{object};
    std::set<std::string> visited{json_ld::getString(object, "id")};
    std::optional<NativeEvent> anchor;
    while(static_cast<int>(chain.size()) < config.max_thread_depth)
    {
        std::string parent_id = json_ld::getId(chain.back(), "inReplyTo");
        if(parent_id.empty())
        {
            break;
        }
        if(!visited.insert(parent_id).second)
        {
            spdlog::warn("Reply chain of {} loops at {}",
                         json_ld::getString(object, "id"), parent_id);
            break;
        }
        ASSIGN_OR_RETURN(anchor, knownEventForObject(parent_id));
        if(anchor.has_value() || urls.isLocal(parent_id))
        {
            break;
        }
        auto parent = actors.fetchObject(parent_id);
        if(!parent.has_value())
        {
            spdlog::info("Cannot fetch {}: {}", parent_id,
                         errorMsg(parent.error()));
            break;
        }
        chain.push_back(std::move(*parent));
    }

    // Then bridge top down. A link that fails leaves the one below it
    // without a parent.
    std::optional<NativeEvent> parent = anchor;
    for(size_t i = chain.size() - 1; i > 0; i--)
    {
        auto event = bridgeObject(chain[i], parent);
        if(!event.has_value())
        {
            spdlog::info("Cannot bridge {}: {}",
                         json_ld::getString(chain[i], "id"),
                         errorMsg(event.error()));
            parent.reset();
            continue;
        }
        parent = std::move(*event);
    }
    return bridgeObject(chain.front(), parent);
}

E<NativeEvent>
BridgeCoordinator::bridgeObject(const nlohmann::json& object,
                                const std::optional<NativeEvent>& parent)
{
    std::string id = json_ld::getString(object, "id");
    std::string author_uri = json_ld::getId(object, "attributedTo");
    if(id.empty() || author_uri.empty())
    {
        return std::unexpected(invalidInput("Object has no id or author"));
    }
    if(urls.isLocal(id) || hostOf(author_uri) != hostOf(id))
    {
        return std::unexpected(invalidInput(std::format(
            "Object {} cannot be by {}", id, author_uri)));
    }

    return object_flight.run(id, [&]() -> E<NativeEvent>
    {
        ASSIGN_OR_RETURN(DerivedIdentity author,
                         identities.resolveOrCreateIdentity(author_uri));
        ASSIGN_OR_RETURN(auto mapped, store.eventIdForObject(id));
        if(mapped.has_value())
        {
            ASSIGN_OR_RETURN(auto known, findNativeEvent(*mapped));
            if(known.has_value())
            {
                return *known;
            }
            NativeEvent stub;
            stub.id = *mapped;
            stub.pubkey = author.pubkey;
            return stub;
        }

        if(auto remote = actors.resolve(author_uri); remote.has_value())
        {
            mirrorProfile(*remote);
        }
        else
        {
            spdlog::debug("Cannot resolve {}: {}", author_uri,
                          errorMsg(remote.error()));
        }

        InboundNoteContext ctx;
        ctx.author_pubkey = author.pubkey;
        ctx.parent = parent;
        ctx.label_namespace = label_namespace;
        ctx.now = nowSeconds();
        if(std::string quote = quoteOf(object); !quote.empty())
        {
            ASSIGN_OR_RETURN(auto quoted, knownEventForObject(quote));
            if(quoted.has_value() && !quoted->pubkey.empty())
            {
                ctx.quoted = std::move(quoted);
            }
        }
        if(object.contains("tag") && object["tag"].is_array())
        {
            for(const auto& t : object["tag"])
            {
                std::string href = json_ld::getString(t, "href");
                if(!json_ld::hasType(t, "Mention") || href.empty())
                {
                    continue;
                }
                if(auto local = urls.pubkeyFromActor(href); local.has_value())
                {
                    ctx.mention_keys[href] = *local;
                    continue;
                }
                auto mentioned = identities.resolveOrCreateIdentity(href);
                if(mentioned.has_value())
                {
                    ctx.mention_keys[href] = mentioned->pubkey;
                }
                else
                {
                    spdlog::debug("Dropping mention of {}: {}", href,
                                  errorMsg(mentioned.error()));
                }
            }
        }

        ASSIGN_OR_RETURN(auto translated, objectToNote(object, ctx, transform));
        logDegradations(id, translated.degradations);
        NativeEvent event = std::move(translated.value);
        DO_OR_RETURN(event.sign(author.secret_key));
        DO_OR_RETURN(store.putObjectMapping({id, event.id}));
        publish(event);
        spdlog::debug("Bridged {} as {}", id, event.id);
        return event;
    });
}

void BridgeCoordinator::mirrorProfile(const RemoteActor& actor, bool force)
{
    if(!force && mirrored_profiles.get(actor.uri).has_value())
    {
        return;
    }
    mirrored_profiles.put(actor.uri, true);
    auto identity = identities.resolveOrCreateIdentity(actor.uri);
    if(!identity.has_value())
    {
        spdlog::warn("Cannot mirror the profile of {}: {}", actor.uri,
                     errorMsg(identity.error()));
        return;
    }
    NativeEvent event = profileToMetadata(actor, identity->pubkey,
                                          label_namespace, nowSeconds(),
                                          transform);
    auto published = signAndPublish(event, identity->secret_key);
    if(!published.has_value())
    {
        spdlog::warn("Cannot mirror the profile of {}: {}", actor.uri,
                     errorMsg(published.error()));
    }
}

E<void> BridgeCoordinator::publishFollowerList(const std::string& follower_uri)
{
    ASSIGN_OR_RETURN(DerivedIdentity identity,
                     identities.resolveOrCreateIdentity(follower_uri));
    NativeEvent event;
    {
        auto guard = locks.lock("followers " + follower_uri);
        ASSIGN_OR_RETURN(auto follows, store.followedBy(follower_uri));
        event = contactListEvent(follower_uri, identity.pubkey, follows,
                                 label_namespace, nowSeconds());
        DO_OR_RETURN(event.sign(identity.secret_key));
    }
    publish(event);
    return {};
}

E<void> BridgeCoordinator::signAndPublish(NativeEvent& event,
                                          const std::string& secret_key)
{
    DO_OR_RETURN(event.sign(secret_key));
    publish(event);
    return {};
}

void BridgeCoordinator::publish(const NativeEvent& event)
{
    recent_events.put(event.id, event);
    auto sent_to = relays.publish(event);
    if(!sent_to.empty())
    {
        spdlog::debug("Published {} to {} relays", event.id, sent_to.size());
    }
}

E<std::string> BridgeCoordinator::derivedActivityId(std::string_view kind,
                                                    const std::string& seed) const
{
    auto hash = mw::SHA256Hasher().hashToBytes(seed);
    if(!hash.has_value())
    {
        return std::unexpected(fromInternalError(hash.error()));
    }
    return urls.activity(kind, hexEncode(*hash).substr(0, 32));
}

E<nlohmann::json> BridgeCoordinator::noteObject(const std::string& event_id)
{
    ASSIGN_OR_RETURN(auto event, findNativeEvent(event_id));
    if(!event.has_value() || event->kind != kind::TEXT_NOTE ||
       event->isFromFederation())
    {
        return std::unexpected(notFound("No native note " + event_id));
    }
    ASSIGN_OR_RETURN(NativeContent content, classifyEvent(*event));
    const auto* note = std::get_if<native::Note>(&content);
    if(note == nullptr)
    {
        return std::unexpected(notFound("No native note " + event_id));
    }
    ASSIGN_OR_RETURN(VirtualActor author,
                     identities.resolveOrCreateActor(event->pubkey));
    ASSIGN_OR_RETURN(NoteAddressing addressing, addressNote(*note));
    return noteToObject(*note, author, addressing.ctx, urls, transform).value;
}
