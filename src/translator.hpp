#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "native_event.hpp"
#include "text_transform.hpp"
#include "types.hpp"
#include "url_manager.hpp"

// Conversions between native events and federation activities. Every
// function here is pure: identities, parents and mentions are resolved
// by the caller and passed in, and events come back unsigned.

// A lossy step taken during a translation whose result is still
// usable.
struct Degradation
{
    enum class Kind
    {
        // Reply to a post that could not be resolved; posted top level.
        MISSING_PARENT,
        // Quote of a post that could not be resolved; kept as a link.
        MISSING_QUOTE,
        // Media type with no counterpart; kept as a plain link.
        UNSUPPORTED_MEDIA,
    };

    Kind kind;
    std::string detail;

    bool operator==(const Degradation&) const = default;
};

std::string_view degradationName(Degradation::Kind kind);

template<typename T>
struct Translated
{
    T value;
    std::vector<Degradation> degradations;
};

// Native events, classified by kind.
namespace native
{

struct Note
{
    NativeEvent event;
    std::optional<std::string> root;
    // The event this one directly replies to.
    std::optional<std::string> reply_to;
    // Hex keys from “p” tags and “nostr:npub1…” markers, deduplicated.
    std::vector<std::string> mentions;
    std::optional<std::string> quote;
};

struct Reaction
{
    NativeEvent event;
    std::string target_id;
    // Empty if the reaction carries no “p” tag.
    std::string target_author;
};

struct Repost
{
    NativeEvent event;
    std::string target_id;
    std::string target_author;
};

struct Metadata
{
    NativeEvent event;
    ProfileUpdate profile;
};

struct ContactList
{
    NativeEvent event;
    // Hex keys, in list order, deduplicated.
    std::vector<std::string> follows;
};

struct Deletion
{
    NativeEvent event;
    std::vector<std::string> event_ids;
};

} // namespace native

using NativeContent = std::variant<native::Note, native::Reaction,
                                   native::Repost, native::Metadata,
                                   native::ContactList, native::Deletion>;

// INVALID_INPUT for kinds that are not bridged and for events missing
// what their kind requires.
E<NativeContent> classifyEvent(const NativeEvent& event);

// Federation activities, classified by type.
namespace activity
{

struct Create
{
    std::string id;
    std::string actor;
    nlohmann::json object;
};

struct Update
{
    std::string id;
    std::string actor;
    nlohmann::json object;
};

struct Delete
{
    std::string id;
    std::string actor;
    std::string object_id;
};

struct Follow
{
    std::string id;
    std::string actor;
    std::string object_id;
};

// Accept or Reject of a Follow this bridge sent.
struct Accept
{
    std::string id;
    std::string actor;
    std::string follow_id;
};

struct Reject
{
    std::string id;
    std::string actor;
    std::string follow_id;
};

struct Like
{
    std::string id;
    std::string actor;
    std::string object_id;
    // Emoji reaction, e.g. “👍” or “:blobcat:”. Empty for a plain like.
    std::string content;
    // Image of a custom emoji reaction.
    std::string emoji_url;
};

struct Announce
{
    std::string id;
    std::string actor;
    std::string object_id;
    std::optional<int64_t> published;
    bool is_public = false;
};

struct Undo
{
    std::string id;
    std::string actor;
    // Type and id of the undone activity. The type is empty if the
    // activity was referenced by id only.
    std::string inner_type;
    std::string inner_id;
    std::string inner_object_id;
};

} // namespace activity

using Activity = std::variant<activity::Create, activity::Update,
                              activity::Delete, activity::Follow,
                              activity::Accept, activity::Reject,
                              activity::Like, activity::Announce,
                              activity::Undo>;

// INVALID_INPUT for unknown types and for activities missing an id or
// an actor.
E<Activity> parseActivity(const nlohmann::json& doc);
const std::string& activityId(const Activity& a);
const std::string& activityActor(const Activity& a);

// Outbound, native to federation.

// How a mentioned native key appears on the federation side.
struct MentionTarget
{
    std::string actor_uri;
    // “name@domain”.
    std::string handle;
};

struct OutboundNoteContext
{
    // Federation object the note replies to, if it could be resolved.
    std::optional<std::string> parent_object;
    std::optional<std::string> parent_actor;
    std::optional<std::string> quote_object;
    // Keyed by hex key. Mentions missing here are left out.
    std::map<std::string, MentionTarget> mentions;
};

// Note object for a native note, addressed publicly and to the
// author's followers.
Translated<nlohmann::json>
noteToObject(const native::Note& note, const VirtualActor& author,
             const OutboundNoteContext& ctx, const URLManager& urls,
             const TextTransformInterface& transform);
// Create wrapping a Note object, with the same addressing.
nlohmann::json createActivity(const nlohmann::json& object,
                              const std::string& id);
// Like for a reaction. Plain likes map to “+”; other content becomes
// an emoji reaction. INVALID_INPUT for “-”, which has no counterpart.
E<nlohmann::json> reactionToLike(const native::Reaction& reaction,
                                 const VirtualActor& author,
                                 const std::string& object_uri,
                                 const std::string& object_actor,
                                 const URLManager& urls);
nlohmann::json repostToAnnounce(const native::Repost& repost,
                                const VirtualActor& author,
                                const std::string& object_uri,
                                const std::string& object_actor,
                                const URLManager& urls);
// Person document of a virtual actor.
nlohmann::json actorDocument(const VirtualActor& actor,
                             const URLManager& urls,
                             const TextTransformInterface& transform);
// Application document of the actor signing fetches.
nlohmann::json systemActorDocument(const std::string& public_key_pem,
                                   const URLManager& urls);
nlohmann::json updateActivity(const std::string& id,
                              const VirtualActor& actor,
                              const nlohmann::json& object);
nlohmann::json followActivity(const std::string& id,
                              const std::string& actor_uri,
                              const std::string& target_uri);
nlohmann::json undoActivity(const std::string& id,
                            const std::string& actor_uri,
                            const nlohmann::json& inner);
nlohmann::json acceptActivity(const std::string& id,
                              const std::string& actor_uri,
                              const nlohmann::json& follow);
nlohmann::json deleteActivity(const std::string& id,
                              const VirtualActor& actor,
                              const std::string& object_uri);

// Inbound, federation to native.

struct InboundNoteContext
{
    // Native key standing for the author.
    std::string author_pubkey;
    // The native counterpart of “inReplyTo”, if it could be resolved.
    std::optional<NativeEvent> parent;
    // The native counterpart of the quoted post.
    std::optional<NativeEvent> quoted;
    // Mentioned actor URI to hex key. Mentions missing here are left
    // out.
    std::map<std::string, std::string> mention_keys;
    // Label namespace, the reverse domain of this bridge.
    std::string label_namespace;
    // Used when the object has no usable “published”.
    int64_t now = 0;
};

// Unsigned text note for a Note object. INVALID_INPUT for objects
// without content and for non-public posts.
E<Translated<NativeEvent>>
objectToNote(const nlohmann::json& object, const InboundNoteContext& ctx,
             const TextTransformInterface& transform);
NativeEvent likeToReaction(const activity::Like& like,
                           const std::string& author_pubkey,
                           const NativeEvent& target,
                           const std::string& label_namespace, int64_t now);
NativeEvent announceToRepost(const activity::Announce& announce,
                             const std::string& author_pubkey,
                             const NativeEvent& target,
                             const std::string& label_namespace,
                             int64_t now);
// Deletion of the native events standing for a deleted object.
NativeEvent deletionEvent(const std::string& ap_id,
                          const std::string& author_pubkey,
                          const std::vector<std::string>& event_ids,
                          const std::string& label_namespace, int64_t now);
// Metadata event mirroring a remote profile.
NativeEvent profileToMetadata(const RemoteActor& actor,
                              const std::string& author_pubkey,
                              const std::string& label_namespace,
                              int64_t now,
                              const TextTransformInterface& transform);
// Contact list of a federated actor as seen by this bridge.
NativeEvent contactListEvent(const std::string& actor_uri,
                             const std::string& author_pubkey,
                             const std::vector<std::string>& follows,
                             const std::string& label_namespace,
                             int64_t now);

// Parses an actor document. INVALID_INPUT if it lacks an id, an inbox
// or a public key.
E<RemoteActor> remoteActorFromJson(const nlohmann::json& doc,
                                   int64_t fetched_at);

// Proxy and label tags marking an event as published on behalf of a
// federation object.
void addProxyTags(std::vector<Tag>& tags, const std::string& ap_id,
                  const std::string& label_namespace);
