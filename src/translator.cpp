#include "translator.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <regex>
#include <string_view>

#include "bech32.hpp"
#include "http_utils.hpp"
#include "json_ld.hpp"
#include "utils.hpp"

namespace
{

const nlohmann::json AS_CONTEXT = {
    "https://www.w3.org/ns/activitystreams",
    "https://w3id.org/security/v1",
};

const std::regex& npubMarkerRegex()
{
    static const std::regex re("nostr:(npub1[qpzry9x8gf2tvdw0s3jn54khce6mua7l]{58})");
    return re;
}

const std::regex& urlRegex()
{
    static const std::regex re(R"(https?://[^\s<>"]+)");
    return re;
}

void pushUnique(std::vector<Tag>& tags, Tag tag)
{
    if(std::find(tags.begin(), tags.end(), tag) == tags.end())
    {
        tags.push_back(std::move(tag));
    }
}

void pushUnique(std::vector<std::string>& values, const std::string& value)
{
    if(!value.empty() &&
       std::find(values.begin(), values.end(), value) == values.end())
    {
        values.push_back(value);
    }
}

// Hex keys named by “nostr:npub1…” markers in content.
std::vector<std::string> npubMarkers(const std::string& content)
{
    std::vector<std::string> keys;
    for(auto it = std::sregex_iterator(content.begin(), content.end(),
                                       npubMarkerRegex());
        it != std::sregex_iterator(); ++it)
    {
        auto hex = bech32::decodeHex("npub", (*it)[1].str());
        if(hex.has_value())
        {
            pushUnique(keys, *hex);
        }
    }
    return keys;
}

bool isBridgedMediaType(std::string_view media_type)
{
    return media_type.starts_with("image/") ||
        media_type.starts_with("video/") || media_type.starts_with("audio/");
}

// Media type guessed from the extension of a URL, or empty.
std::string mediaTypeOfUrl(std::string_view url)
{
    static const std::vector<std::pair<std::string_view, std::string_view>>
        TYPES = {
            {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
            {".png", "image/png"}, {".gif", "image/gif"},
            {".webp", "image/webp"}, {".avif", "image/avif"},
            {".mp4", "video/mp4"}, {".webm", "video/webm"},
            {".mov", "video/quicktime"}, {".mp3", "audio/mpeg"},
            {".ogg", "audio/ogg"}, {".m4a", "audio/mp4"},
            {".wav", "audio/wav"},
        };
    size_t end = url.find_first_of("?#");
    std::string path(url.substr(0, end));
    std::transform(path.begin(), path.end(), path.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    for(const auto& [ext, type] : TYPES)
    {
        if(path.ends_with(ext))
        {
            return std::string(type);
        }
    }
    return "";
}

// The URL of a field that may be a string, a Link, or an object whose
// “url” is either.
std::string urlOf(const nlohmann::json& j, const std::string& key)
{
    if(!j.is_object() || !j.contains(key))
    {
        return "";
    }
    const nlohmann::json* val = &j[key];
    if(val->is_array())
    {
        if(val->empty())
        {
            return "";
        }
        val = &val->front();
    }
    if(val->is_string())
    {
        return val->get<std::string>();
    }
    if(val->is_object())
    {
        if(val->contains("url"))
        {
            return urlOf(*val, "url");
        }
        return json_ld::getString(*val, "href");
    }
    return "";
}

// Replaces whole-word occurrences of needle. A match is whole if it is
// not glued to a word character on the left, and not followed by a
// word character or by “@” (which would make it a longer handle).
std::string replaceWord(const std::string& text, const std::string& needle,
                        const std::string& replacement)
{
    auto is_word = [](char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };
    std::string result;
    size_t last = 0;
    size_t pos = text.find(needle);
    while(pos != std::string::npos)
    {
        size_t end = pos + needle.size();
        bool left_ok = pos == 0 || !is_word(text[pos - 1]);
        bool right_ok = end >= text.size() ||
            (!is_word(text[end]) && text[end] != '@');
        if(left_ok && right_ok)
        {
            result += text.substr(last, pos - last);
            result += replacement;
            last = end;
        }
        pos = text.find(needle, end);
    }
    result += text.substr(last);
    return result;
}

void appendLine(std::string& content, const std::string& line)
{
    if(!content.empty() && !content.ends_with('\n'))
    {
        content += '\n';
    }
    content += line;
}

std::optional<int64_t> publishedOf(const nlohmann::json& j)
{
    std::string published = json_ld::getString(j, "published");
    if(published.empty())
    {
        return std::nullopt;
    }
    auto t = http_utils::parseIsoTime(published);
    if(!t.has_value())
    {
        return std::nullopt;
    }
    return static_cast<int64_t>(*t);
}

nlohmann::json withoutContext(nlohmann::json j)
{
    if(j.is_object())
    {
        j.erase("@context");
    }
    return j;
}

E<ProfileUpdate> parseProfile(const NativeEvent& event)
{
    nlohmann::json content;
    try
    {
        content = nlohmann::json::parse(event.content);
    }
    catch(const nlohmann::json::exception& e)
    {
        return std::unexpected(invalidInput(
            std::string("Invalid metadata content: ") + e.what()));
    }
    if(!content.is_object())
    {
        return std::unexpected(invalidInput("Metadata content is not an object"));
    }
    ProfileUpdate profile;
    profile.display_name = json_ld::getString(content, "display_name");
    if(profile.display_name.empty())
    {
        profile.display_name = json_ld::getString(content, "name");
    }
    profile.summary = json_ld::getString(content, "about");
    profile.avatar = json_ld::getString(content, "picture");
    profile.created_at = event.created_at;
    return profile;
}

std::optional<std::string> lastTagValue(const NativeEvent& event,
                                        std::string_view name)
{
    auto values = event.tagValues(name);
    if(values.empty())
    {
        return std::nullopt;
    }
    return values.back();
}

E<NativeContent> classifyNote(const NativeEvent& event)
{
    native::Note note;
    note.event = event;

    std::vector<std::string> unmarked;
    for(const auto& tag : event.tags)
    {
        if(tag.size() < 2 || tag[0] != "e")
        {
            continue;
        }
        std::string marker = tag.size() >= 4 ? tag[3] : "";
        if(marker == "root")
        {
            note.root = tag[1];
        }
        else if(marker == "reply")
        {
            note.reply_to = tag[1];
        }
        else if(marker.empty())
        {
            unmarked.push_back(tag[1]);
        }
    }
    // Positional form: first is the root, last the direct parent.
    if(!note.root.has_value() && !note.reply_to.has_value() &&
       !unmarked.empty())
    {
        note.root = unmarked.front();
        note.reply_to = unmarked.back();
    }
    if(note.root.has_value() && !note.reply_to.has_value())
    {
        note.reply_to = note.root;
    }

    for(const auto& pubkey : event.tagValues("p"))
    {
        if(isLowerHex(pubkey, 64))
        {
            pushUnique(note.mentions, pubkey);
        }
    }
    for(const auto& pubkey : npubMarkers(event.content))
    {
        pushUnique(note.mentions, pubkey);
    }
    note.quote = lastTagValue(event, "q");
    return note;
}

} // namespace

std::string_view degradationName(Degradation::Kind kind)
{
    switch(kind)
    {
    case Degradation::Kind::MISSING_PARENT:
        return "missing parent";
    case Degradation::Kind::MISSING_QUOTE:
        return "missing quote";
    case Degradation::Kind::UNSUPPORTED_MEDIA:
        return "unsupported media";
    }
    return "unknown";
}

E<NativeContent> classifyEvent(const NativeEvent& event)
{
    switch(event.kind)
    {
    case kind::TEXT_NOTE:
        return classifyNote(event);
    case kind::REACTION:
    case kind::REPOST:
    {
        auto target = lastTagValue(event, "e");
        if(!target.has_value())
        {
            return std::unexpected(invalidInput(
                std::format("Event {} has no target", event.id)));
        }
        std::string author = lastTagValue(event, "p").value_or("");
        if(event.kind == kind::REACTION)
        {
            return native::Reaction{event, *target, author};
        }
        return native::Repost{event, *target, author};
    }
    case kind::METADATA:
    {
        ASSIGN_OR_RETURN(ProfileUpdate profile, parseProfile(event));
        return native::Metadata{event, std::move(profile)};
    }
    case kind::CONTACT_LIST:
    {
        native::ContactList list{event, {}};
        for(const auto& pubkey : event.tagValues("p"))
        {
            if(isLowerHex(pubkey, 64))
            {
                pushUnique(list.follows, pubkey);
            }
        }
        return list;
    }
    case kind::DELETION:
        return native::Deletion{event, event.tagValues("e")};
    default:
        return std::unexpected(invalidInput(
            std::format("Kind {} is not bridged", event.kind)));
    }
}

E<Activity> parseActivity(const nlohmann::json& doc)
{
    if(!doc.is_object())
    {
        return std::unexpected(invalidInput("Activity is not an object"));
    }
    std::string id = json_ld::getString(doc, "id");
    std::string actor = json_ld::getId(doc, "actor");
    if(id.empty() || actor.empty())
    {
        return std::unexpected(invalidInput("Activity has no id or actor"));
    }
    std::string type = json_ld::firstType(doc);
    std::string object_id = json_ld::getId(doc, "object");

    if(type == "Create" || type == "Update")
    {
        if(!doc.contains("object"))
        {
            return std::unexpected(invalidInput(type + " has no object"));
        }
        if(type == "Create")
        {
            return activity::Create{id, actor, doc["object"]};
        }
        return activity::Update{id, actor, doc["object"]};
    }
    if(object_id.empty())
    {
        return std::unexpected(invalidInput(type + " has no object"));
    }
    if(type == "Delete")
    {
        return activity::Delete{id, actor, object_id};
    }
    if(type == "Follow")
    {
        return activity::Follow{id, actor, object_id};
    }
    if(type == "Accept")
    {
        return activity::Accept{id, actor, object_id};
    }
    if(type == "Reject")
    {
        return activity::Reject{id, actor, object_id};
    }
    if(type == "Like" || type == "EmojiReact")
    {
        activity::Like like{id, actor, object_id, "", ""};
        like.content = json_ld::getString(doc, "content");
        if(like.content.empty())
        {
            like.content = json_ld::getString(doc, "_misskey_reaction");
        }
        if(doc.contains("tag") && doc["tag"].is_array())
        {
            for(const auto& t : doc["tag"])
            {
                if(json_ld::hasType(t, "Emoji") &&
                   json_ld::getString(t, "name") == like.content)
                {
                    like.emoji_url = urlOf(t, "icon");
                }
            }
        }
        return like;
    }
    if(type == "Announce")
    {
        return activity::Announce{id, actor, object_id, publishedOf(doc),
                                  json_ld::isPublic(doc)};
    }
    if(type == "Undo")
    {
        activity::Undo undo{id, actor, "", object_id, ""};
        const auto& inner = doc["object"];
        if(inner.is_object())
        {
            undo.inner_type = json_ld::firstType(inner);
            undo.inner_object_id = json_ld::getId(inner, "object");
        }
        return undo;
    }
    return std::unexpected(invalidInput("Unsupported activity type: " + type));
}

const std::string& activityId(const Activity& a)
{
    return std::visit([](const auto& act) -> const std::string&
    {
        return act.id;
    }, a);
}

const std::string& activityActor(const Activity& a)
{
    return std::visit([](const auto& act) -> const std::string&
    {
        return act.actor;
    }, a);
}

Translated<nlohmann::json>
noteToObject(const native::Note& note, const VirtualActor& author,
             const OutboundNoteContext& ctx, const URLManager& urls,
             const TextTransformInterface& transform)
{
    Translated<nlohmann::json> result;
    const NativeEvent& event = note.event;

    std::string html = transform.markdownToHtml(event.content);
    // Mention markers that resolve become links to the actor.
    std::string linked;
    auto last = html.cbegin();
    for(auto it = std::sregex_iterator(html.cbegin(), html.cend(),
                                       npubMarkerRegex());
        it != std::sregex_iterator(); ++it)
    {
        auto hex = bech32::decodeHex("npub", (*it)[1].str());
        if(!hex.has_value())
        {
            continue;
        }
        auto target = ctx.mentions.find(*hex);
        if(target == ctx.mentions.end())
        {
            continue;
        }
        std::string name = target->second.handle.substr(
            0, target->second.handle.find('@'));
        linked.append(last, (*it)[0].first);
        linked += std::format(
            "<span class=\"h-card\"><a href=\"{}\" class=\"u-url mention\">"
            "@<span>{}</span></a></span>",
            target->second.actor_uri, escapeHtml(name));
        last = (*it)[0].second;
    }
    linked.append(last, html.cend());

    std::vector<std::string> cc{author.followers()};
    nlohmann::json tags = nlohmann::json::array();
    for(const auto& pubkey : note.mentions)
    {
        auto target = ctx.mentions.find(pubkey);
        if(target == ctx.mentions.end())
        {
            continue;
        }
        pushUnique(cc, target->second.actor_uri);
        tags.push_back({{"type", "Mention"},
                        {"href", target->second.actor_uri},
                        {"name", "@" + target->second.handle}});
    }
    for(const auto& hashtag : event.tagValues("t"))
    {
        tags.push_back({{"type", "Hashtag"}, {"name", "#" + hashtag}});
    }
    for(const auto& tag : event.tags)
    {
        if(tag.size() >= 3 && tag[0] == "emoji")
        {
            tags.push_back({{"type", "Emoji"},
                            {"id", tag[2]},
                            {"name", ":" + tag[1] + ":"},
                            {"icon", {{"type", "Image"}, {"url", tag[2]}}}});
        }
    }

    nlohmann::json object = {
        {"@context", AS_CONTEXT},
        {"id", urls.note(event.id)},
        {"type", "Note"},
        {"attributedTo", author.uri},
        {"content", linked},
        {"published", http_utils::formatIsoTime(event.created_at)},
        {"url", urls.note(event.id)},
        {"to", nlohmann::json::array({json_ld::PUBLIC_COLLECTION})},
        {"tag", std::move(tags)},
    };

    if(note.reply_to.has_value())
    {
        if(ctx.parent_object.has_value())
        {
            object["inReplyTo"] = *ctx.parent_object;
            if(ctx.parent_actor.has_value())
            {
                pushUnique(cc, *ctx.parent_actor);
            }
        }
        else
        {
            result.degradations.push_back(
                {Degradation::Kind::MISSING_PARENT, *note.reply_to});
        }
    }
    if(note.quote.has_value())
    {
        if(ctx.quote_object.has_value())
        {
            object["quoteUrl"] = *ctx.quote_object;
            object["_misskey_quote"] = *ctx.quote_object;
        }
        else
        {
            result.degradations.push_back(
                {Degradation::Kind::MISSING_QUOTE, *note.quote});
        }
    }
    if(const Tag* cw = event.findTag("content-warning"); cw != nullptr)
    {
        object["sensitive"] = true;
        if(cw->size() >= 2 && !(*cw)[1].empty())
        {
            object["summary"] = (*cw)[1];
        }
    }

    // Media from “imeta” tags, then bare media links in the content.
    nlohmann::json attachments = nlohmann::json::array();
    std::vector<std::string> attached;
    auto attach = [&](const std::string& url, std::string media_type)
    {
        if(url.empty() || std::find(attached.begin(), attached.end(), url) !=
           attached.end())
        {
            return;
        }
        attached.push_back(url);
        if(media_type.empty())
        {
            media_type = mediaTypeOfUrl(url);
        }
        if(!isBridgedMediaType(media_type))
        {
            result.degradations.push_back(
                {Degradation::Kind::UNSUPPORTED_MEDIA, url});
            return;
        }
        attachments.push_back({{"type", "Document"},
                               {"mediaType", media_type},
                               {"url", url}});
    };
    for(const auto& tag : event.tags)
    {
        if(tag.empty() || tag[0] != "imeta")
        {
            continue;
        }
        std::string url, media_type;
        for(size_t i = 1; i < tag.size(); i++)
        {
            if(tag[i].starts_with("url "))
            {
                url = tag[i].substr(4);
            }
            else if(tag[i].starts_with("m "))
            {
                media_type = tag[i].substr(2);
            }
        }
        attach(url, media_type);
    }
    for(auto it = std::sregex_iterator(event.content.begin(),
                                       event.content.end(), urlRegex());
        it != std::sregex_iterator(); ++it)
    {
        std::string url = it->str();
        if(!mediaTypeOfUrl(url).empty())
        {
            attach(url, "");
        }
    }
    if(!attachments.empty())
    {
        object["attachment"] = std::move(attachments);
    }
    object["cc"] = cc;

    result.value = std::move(object);
    return result;
}

nlohmann::json createActivity(const nlohmann::json& object,
                              const std::string& id)
{
    nlohmann::json create = {
        {"@context", AS_CONTEXT},
        {"id", id},
        {"type", "Create"},
        {"actor", object.value("attributedTo", "")},
        {"object", withoutContext(object)},
    };
    for(const char* key : {"published", "to", "cc"})
    {
        if(object.contains(key))
        {
            create[key] = object[key];
        }
    }
    return create;
}

E<nlohmann::json> reactionToLike(const native::Reaction& reaction,
                                 const VirtualActor& author,
                                 const std::string& object_uri,
                                 const std::string& object_actor,
                                 const URLManager& urls)
{
    const std::string& content = reaction.event.content;
    if(content == "-")
    {
        return std::unexpected(invalidInput("Dislikes are not bridged"));
    }
    nlohmann::json like = {
        {"@context", AS_CONTEXT},
        {"id", urls.activity("like", reaction.event.id)},
        {"type", "Like"},
        {"actor", author.uri},
        {"object", object_uri},
    };
    if(!object_actor.empty())
    {
        like["to"] = nlohmann::json::array({object_actor});
    }
    if(content.empty() || content == "+")
    {
        return like;
    }

    like["content"] = content;
    like["_misskey_reaction"] = content;
    for(const auto& tag : reaction.event.tags)
    {
        if(tag.size() >= 3 && tag[0] == "emoji" && ":" + tag[1] + ":" == content)
        {
            nlohmann::json emoji = {
                {"type", "Emoji"},
                {"id", tag[2]},
                {"name", content},
                {"icon", {{"type", "Image"}, {"url", tag[2]}}},
            };
            like["tag"] = nlohmann::json::array({emoji});
        }
    }
    return like;
}

nlohmann::json repostToAnnounce(const native::Repost& repost,
                                const VirtualActor& author,
                                const std::string& object_uri,
                                const std::string& object_actor,
                                const URLManager& urls)
{
    std::vector<std::string> cc{author.followers()};
    pushUnique(cc, object_actor);
    return {
        {"@context", AS_CONTEXT},
        {"id", urls.activity("announce", repost.event.id)},
        {"type", "Announce"},
        {"actor", author.uri},
        {"object", object_uri},
        {"published", http_utils::formatIsoTime(repost.event.created_at)},
        {"to", nlohmann::json::array({json_ld::PUBLIC_COLLECTION})},
        {"cc", cc},
    };
}

nlohmann::json actorDocument(const VirtualActor& actor,
                             const URLManager& urls,
                             const TextTransformInterface& transform)
{
    const std::string npub = bech32::encodeHex("npub", actor.pubkey);
    nlohmann::json doc = {
        {"@context", AS_CONTEXT},
        {"id", actor.uri},
        {"type", "Person"},
        {"preferredUsername", npub},
        {"name", actor.display_name},
        {"summary", transform.markdownToHtml(actor.summary)},
        {"url", urls.webProfile(actor.pubkey)},
        {"inbox", actor.inbox()},
        {"outbox", actor.outbox()},
        {"followers", actor.followers()},
        {"endpoints", {{"sharedInbox", urls.sharedInbox()}}},
        {"manuallyApprovesFollowers", false},
        {"discoverable", true},
        {"published", http_utils::formatIsoTime(actor.created_at)},
        {"publicKey", {
            {"id", actor.keyId()},
            {"owner", actor.uri},
            {"publicKeyPem", actor.public_key_pem},
        }},
    };
    if(!actor.avatar.empty())
    {
        doc["icon"] = {{"type", "Image"}, {"url", actor.avatar}};
    }
    return doc;
}

nlohmann::json systemActorDocument(const std::string& public_key_pem,
                                   const URLManager& urls)
{
    return {
        {"@context", AS_CONTEXT},
        {"id", urls.systemActor()},
        {"type", "Application"},
        {"preferredUsername", urls.domain()},
        {"inbox", urls.sharedInbox()},
        {"manuallyApprovesFollowers", true},
        {"publicKey", {
            {"id", urls.systemActorKeyId()},
            {"owner", urls.systemActor()},
            {"publicKeyPem", public_key_pem},
        }},
    };
}

nlohmann::json updateActivity(const std::string& id,
                              const VirtualActor& actor,
                              const nlohmann::json& object)
{
    return {
        {"@context", AS_CONTEXT},
        {"id", id},
        {"type", "Update"},
        {"actor", actor.uri},
        {"object", withoutContext(object)},
        {"to", nlohmann::json::array({json_ld::PUBLIC_COLLECTION})},
        {"cc", nlohmann::json::array({actor.followers()})},
    };
}

nlohmann::json followActivity(const std::string& id,
                              const std::string& actor_uri,
                              const std::string& target_uri)
{
    return {
        {"@context", AS_CONTEXT},
        {"id", id},
        {"type", "Follow"},
        {"actor", actor_uri},
        {"object", target_uri},
    };
}

nlohmann::json undoActivity(const std::string& id,
                            const std::string& actor_uri,
                            const nlohmann::json& inner)
{
    return {
        {"@context", AS_CONTEXT},
        {"id", id},
        {"type", "Undo"},
        {"actor", actor_uri},
        {"object", withoutContext(inner)},
    };
}

nlohmann::json acceptActivity(const std::string& id,
                              const std::string& actor_uri,
                              const nlohmann::json& follow)
{
    return {
        {"@context", AS_CONTEXT},
        {"id", id},
        {"type", "Accept"},
        {"actor", actor_uri},
        {"object", withoutContext(follow)},
    };
}

nlohmann::json deleteActivity(const std::string& id,
                              const VirtualActor& actor,
                              const std::string& object_uri)
{
    return {
        {"@context", AS_CONTEXT},
        {"id", id},
        {"type", "Delete"},
        {"actor", actor.uri},
        {"object", {{"id", object_uri}, {"type", "Tombstone"}}},
        {"to", nlohmann::json::array({json_ld::PUBLIC_COLLECTION})},
        {"cc", nlohmann::json::array({actor.followers()})},
    };
}

E<Translated<NativeEvent>>
objectToNote(const nlohmann::json& object, const InboundNoteContext& ctx,
             const TextTransformInterface& transform)
{
    if(!object.is_object())
    {
        return std::unexpected(invalidInput("Object is not embedded"));
    }
    std::string object_id = json_ld::getString(object, "id");
    if(object_id.empty())
    {
        return std::unexpected(invalidInput("Object has no id"));
    }
    if(!json_ld::hasType(object, "Note") && !json_ld::hasType(object, "Article") &&
       !json_ld::hasType(object, "Page") && !json_ld::hasType(object, "Question"))
    {
        return std::unexpected(invalidInput(
            "Unsupported object type: " + json_ld::firstType(object)));
    }
    if(!json_ld::isPublic(object))
    {
        return std::unexpected(invalidInput(
            std::format("Object {} is not public", object_id)));
    }

    Translated<NativeEvent> result;
    NativeEvent& event = result.value;
    event.pubkey = ctx.author_pubkey;
    event.kind = kind::TEXT_NOTE;
    event.created_at = publishedOf(object).value_or(ctx.now);
    std::vector<Tag>& tags = event.tags;

    // Thread
    std::string in_reply_to = json_ld::getId(object, "inReplyTo");
    if(!in_reply_to.empty())
    {
        if(ctx.parent.has_value())
        {
            const NativeEvent& parent = *ctx.parent;
            std::optional<std::string> root;
            for(const auto& tag : parent.tags)
            {
                if(tag.size() >= 4 && tag[0] == "e" && tag[3] == "root")
                {
                    root = tag[1];
                }
            }
            if(root.has_value())
            {
                tags.push_back({"e", *root, "", "root"});
                tags.push_back({"e", parent.id, "", "reply"});
            }
            else
            {
                tags.push_back({"e", parent.id, "", "root"});
            }
            for(const auto& pubkey : parent.tagValues("p"))
            {
                if(pubkey != ctx.author_pubkey)
                {
                    pushUnique(tags, Tag{"p", pubkey});
                }
            }
            if(!parent.pubkey.empty() && parent.pubkey != ctx.author_pubkey)
            {
                pushUnique(tags, Tag{"p", parent.pubkey});
            }
        }
        else
        {
            result.degradations.push_back(
                {Degradation::Kind::MISSING_PARENT, in_reply_to});
        }
    }

    // Content
    std::string content;
    if(object.contains("source") && object["source"].is_object() &&
       json_ld::getString(object["source"], "mediaType") ==
       "text/x.misskeymarkdown")
    {
        content = json_ld::getString(object["source"], "content");
    }
    else
    {
        std::string html = json_ld::getString(object, "content");
        if(html.empty() && object.contains("contentMap") &&
           object["contentMap"].is_object() && !object["contentMap"].empty())
        {
            const auto& first = object["contentMap"].begin().value();
            if(first.is_string())
            {
                html = first.get<std::string>();
            }
        }
        content = transform.htmlToMarkdown(html);
    }
    if(json_ld::hasType(object, "Article"))
    {
        std::string title = json_ld::getString(object, "name");
        if(!title.empty())
        {
            content = title + "\n\n" + content;
        }
    }

    std::string summary = json_ld::getString(object, "summary");
    if(!summary.empty())
    {
        tags.push_back({"content-warning", summary});
    }
    else if(object.contains("sensitive") && object["sensitive"].is_boolean() &&
            object["sensitive"].get<bool>())
    {
        tags.push_back({"content-warning"});
    }

    // Mentions, hashtags and custom emoji
    if(object.contains("tag") && object["tag"].is_array())
    {
        for(const auto& t : object["tag"])
        {
            if(json_ld::hasType(t, "Mention"))
            {
                auto key = ctx.mention_keys.find(json_ld::getString(t, "href"));
                if(key == ctx.mention_keys.end())
                {
                    continue;
                }
                pushUnique(tags, Tag{"p", key->second});
                std::string marker =
                    "nostr:" + bech32::encodeHex("npub", key->second);
                std::string name = json_ld::getString(t, "name");
                if(name.empty())
                {
                    continue;
                }
                if(!name.starts_with('@'))
                {
                    name = "@" + name;
                }
                content = replaceWord(content, name, marker);
                size_t domain_at = name.find('@', 1);
                if(domain_at != std::string::npos)
                {
                    content = replaceWord(content, name.substr(0, domain_at),
                                          marker);
                }
            }
            else if(json_ld::hasType(t, "Hashtag"))
            {
                std::string name = json_ld::getString(t, "name");
                if(name.starts_with('#'))
                {
                    name.erase(0, 1);
                }
                if(!name.empty())
                {
                    pushUnique(tags, Tag{"t", name});
                }
            }
            else if(json_ld::hasType(t, "Emoji"))
            {
                std::string name = json_ld::getString(t, "name");
                std::string url = urlOf(t, "icon");
                while(name.starts_with(':'))
                {
                    name.erase(0, 1);
                }
                while(name.ends_with(':'))
                {
                    name.pop_back();
                }
                if(!name.empty() && !url.empty())
                {
                    pushUnique(tags, Tag{"emoji", name, url});
                }
            }
        }
    }

    // Attachments
    if(object.contains("attachment"))
    {
        nlohmann::json attachments = object["attachment"];
        if(!attachments.is_array())
        {
            attachments = nlohmann::json::array({attachments});
        }
        for(const auto& a : attachments)
        {
            std::string url = a.is_string() ? a.get<std::string>()
                                            : urlOf(a, "url");
            if(url.empty())
            {
                continue;
            }
            std::string media_type = json_ld::getString(a, "mediaType");
            if(content.find(url) == std::string::npos)
            {
                appendLine(content, url);
            }
            if(!media_type.empty() && !isBridgedMediaType(media_type))
            {
                result.degradations.push_back(
                    {Degradation::Kind::UNSUPPORTED_MEDIA, url});
                continue;
            }
            Tag imeta{"imeta", "url " + url};
            if(!media_type.empty())
            {
                imeta.push_back("m " + media_type);
            }
            pushUnique(tags, std::move(imeta));
        }
    }

    // Quote
    std::string quote_url = json_ld::getString(object, "quoteUrl");
    if(quote_url.empty())
    {
        quote_url = json_ld::getString(object, "_misskey_quote");
    }
    if(quote_url.empty())
    {
        quote_url = json_ld::getString(object, "quoteUri");
    }
    if(!quote_url.empty())
    {
        if(ctx.quoted.has_value())
        {
            pushUnique(tags, Tag{"q", ctx.quoted->id});
            pushUnique(tags, Tag{"p", ctx.quoted->pubkey});
            appendLine(content, "nostr:" +
                       bech32::encodeHex("note", ctx.quoted->id));
        }
        else
        {
            result.degradations.push_back(
                {Degradation::Kind::MISSING_QUOTE, quote_url});
            if(content.find(quote_url) == std::string::npos)
            {
                appendLine(content, quote_url);
            }
        }
    }

    if(content.empty())
    {
        return std::unexpected(invalidInput(
            std::format("Object {} has no content", object_id)));
    }
    event.content = std::move(content);
    addProxyTags(tags, object_id, ctx.label_namespace);
    return result;
}

NativeEvent likeToReaction(const activity::Like& like,
                           const std::string& author_pubkey,
                           const NativeEvent& target,
                           const std::string& label_namespace, int64_t now)
{
    NativeEvent event;
    event.pubkey = author_pubkey;
    event.kind = kind::REACTION;
    event.created_at = now;
    event.content = like.content.empty() ? "+" : like.content;
    event.tags = {{"e", target.id}, {"p", target.pubkey}};
    if(!like.emoji_url.empty() && like.content.size() > 2 &&
       like.content.starts_with(':') && like.content.ends_with(':'))
    {
        event.tags.push_back(
            {"emoji", like.content.substr(1, like.content.size() - 2),
             like.emoji_url});
    }
    addProxyTags(event.tags, like.id, label_namespace);
    return event;
}

NativeEvent announceToRepost(const activity::Announce& announce,
                             const std::string& author_pubkey,
                             const NativeEvent& target,
                             const std::string& label_namespace,
                             int64_t now)
{
    NativeEvent event;
    event.pubkey = author_pubkey;
    event.kind = kind::REPOST;
    event.created_at = announce.published.value_or(now);
    event.content = target.toJson().dump();
    event.tags = {{"e", target.id, ""}, {"p", target.pubkey}};
    addProxyTags(event.tags, announce.id, label_namespace);
    return event;
}

NativeEvent deletionEvent(const std::string& ap_id,
                          const std::string& author_pubkey,
                          const std::vector<std::string>& event_ids,
                          const std::string& label_namespace, int64_t now)
{
    NativeEvent event;
    event.pubkey = author_pubkey;
    event.kind = kind::DELETION;
    event.created_at = now;
    for(const auto& id : event_ids)
    {
        event.tags.push_back({"e", id});
    }
    addProxyTags(event.tags, ap_id, label_namespace);
    return event;
}

NativeEvent profileToMetadata(const RemoteActor& actor,
                              const std::string& author_pubkey,
                              const std::string& label_namespace,
                              int64_t now,
                              const TextTransformInterface& transform)
{
    nlohmann::json content = {
        {"name", actor.name.empty() ? actor.preferred_username : actor.name},
        {"about", transform.htmlToMarkdown(actor.summary)},
    };
    if(!actor.icon.empty())
    {
        content["picture"] = actor.icon;
    }
    if(!actor.url.empty())
    {
        content["website"] = actor.url;
    }

    NativeEvent event;
    event.pubkey = author_pubkey;
    event.kind = kind::METADATA;
    event.created_at = now;
    event.content = content.dump(-1, ' ', false,
                                 nlohmann::json::error_handler_t::replace);
    addProxyTags(event.tags, actor.uri, label_namespace);
    return event;
}

NativeEvent contactListEvent(const std::string& actor_uri,
                             const std::string& author_pubkey,
                             const std::vector<std::string>& follows,
                             const std::string& label_namespace,
                             int64_t now)
{
    NativeEvent event;
    event.pubkey = author_pubkey;
    event.kind = kind::CONTACT_LIST;
    event.created_at = now;
    for(const auto& pubkey : follows)
    {
        event.tags.push_back({"p", pubkey});
    }
    addProxyTags(event.tags, actor_uri, label_namespace);
    return event;
}

E<RemoteActor> remoteActorFromJson(const nlohmann::json& doc,
                                   int64_t fetched_at)
{
    if(!doc.is_object())
    {
        return std::unexpected(invalidInput("Actor document is not an object"));
    }
    RemoteActor actor;
    actor.uri = json_ld::getString(doc, "id");
    actor.preferred_username = json_ld::getString(doc, "preferredUsername");
    actor.name = json_ld::getString(doc, "name");
    actor.summary = json_ld::getString(doc, "summary");
    actor.icon = urlOf(doc, "icon");
    actor.url = urlOf(doc, "url");
    actor.inbox = json_ld::getString(doc, "inbox");
    actor.followers = json_ld::getId(doc, "followers");
    if(doc.contains("endpoints") && doc["endpoints"].is_object())
    {
        actor.shared_inbox = json_ld::getString(doc["endpoints"], "sharedInbox");
    }
    actor.fetched_at = fetched_at;

    if(doc.contains("publicKey"))
    {
        nlohmann::json keys = doc["publicKey"];
        if(!keys.is_array())
        {
            keys = nlohmann::json::array({keys});
        }
        for(const auto& key : keys)
        {
            std::string owner = json_ld::getString(key, "owner");
            if(!owner.empty() && owner != actor.uri)
            {
                continue;
            }
            actor.key_id = json_ld::getString(key, "id");
            actor.public_key_pem = json_ld::getString(key, "publicKeyPem");
            break;
        }
    }
    if(actor.uri.empty() || actor.inbox.empty() || actor.public_key_pem.empty())
    {
        return std::unexpected(invalidInput(
            "Actor document lacks an id, an inbox or a public key"));
    }
    return actor;
}

void addProxyTags(std::vector<Tag>& tags, const std::string& ap_id,
                  const std::string& label_namespace)
{
    tags.push_back({"proxy", ap_id, "activitypub"});
    tags.push_back({"L", label_namespace});
    tags.push_back({"l", label_namespace + ".activitypub:" + ap_id,
                    label_namespace});
}
