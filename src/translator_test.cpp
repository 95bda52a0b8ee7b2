#include <algorithm>
#include <variant>

#include <gtest/gtest.h>

#include "bech32.hpp"
#include "json_ld.hpp"
#include "test_utils.hpp"
#include "translator.hpp"

namespace
{

const std::string AUTHOR =
    "3bf0c63fcb93463407af97a5e5ee64fa883d107ef9e558472c4eb9aaaefa459d";
const std::string MENTIONED =
    "7e7e9c42a91bfef19fa929e5fda1b72e0ebc1a4c1141673e2794234d86addf4e";
// Derived key of the remote author of the parent post.
const std::string PARENT_AUTHOR =
    "82341f882b6eabcd2ba7f1ef90aad961cf074af15b9ef44a09f9d2a8fbfbe6a2";
const std::string PARENT_ID =
    "d7dd5eb3ab747e16f8d0212d53032ea2a7cadef53837e5a6c66d42849fcb9027";
const std::string ALICE = "https://remote.example/users/alice";
const std::string NS = "example.bridge";

std::vector<std::string> sorted(std::vector<std::string> v)
{
    std::sort(v.begin(), v.end());
    return v;
}

bool hasTag(const NativeEvent& e, const Tag& tag)
{
    return std::find(e.tags.begin(), e.tags.end(), tag) != e.tags.end();
}

} // namespace

class TranslatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config.server_url_root = "https://bridge.example";
        urls = std::make_unique<URLManager>(config);
        author.pubkey = AUTHOR;
        author.uri = urls->actor(AUTHOR);
        author.display_name = "Author";
        author.summary = "Hello there";
        author.avatar = "https://img.example/a.png";
        author.public_key_pem = "PEM";
        author.created_at = 1600000000;
    }

    native::Note classifyAsNote(const NativeEvent& e)
    {
        auto content = classifyEvent(e);
        EXPECT_TRUE(content.has_value());
        EXPECT_TRUE(std::holds_alternative<native::Note>(*content));
        return std::get<native::Note>(*content);
    }

    nlohmann::json publicNote(const std::string& id, const std::string& html)
    {
        return {
            {"id", id},
            {"type", "Note"},
            {"attributedTo", ALICE},
            {"content", html},
            {"published", "2023-11-14T22:13:20Z"},
            {"to", nlohmann::json::array({json_ld::PUBLIC_COLLECTION})},
        };
    }

    Config config;
    std::unique_ptr<URLManager> urls;
    VirtualActor author;
    GumboTextTransform transform;
};

TEST_F(TranslatorTest, NoteSurvivesRoundTrip)
{
    const std::string mentioned_npub = bech32::encodeHex("npub", MENTIONED);
    NativeEvent original;
    original.pubkey = AUTHOR;
    original.kind = kind::TEXT_NOTE;
    original.created_at = 1700000000;
    original.content = "Hello nostr:" + mentioned_npub + " how are you?";
    original.tags = {{"e", PARENT_ID, "", "root"},
                     {"p", PARENT_AUTHOR},
                     {"p", MENTIONED}};
    original.id = original.computeId();
    native::Note note = classifyAsNote(original);

    OutboundNoteContext out_ctx;
    out_ctx.parent_object = "https://remote.example/notes/1";
    out_ctx.parent_actor = ALICE;
    out_ctx.mentions[MENTIONED] = {urls->actor(MENTIONED),
                                   mentioned_npub + "@bridge.example"};
    out_ctx.mentions[PARENT_AUTHOR] = {ALICE, "alice@remote.example"};
    auto object = noteToObject(note, author, out_ctx, *urls, transform);
    EXPECT_TRUE(object.degradations.empty());
    EXPECT_EQ(object.value["id"], urls->note(original.id));
    EXPECT_EQ(object.value["attributedTo"], author.uri);
    EXPECT_EQ(object.value["inReplyTo"], "https://remote.example/notes/1");
    EXPECT_EQ(object.value["published"], "2023-11-14T22:13:20Z");
    auto cc = object.value["cc"].get<std::vector<std::string>>();
    EXPECT_EQ(sorted(cc), sorted({author.followers(), urls->actor(MENTIONED),
                                  ALICE}));

    nlohmann::json create = createActivity(object.value, "https://bridge.example/c/1");
    EXPECT_EQ(create["type"], "Create");
    EXPECT_EQ(create["actor"], author.uri);
    EXPECT_FALSE(create["object"].contains("@context"));

    NativeEvent parent;
    parent.id = PARENT_ID;
    parent.pubkey = PARENT_AUTHOR;
    InboundNoteContext in_ctx;
    in_ctx.author_pubkey = AUTHOR;
    in_ctx.parent = parent;
    in_ctx.mention_keys[urls->actor(MENTIONED)] = MENTIONED;
    in_ctx.mention_keys[ALICE] = PARENT_AUTHOR;
    in_ctx.label_namespace = NS;
    ASSIGN_OR_FAIL(auto back, objectToNote(create["object"], in_ctx, transform));
    EXPECT_TRUE(back.degradations.empty());

    native::Note again = classifyAsNote(back.value);
    EXPECT_EQ(again.event.pubkey, original.pubkey);
    EXPECT_EQ(again.event.content, original.content);
    EXPECT_EQ(again.event.created_at, original.created_at);
    EXPECT_EQ(again.reply_to, note.reply_to);
    EXPECT_EQ(sorted(again.mentions), sorted(note.mentions));
}

TEST_F(TranslatorTest, UnresolvableParentBecomesTopLevelPost)
{
    nlohmann::json object = publicNote("https://remote.example/notes/2",
                                       "<p>A reply</p>");
    object["inReplyTo"] = "https://gone.example/notes/404";
    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    ctx.label_namespace = NS;

    ASSIGN_OR_FAIL(auto result, objectToNote(object, ctx, transform));
    EXPECT_EQ(result.value.content, "A reply");
    EXPECT_TRUE(result.value.tagValues("e").empty());
    ASSERT_EQ(result.degradations.size(), 1);
    EXPECT_EQ(result.degradations[0].kind, Degradation::Kind::MISSING_PARENT);
    EXPECT_EQ(result.degradations[0].detail, "https://gone.example/notes/404");
}

TEST_F(TranslatorTest, ReplyToThreadKeepsRoot)
{
    NativeEvent parent;
    parent.id = PARENT_ID;
    parent.pubkey = PARENT_AUTHOR;
    parent.tags = {{"e", "root-id", "", "root"}, {"p", MENTIONED}};

    nlohmann::json object = publicNote("https://remote.example/notes/3",
                                       "<p>Deep reply</p>");
    object["inReplyTo"] = "https://remote.example/notes/1";
    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    ctx.parent = parent;
    ctx.label_namespace = NS;

    ASSIGN_OR_FAIL(auto result, objectToNote(object, ctx, transform));
    EXPECT_TRUE(hasTag(result.value, {"e", "root-id", "", "root"}));
    EXPECT_TRUE(hasTag(result.value, {"e", PARENT_ID, "", "reply"}));
    EXPECT_TRUE(hasTag(result.value, {"p", MENTIONED}));
    EXPECT_TRUE(hasTag(result.value, {"p", PARENT_AUTHOR}));
}

TEST_F(TranslatorTest, UnresolvableMentionsAreDropped)
{
    nlohmann::json object = publicNote(
        "https://remote.example/notes/4",
        "<p><span class=\"h-card\"><a href=\"https://x.example/@carol\" "
        "class=\"u-url mention\">@<span>carol</span></a></span> hi "
        "<span class=\"h-card\"><a href=\"https://x.example/@dave\" "
        "class=\"u-url mention\">@<span>dave</span></a></span></p>");
    object["tag"] = {
        {{"type", "Mention"}, {"href", "https://x.example/users/carol"},
         {"name", "@carol@x.example"}},
        {{"type", "Mention"}, {"href", "https://x.example/users/dave"},
         {"name", "@dave@x.example"}},
    };
    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    ctx.label_namespace = NS;
    ctx.mention_keys["https://x.example/users/dave"] = MENTIONED;

    ASSIGN_OR_FAIL(auto result, objectToNote(object, ctx, transform));
    EXPECT_EQ(result.value.content,
              "@carol hi nostr:" + bech32::encodeHex("npub", MENTIONED));
    EXPECT_EQ(result.value.tagValues("p"), std::vector<std::string>{MENTIONED});
    EXPECT_TRUE(result.degradations.empty());
}

TEST_F(TranslatorTest, UnsupportedMediaPassesThroughAsLinks)
{
    nlohmann::json object = publicNote("https://remote.example/notes/5",
                                       "<p>Files</p>");
    object["attachment"] = {
        {{"type", "Document"}, {"mediaType", "image/png"},
         {"url", "https://files.example/a.png"}},
        {{"type", "Document"}, {"mediaType", "application/pdf"},
         {"url", "https://files.example/b.pdf"}},
    };
    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    ctx.label_namespace = NS;

    ASSIGN_OR_FAIL(auto result, objectToNote(object, ctx, transform));
    EXPECT_EQ(result.value.content,
              "Files\nhttps://files.example/a.png\nhttps://files.example/b.pdf");
    EXPECT_TRUE(hasTag(result.value,
                       {"imeta", "url https://files.example/a.png", "m image/png"}));
    EXPECT_EQ(result.value.tagValues("imeta").size(), 1);
    ASSERT_EQ(result.degradations.size(), 1);
    EXPECT_EQ(result.degradations[0].kind, Degradation::Kind::UNSUPPORTED_MEDIA);

    // Outbound, the same rule applies to imeta tags.
    NativeEvent e;
    e.pubkey = AUTHOR;
    e.kind = kind::TEXT_NOTE;
    e.content = "Look https://files.example/c.jpg and https://files.example/d.zip";
    e.tags = {{"imeta", "url https://files.example/d.zip", "m application/zip"}};
    e.id = e.computeId();
    auto out = noteToObject(classifyAsNote(e), author, {}, *urls, transform);
    ASSERT_EQ(out.value["attachment"].size(), 1);
    EXPECT_EQ(out.value["attachment"][0]["url"], "https://files.example/c.jpg");
    EXPECT_EQ(out.value["attachment"][0]["mediaType"], "image/jpeg");
    ASSERT_EQ(out.degradations.size(), 1);
    EXPECT_EQ(out.degradations[0].detail, "https://files.example/d.zip");
}

TEST_F(TranslatorTest, OutboundReplyToUnknownParentIsTopLevel)
{
    NativeEvent e;
    e.pubkey = AUTHOR;
    e.kind = kind::TEXT_NOTE;
    e.content = "reply";
    e.tags = {{"e", PARENT_ID}};
    e.id = e.computeId();
    auto out = noteToObject(classifyAsNote(e), author, {}, *urls, transform);
    EXPECT_FALSE(out.value.contains("inReplyTo"));
    ASSERT_EQ(out.degradations.size(), 1);
    EXPECT_EQ(out.degradations[0].kind, Degradation::Kind::MISSING_PARENT);
}

TEST_F(TranslatorTest, ContentWarningsAndTags)
{
    NativeEvent e;
    e.pubkey = AUTHOR;
    e.kind = kind::TEXT_NOTE;
    e.content = "spoiler :wave:";
    e.tags = {{"content-warning", "movie"}, {"t", "film"},
              {"emoji", "wave", "https://img.example/wave.png"}};
    e.id = e.computeId();
    auto out = noteToObject(classifyAsNote(e), author, {}, *urls, transform);
    EXPECT_EQ(out.value["sensitive"], true);
    EXPECT_EQ(out.value["summary"], "movie");
    ASSERT_EQ(out.value["tag"].size(), 2);
    EXPECT_EQ(out.value["tag"][0]["name"], "#film");
    EXPECT_EQ(out.value["tag"][1]["name"], ":wave:");

    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    ctx.label_namespace = NS;
    ASSIGN_OR_FAIL(auto back, objectToNote(out.value, ctx, transform));
    EXPECT_TRUE(hasTag(back.value, {"content-warning", "movie"}));
    EXPECT_TRUE(hasTag(back.value, {"t", "film"}));
    EXPECT_TRUE(hasTag(back.value, {"emoji", "wave", "https://img.example/wave.png"}));
}

TEST_F(TranslatorTest, InboundNotesCarryProxyAndLabelTags)
{
    const std::string id = "https://remote.example/notes/6";
    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    ctx.label_namespace = NS;
    ASSIGN_OR_FAIL(auto result,
                   objectToNote(publicNote(id, "<p>x</p>"), ctx, transform));
    EXPECT_TRUE(hasTag(result.value, {"proxy", id, "activitypub"}));
    EXPECT_TRUE(hasTag(result.value, {"L", NS}));
    EXPECT_TRUE(hasTag(result.value, {"l", NS + ".activitypub:" + id, NS}));
    EXPECT_TRUE(result.value.isFromFederation());
    EXPECT_EQ(result.value.created_at, 1700000000);
}

TEST_F(TranslatorTest, NonPublicNotesAreRejected)
{
    nlohmann::json object = publicNote("https://remote.example/notes/7", "<p>x</p>");
    object["to"] = {"https://remote.example/users/alice/followers"};
    InboundNoteContext ctx;
    ctx.author_pubkey = AUTHOR;
    auto result = objectToNote(object, ctx, transform);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::INVALID_INPUT);
}

TEST_F(TranslatorTest, LikesAndReactions)
{
    NativeEvent target;
    target.id = PARENT_ID;
    target.pubkey = PARENT_AUTHOR;

    activity::Like like{"https://remote.example/likes/1", ALICE, "obj", "", ""};
    NativeEvent plain = likeToReaction(like, AUTHOR, target, NS, 10);
    EXPECT_EQ(plain.kind, kind::REACTION);
    EXPECT_EQ(plain.content, "+");
    EXPECT_TRUE(hasTag(plain, {"e", PARENT_ID}));
    EXPECT_TRUE(hasTag(plain, {"p", PARENT_AUTHOR}));

    like.content = ":blobcat:";
    like.emoji_url = "https://img.example/blobcat.png";
    NativeEvent custom = likeToReaction(like, AUTHOR, target, NS, 10);
    EXPECT_EQ(custom.content, ":blobcat:");
    EXPECT_TRUE(hasTag(custom, {"emoji", "blobcat", "https://img.example/blobcat.png"}));

    NativeEvent reaction;
    reaction.pubkey = AUTHOR;
    reaction.kind = kind::REACTION;
    reaction.content = "+";
    reaction.tags = {{"e", PARENT_ID}, {"p", PARENT_AUTHOR}};
    reaction.id = reaction.computeId();
    ASSIGN_OR_FAIL(NativeContent content, classifyEvent(reaction));
    auto r = std::get<native::Reaction>(content);
    EXPECT_EQ(r.target_id, PARENT_ID);
    EXPECT_EQ(r.target_author, PARENT_AUTHOR);
    ASSIGN_OR_FAIL(nlohmann::json out,
                   reactionToLike(r, author, "https://remote.example/notes/1",
                                  ALICE, *urls));
    EXPECT_EQ(out["type"], "Like");
    EXPECT_EQ(out["object"], "https://remote.example/notes/1");
    EXPECT_FALSE(out.contains("content"));

    r.event.content = "🤙";
    ASSIGN_OR_FAIL(nlohmann::json emoji,
                   reactionToLike(r, author, "o", ALICE, *urls));
    EXPECT_EQ(emoji["content"], "🤙");

    r.event.content = "-";
    EXPECT_FALSE(reactionToLike(r, author, "o", ALICE, *urls).has_value());
}

TEST_F(TranslatorTest, AnnouncesAndReposts)
{
    NativeEvent target;
    target.id = PARENT_ID;
    target.pubkey = PARENT_AUTHOR;
    target.kind = kind::TEXT_NOTE;
    target.content = "original";

    activity::Announce announce{"https://remote.example/boosts/1", ALICE, "obj",
                                1700000000, true};
    NativeEvent repost = announceToRepost(announce, AUTHOR, target, NS, 10);
    EXPECT_EQ(repost.kind, kind::REPOST);
    EXPECT_EQ(repost.created_at, 1700000000);
    EXPECT_EQ(repost.tagValues("e"), std::vector<std::string>{PARENT_ID});
    EXPECT_EQ(nlohmann::json::parse(repost.content)["content"], "original");

    repost.id = repost.computeId();
    ASSIGN_OR_FAIL(NativeContent content, classifyEvent(repost));
    auto out = repostToAnnounce(std::get<native::Repost>(content), author,
                                "https://remote.example/notes/1", ALICE, *urls);
    EXPECT_EQ(out["type"], "Announce");
    EXPECT_EQ(out["object"], "https://remote.example/notes/1");
    EXPECT_EQ(out["id"], urls->activity("announce", repost.id));
}

TEST_F(TranslatorTest, DeletionsAndContactLists)
{
    NativeEvent del = deletionEvent("https://remote.example/notes/1", AUTHOR,
                                    {"a", "b"}, NS, 10);
    EXPECT_EQ(del.kind, kind::DELETION);
    EXPECT_EQ(del.tagValues("e"), (std::vector<std::string>{"a", "b"}));

    del.id = del.computeId();
    ASSIGN_OR_FAIL(NativeContent content, classifyEvent(del));
    EXPECT_EQ(std::get<native::Deletion>(content).event_ids,
              (std::vector<std::string>{"a", "b"}));

    NativeEvent list;
    list.pubkey = AUTHOR;
    list.kind = kind::CONTACT_LIST;
    list.tags = {{"p", MENTIONED}, {"p", "not a key"}, {"p", MENTIONED},
                 {"p", PARENT_AUTHOR}};
    ASSIGN_OR_FAIL(NativeContent follows, classifyEvent(list));
    EXPECT_EQ(std::get<native::ContactList>(follows).follows,
              (std::vector<std::string>{MENTIONED, PARENT_AUTHOR}));

    NativeEvent event = contactListEvent(ALICE, AUTHOR, {MENTIONED}, NS, 10);
    EXPECT_EQ(event.kind, kind::CONTACT_LIST);
    EXPECT_TRUE(hasTag(event, {"p", MENTIONED}));
    EXPECT_TRUE(event.isFromFederation());
}

TEST_F(TranslatorTest, ProfilesMapBothWays)
{
    NativeEvent metadata;
    metadata.pubkey = AUTHOR;
    metadata.kind = kind::METADATA;
    metadata.created_at = 5;
    metadata.content = R"({"name":"n","display_name":"Display","about":"Bio","picture":"https://img.example/p.png"})";
    ASSIGN_OR_FAIL(NativeContent content, classifyEvent(metadata));
    const ProfileUpdate& profile = std::get<native::Metadata>(content).profile;
    EXPECT_EQ(profile, (ProfileUpdate{"Display", "Bio", "https://img.example/p.png", 5}));

    metadata.content = "not json";
    EXPECT_FALSE(classifyEvent(metadata).has_value());

    nlohmann::json person = actorDocument(author, *urls, transform);
    EXPECT_EQ(person["type"], "Person");
    EXPECT_EQ(person["id"], author.uri);
    EXPECT_EQ(person["name"], "Author");
    EXPECT_EQ(person["summary"], "<p>Hello there</p>");
    EXPECT_EQ(person["icon"]["url"], author.avatar);
    EXPECT_EQ(person["publicKey"]["id"], author.keyId());
    EXPECT_EQ(person["endpoints"]["sharedInbox"], urls->sharedInbox());
    EXPECT_EQ(person["url"], urls->webProfile(AUTHOR));

    ASSIGN_OR_FAIL(RemoteActor remote, remoteActorFromJson(person, 7));
    EXPECT_EQ(remote.uri, author.uri);
    EXPECT_EQ(remote.icon, author.avatar);
    EXPECT_EQ(remote.deliveryInbox(), urls->sharedInbox());
    EXPECT_EQ(remote.public_key_pem, "PEM");

    NativeEvent mirrored = profileToMetadata(remote, PARENT_AUTHOR, NS, 9, transform);
    EXPECT_EQ(mirrored.kind, kind::METADATA);
    auto mirrored_content = nlohmann::json::parse(mirrored.content);
    EXPECT_EQ(mirrored_content["name"], "Author");
    EXPECT_EQ(mirrored_content["about"], "Hello there");
    EXPECT_EQ(mirrored_content["picture"], author.avatar);

    person.erase("publicKey");
    EXPECT_FALSE(remoteActorFromJson(person, 7).has_value());
}

TEST_F(TranslatorTest, ParsesActivities)
{
    nlohmann::json follow = {{"id", "https://remote.example/f/1"},
                             {"type", "Follow"},
                             {"actor", ALICE},
                             {"object", author.uri}};
    ASSIGN_OR_FAIL(Activity a, parseActivity(follow));
    ASSERT_TRUE(std::holds_alternative<activity::Follow>(a));
    EXPECT_EQ(std::get<activity::Follow>(a).object_id, author.uri);
    EXPECT_EQ(activityActor(a), ALICE);
    EXPECT_EQ(activityId(a), "https://remote.example/f/1");

    nlohmann::json undo = {{"id", "https://remote.example/u/1"},
                           {"type", "Undo"},
                           {"actor", ALICE},
                           {"object", follow}};
    ASSIGN_OR_FAIL(Activity u, parseActivity(undo));
    const auto& inner = std::get<activity::Undo>(u);
    EXPECT_EQ(inner.inner_type, "Follow");
    EXPECT_EQ(inner.inner_id, "https://remote.example/f/1");
    EXPECT_EQ(inner.inner_object_id, author.uri);

    nlohmann::json like = {{"id", "https://remote.example/l/1"},
                           {"type", "Like"},
                           {"actor", {{"id", ALICE}}},
                           {"object", "https://bridge.example/notes/x"},
                           {"content", ":blobcat:"},
                           {"tag", {{{"type", "Emoji"},
                                     {"name", ":blobcat:"},
                                     {"icon", {{"url", "https://img.example/b.png"}}}}}}};
    ASSIGN_OR_FAIL(Activity l, parseActivity(like));
    EXPECT_EQ(std::get<activity::Like>(l).emoji_url, "https://img.example/b.png");
    EXPECT_EQ(activityActor(l), ALICE);

    nlohmann::json move = {{"id", "x"}, {"type", "Move"}, {"actor", ALICE},
                           {"object", ALICE}};
    auto unknown = parseActivity(move);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ErrorKind::INVALID_INPUT);

    follow.erase("actor");
    EXPECT_FALSE(parseActivity(follow).has_value());
}

TEST_F(TranslatorTest, BuildsFollowGraphActivities)
{
    nlohmann::json follow = followActivity("https://bridge.example/f", author.uri, ALICE);
    EXPECT_EQ(follow["type"], "Follow");
    nlohmann::json undo = undoActivity("https://bridge.example/u", author.uri, follow);
    EXPECT_EQ(undo["object"]["id"], "https://bridge.example/f");
    EXPECT_FALSE(undo["object"].contains("@context"));
    nlohmann::json accept = acceptActivity("https://bridge.example/a", author.uri, follow);
    EXPECT_EQ(accept["type"], "Accept");
    EXPECT_EQ(accept["object"]["type"], "Follow");
    nlohmann::json del = deleteActivity("https://bridge.example/d", author,
                                        urls->note(PARENT_ID));
    EXPECT_EQ(del["object"]["type"], "Tombstone");
    EXPECT_EQ(del["object"]["id"], urls->note(PARENT_ID));
}

TEST_F(TranslatorTest, OutboundMediaTypeIgnoresCaseInAnyPath)
{
    NativeEvent e;
    e.pubkey = AUTHOR;
    e.kind = kind::TEXT_NOTE;
    e.content = "Holiday";
    e.tags = {{"imeta", "url https://files.example/caf\xC3\xA9/Photo.JPG"}};
    e.id = e.computeId();
    auto out = noteToObject(classifyAsNote(e), author, {}, *urls, transform);
    ASSERT_EQ(out.value["attachment"].size(), 1);
    EXPECT_EQ(out.value["attachment"][0]["mediaType"], "image/jpeg");
    EXPECT_TRUE(out.degradations.empty());
}
