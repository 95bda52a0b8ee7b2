#include <gtest/gtest.h>
#include <mw/crypto.hpp>

#include "native_event.hpp"
#include "schnorr.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

namespace
{

const std::string SECRET =
    "67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa";

NativeEvent makeNote()
{
    NativeEvent e;
    e.created_at = 1700000000;
    e.kind = kind::TEXT_NOTE;
    e.content = "hello \"world\"\nsecond line";
    e.tags = {{"t", "cpp"}, {"p", std::string(64, 'a')}};
    return e;
}

} // namespace

TEST(NativeEventTest, IdIsHashOfCanonicalForm)
{
    NativeEvent e;
    e.pubkey = std::string(64, '0');
    e.created_at = 0;
    e.kind = 1;
    e.content = "";
    // sha256 of [0,"000…000",0,1,[],""]
    std::string expected_serial =
        "[0,\"" + std::string(64, '0') + "\",0,1,[],\"\"]";
    auto hash = mw::SHA256Hasher().hashToBytes(expected_serial);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(e.computeId(), hexEncode(*hash));
}

TEST(NativeEventTest, SignAndVerify)
{
    NativeEvent e = makeNote();
    auto res = e.sign(SECRET);
    ASSERT_TRUE(res.has_value()) << errorMsg(res.error());
    EXPECT_EQ(e.pubkey,
              "7e7e9c42a91bfef19fa929e5fda1b72e0ebc1a4c1141673e2794234d86addf4e");
    EXPECT_TRUE(e.verify());

    NativeEvent tampered = e;
    tampered.content = "something else";
    EXPECT_FALSE(tampered.verify());
}

TEST(NativeEventTest, JsonRoundTrip)
{
    NativeEvent e = makeNote();
    ASSERT_TRUE(e.sign(SECRET).has_value());
    ASSIGN_OR_FAIL(NativeEvent back, NativeEvent::fromJson(e.toJson()));
    EXPECT_EQ(back, e);
    EXPECT_TRUE(back.verify());
}

TEST(NativeEventTest, FromJsonRejectsGarbage)
{
    EXPECT_FALSE(NativeEvent::fromJson(nlohmann::json::array()).has_value());
    EXPECT_FALSE(NativeEvent::fromJson({{"id", 1}}).has_value());
}

TEST(NativeEventTest, Tags)
{
    NativeEvent e = makeNote();
    e.tags.push_back({"e", "abc", "", "root"});
    e.tags.push_back({"e", "def", "", "reply"});
    EXPECT_EQ(e.tagValues("e"), (std::vector<std::string>{"abc", "def"}));
    ASSERT_NE(e.findTag("t"), nullptr);
    EXPECT_EQ((*e.findTag("t"))[1], "cpp");
    EXPECT_EQ(e.findTag("q"), nullptr);

    EXPECT_FALSE(e.isFromFederation());
    e.tags.push_back({"proxy", "https://a.example/notes/1", "activitypub"});
    EXPECT_TRUE(e.isFromFederation());
}

TEST(NativeEventTest, FilterMatches)
{
    NativeEvent e = makeNote();
    e.pubkey = std::string(64, 'b');

    Filter f;
    EXPECT_TRUE(f.matches(e));
    f.kinds = {kind::TEXT_NOTE, kind::REACTION};
    f.authors = {std::string(64, 'b')};
    f.since = 1600000000;
    EXPECT_TRUE(f.matches(e));

    f.tags['t'] = {"rust"};
    EXPECT_FALSE(f.matches(e));
    f.tags['t'] = {"rust", "cpp"};
    EXPECT_TRUE(f.matches(e));

    f.until = 1600000001;
    EXPECT_FALSE(f.matches(e));
}

TEST(NativeEventTest, FilterJson)
{
    Filter f;
    f.kinds = {1, 7};
    f.tags['p'] = {"abc"};
    f.since = 10;
    f.limit = 5;
    nlohmann::json j = f.toJson();
    EXPECT_EQ(j["kinds"], nlohmann::json::array({1, 7}));
    EXPECT_EQ(j["#p"], nlohmann::json::array({"abc"}));
    EXPECT_EQ(j["since"], 10);
    EXPECT_EQ(j["limit"], 5);
    EXPECT_FALSE(j.contains("authors"));
}

TEST(NativeEventTest, ParseRelayMessages)
{
    NativeEvent e = makeNote();
    ASSERT_TRUE(e.sign(SECRET).has_value());
    nlohmann::json raw = nlohmann::json::array({"EVENT", "sub1", e.toJson()});

    ASSIGN_OR_FAIL(RelayMessage msg, parseRelayMessage(raw.dump()));
    ASSERT_TRUE(std::holds_alternative<relay_msg::Event>(msg));
    EXPECT_EQ(std::get<relay_msg::Event>(msg).subscription, "sub1");
    EXPECT_EQ(std::get<relay_msg::Event>(msg).event, e);

    ASSIGN_OR_FAIL(RelayMessage ok,
                   parseRelayMessage(R"(["OK","abc",false,"blocked"])"));
    ASSERT_TRUE(std::holds_alternative<relay_msg::Ok>(ok));
    EXPECT_FALSE(std::get<relay_msg::Ok>(ok).accepted);
    EXPECT_EQ(std::get<relay_msg::Ok>(ok).message, "blocked");

    ASSIGN_OR_FAIL(RelayMessage eose, parseRelayMessage(R"(["EOSE","s"])"));
    EXPECT_TRUE(std::holds_alternative<relay_msg::Eose>(eose));

    EXPECT_FALSE(parseRelayMessage("not json").has_value());
    EXPECT_FALSE(parseRelayMessage(R"(["AUTH","x"])").has_value());
}

TEST(NativeEventTest, ClientMessages)
{
    Filter f;
    f.kinds = {1};
    EXPECT_EQ(reqMessage("s", {f}), R"(["REQ","s",{"kinds":[1]}])");
    EXPECT_EQ(closeMessage("s"), R"(["CLOSE","s"])");
}
