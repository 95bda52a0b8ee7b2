#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "dedup_index.hpp"
#include "native_event.hpp"
#include "relay_pool.hpp"
#include "relay_transport_mock.hpp"
#include "store.hpp"
#include "test_utils.hpp"

using namespace std::chrono_literals;

namespace
{

const std::string SECRET =
    "67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa";
const std::string RELAY_A = "wss://a.relay.example";
const std::string RELAY_B = "wss://b.relay.example";

NativeEvent signedNote(const std::string& content, int64_t created_at = 1700000000)
{
    NativeEvent e;
    e.created_at = created_at;
    e.kind = kind::TEXT_NOTE;
    e.content = content;
    auto res = e.sign(SECRET);
    EXPECT_TRUE(res.has_value());
    return e;
}

std::string eventFrame(const std::string& sub, const NativeEvent& e)
{
    return nlohmann::json::array({"EVENT", sub, e.toJson()}).dump();
}

} // namespace

class RelayPoolTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store = std::make_unique<Store>(":memory:");
        ASSERT_TRUE(store->init().has_value());
        dedup = std::make_unique<DedupIndex>(*store, 100, 3600);
        RelayBackoffConfig backoff;
        backoff.base_ms = 1;
        backoff.max_ms = 4;
        pool = std::make_unique<RelayPool>(io.get_executor(), transport,
                                           *dedup, backoff);
        pool->addRelay(RELAY_A);
        pool->addRelay(RELAY_B);
        pool->setEventHandler(
            [this](const std::string& relay, const NativeEvent& e)
            {
                received.push_back(e.id);
            });
    }

    void TearDown() override
    {
        pool->stop();
        runFor(5ms);
    }

    void runFor(std::chrono::milliseconds d)
    {
        io.restart();
        io.run_for(d);
    }

    boost::asio::io_context io;
    RelayTransportMock transport;
    std::unique_ptr<Store> store;
    std::unique_ptr<DedupIndex> dedup;
    std::unique_ptr<RelayPool> pool;
    std::vector<std::string> received;
};

TEST_F(RelayPoolTest, ConnectsAndSubscribesOnOpen)
{
    Filter f;
    f.kinds = {kind::TEXT_NOTE};
    pool->subscribe("main", {f});
    pool->start();
    EXPECT_EQ(pool->state(RELAY_A), RelayState::CONNECTING);
    ASSERT_EQ(transport.connectCount(RELAY_A), 1);

    transport.open(RELAY_A);
    EXPECT_EQ(pool->state(RELAY_A), RelayState::SUBSCRIBED);
    EXPECT_EQ(pool->state(RELAY_B), RelayState::CONNECTING);
    EXPECT_EQ(transport.latest(RELAY_A)->sentMessages(),
              std::vector<std::string>{reqMessage("main", {f})});
}

TEST_F(RelayPoolTest, SameEventFromTwoRelaysIsHandledOnce)
{
    pool->subscribe("main", {Filter()});
    pool->start();
    transport.open(RELAY_A);
    transport.open(RELAY_B);

    NativeEvent e = signedNote("hello");
    transport.receive(RELAY_A, eventFrame("main", e));
    transport.receive(RELAY_B, eventFrame("main", e));
    transport.receive(RELAY_A, eventFrame("main", e));
    EXPECT_EQ(received, std::vector<std::string>{e.id});
}

TEST_F(RelayPoolTest, DropsBadSignaturesAndUnknownSubscriptions)
{
    pool->subscribe("main", {Filter()});
    pool->start();
    transport.open(RELAY_A);

    NativeEvent forged = signedNote("hello");
    forged.content = "changed";
    transport.receive(RELAY_A, eventFrame("main", forged));
    transport.receive(RELAY_A, eventFrame("other", signedNote("x")));
    transport.receive(RELAY_A, "not json");
    EXPECT_TRUE(received.empty());

    // The forged id was not recorded, so the real event still goes
    // through.
    NativeEvent real = signedNote("hello");
    transport.receive(RELAY_A, eventFrame("main", real));
    EXPECT_EQ(received.size(), 1);
}

TEST_F(RelayPoolTest, ReconnectReissuesIdenticalSubscriptions)
{
    Filter notes;
    notes.kinds = {kind::TEXT_NOTE};
    notes.since = 1700000000;
    Filter follows;
    follows.kinds = {kind::CONTACT_LIST};
    follows.tags['p'] = {std::string(64, 'a')};
    pool->subscribe("notes", {notes});
    pool->subscribe("follows", {follows});
    pool->start();
    transport.open(RELAY_A);
    auto before = transport.latest(RELAY_A)->sentMessages();
    ASSERT_EQ(before.size(), 2);

    transport.drop(RELAY_A);
    EXPECT_EQ(pool->state(RELAY_A), RelayState::DISCONNECTED);
    runFor(50ms);
    ASSERT_EQ(transport.connectCount(RELAY_A), 2);
    EXPECT_EQ(pool->state(RELAY_A), RelayState::CONNECTING);

    transport.open(RELAY_A);
    EXPECT_EQ(pool->state(RELAY_A), RelayState::SUBSCRIBED);
    EXPECT_EQ(transport.latest(RELAY_A)->sentMessages(), before);
}

TEST_F(RelayPoolTest, PublishGoesOnlyToSubscribedRelays)
{
    pool->start();
    transport.open(RELAY_A);

    NativeEvent e = signedNote("out");
    auto sent_to = pool->publish(e);
    EXPECT_EQ(sent_to, std::vector<std::string>{RELAY_A});
    EXPECT_EQ(transport.latest(RELAY_A)->sentMessages(),
              std::vector<std::string>{eventMessage(e)});
    EXPECT_TRUE(transport.latest(RELAY_B)->sentMessages().empty());
}

TEST_F(RelayPoolTest, ClosedSubscriptionDegradesRelay)
{
    pool->subscribe("main", {Filter()});
    pool->start();
    transport.open(RELAY_A);

    transport.receive(RELAY_A, R"(["CLOSED","main","rate-limited: slow down"])");
    EXPECT_EQ(pool->state(RELAY_A), RelayState::DEGRADED);
    // Degraded relays do not take publishes.
    EXPECT_TRUE(pool->publish(signedNote("x")).empty());

    runFor(50ms);
    EXPECT_EQ(pool->state(RELAY_A), RelayState::SUBSCRIBED);
    auto sent = transport.latest(RELAY_A)->sentMessages();
    ASSERT_EQ(sent.size(), 2);
    EXPECT_EQ(sent[1], sent[0]);
}

TEST_F(RelayPoolTest, QueryFinishesOnEose)
{
    pool->start();
    transport.open(RELAY_A);
    transport.open(RELAY_B);

    NativeEvent older = signedNote("older", 1700000000);
    NativeEvent newer = signedNote("newer", 1700000100);
    Filter f;
    f.ids = {older.id, newer.id};

    std::optional<std::vector<NativeEvent>> result;
    pool->query({f}, 10s, [&](std::vector<NativeEvent> events)
    {
        result = std::move(events);
    });
    auto req = transport.latest(RELAY_A)->sentMessages();
    ASSERT_EQ(req.size(), 1);
    auto parsed = nlohmann::json::parse(req[0]);
    std::string sub = parsed[1];

    transport.receive(RELAY_A, eventFrame(sub, older));
    transport.receive(RELAY_B, eventFrame(sub, older));
    transport.receive(RELAY_B, eventFrame(sub, newer));
    // Not asked for.
    transport.receive(RELAY_B, eventFrame(sub, signedNote("other")));
    transport.receive(RELAY_A, nlohmann::json::array({"EOSE", sub}).dump());
    EXPECT_FALSE(result.has_value());
    transport.receive(RELAY_B, nlohmann::json::array({"EOSE", sub}).dump());

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ((*result)[0].id, newer.id);
    EXPECT_EQ((*result)[1].id, older.id);
    EXPECT_EQ(transport.latest(RELAY_A)->sentMessages().back(),
              closeMessage(sub));
    // Query results do not go to the event handler.
    EXPECT_TRUE(received.empty());
}

TEST_F(RelayPoolTest, QueryFinishesOnTimeout)
{
    pool->start();
    transport.open(RELAY_A);

    std::optional<std::vector<NativeEvent>> result;
    pool->query({Filter()}, 10ms, [&](std::vector<NativeEvent> events)
    {
        result = std::move(events);
    });
    std::string sub = nlohmann::json::parse(
        transport.latest(RELAY_A)->sentMessages()[0])[1];
    transport.receive(RELAY_A, eventFrame(sub, signedNote("partial")));
    EXPECT_FALSE(result.has_value());

    runFor(100ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 1);
}

TEST_F(RelayPoolTest, QueryWithoutRelaysIsEmpty)
{
    pool->start();
    std::optional<std::vector<NativeEvent>> result;
    pool->query({Filter()}, 10s, [&](std::vector<NativeEvent> events)
    {
        result = std::move(events);
    });
    runFor(10ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST_F(RelayPoolTest, BackoffIsCapped)
{
    RelayBackoffConfig conf;
    conf.base_ms = 1000;
    conf.max_ms = 60000;
    RelayPool p(io.get_executor(), transport, *dedup, conf);
    EXPECT_EQ(p.backoffDelay(1), 1000ms);
    EXPECT_EQ(p.backoffDelay(2), 2000ms);
    EXPECT_EQ(p.backoffDelay(4), 8000ms);
    EXPECT_EQ(p.backoffDelay(7), 60000ms);
    EXPECT_EQ(p.backoffDelay(1000), 60000ms);
}

TEST_F(RelayPoolTest, MetadataRelayOnlyCarriesProfiles)
{
    const std::string META = "wss://meta.relay.example";
    pool->addRelay(META, RelayRole::METADATA);
    Filter notes;
    notes.kinds = {kind::TEXT_NOTE};
    pool->subscribe("main", {notes});
    pool->start();
    transport.open(RELAY_A);
    transport.open(META);

    EXPECT_EQ(pool->state(META), RelayState::SUBSCRIBED);
    EXPECT_TRUE(transport.latest(META)->sentMessages().empty());
    EXPECT_EQ(pool->relays(), (std::vector<std::string>{RELAY_A, RELAY_B}));

    EXPECT_EQ(pool->publish(signedNote("note")),
              std::vector<std::string>{RELAY_A});
    NativeEvent profile;
    profile.created_at = 1700000000;
    profile.kind = kind::METADATA;
    profile.content = R"({"name":"someone"})";
    ASSERT_TRUE(profile.sign(SECRET).has_value());
    EXPECT_EQ(pool->publish(profile),
              (std::vector<std::string>{RELAY_A, META}));
    EXPECT_EQ(transport.latest(META)->sentMessages(),
              std::vector<std::string>{eventMessage(profile)});

    pool->query({notes}, 10s, [](std::vector<NativeEvent>) {});
    EXPECT_EQ(transport.latest(META)->sentMessages().size(), 1);
    Filter profiles;
    profiles.kinds = {kind::METADATA};
    profiles.authors = {profile.pubkey};
    pool->query({profiles}, 10s, [](std::vector<NativeEvent>) {});
    auto sent = transport.latest(META)->sentMessages();
    ASSERT_EQ(sent.size(), 2);
    EXPECT_EQ(nlohmann::json::parse(sent[1])[0], "REQ");
}
