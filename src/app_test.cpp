#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mw/crypto.hpp>
#include <mw/http_client.hpp>
#include <mw/http_client_mock.hpp>
#include <nlohmann/json.hpp>

#include "app.hpp"
#include "bech32.hpp"
#include "http_signature.hpp"
#include "relay_transport_mock.hpp"
#include "schnorr.hpp"
#include "test_utils.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using namespace std::chrono_literals;

namespace
{

const std::string ROOT = "http://localhost:18080";
const std::string SECRET =
    "67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa";
const std::string ALICE = "https://remote.test/users/alice";

} // namespace

class AppTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config.server_url_root = ROOT;
        config.query_timeout_seconds = 1;
        config.nodeinfo.name = "TestNode";
        config.delivery.max_attempts = 1;
        urls = std::make_unique<URLManager>(config);
        store = std::make_unique<Store>(":memory:");
        ASSERT_TRUE(store->init().has_value());
        identities = std::make_unique<IdentityMapper>(
            *store, crypto, *urls, "bridge secret", config.cache);
        ASSIGN_OR_FAIL(SystemKeys keys, identities->systemKeys());
        ASSIGN_OR_FAIL(user, schnorr::publicKeyFor(SECRET));
        npub = bech32::encodeHex("npub", user);

        auto alice_keys = crypto.generateKeyPair(mw::KeyType::RSA);
        ASSERT_TRUE(alice_keys.has_value());
        alice_private_key = alice_keys->private_key;
        nlohmann::json alice = {
            {"id", ALICE},
            {"type", "Person"},
            {"preferredUsername", "alice"},
            {"inbox", ALICE + "/inbox"},
            {"publicKey", {{"id", ALICE + "#main-key"}, {"owner", ALICE},
                           {"publicKeyPem", alice_keys->public_key}}},
        };
        alice_doc = alice.dump();

        http = std::make_unique<HttpClientPool>(2, [this]()
        {
            auto h = std::make_unique<NiceMock<mw::HTTPSessionMock>>();
            ON_CALL(*h, get(_)).WillByDefault(Invoke(
                [this](const mw::HTTPRequest& req) -> mw::E<const mw::HTTPResponse*>
                {
                    std::lock_guard<std::mutex> lock(http_lock);
                    responses.push_back(req.url == ALICE ?
                                        makeResponse(200, alice_doc) :
                                        makeResponse(404, ""));
                    return &responses.back();
                }));
            ON_CALL(*h, post(_)).WillByDefault(Invoke(
                [this](const mw::HTTPRequest&) -> mw::E<const mw::HTTPResponse*>
                {
                    std::lock_guard<std::mutex> lock(http_lock);
                    responses.push_back(makeResponse(202, ""));
                    return &responses.back();
                }));
            return h;
        });
        actors = std::make_unique<ActorResolver>(*store, *http, crypto, *urls,
                                                 keys, config.cache);
        verifier = std::make_unique<SignatureVerifier>(*actors, crypto, 300);
        dedup = std::make_unique<DedupIndex>(*store, 100, 3600);
        pool = std::make_unique<RelayPool>(io.get_executor(), transport, *dedup,
                                           config.relay_backoff);
        pool->addRelay("wss://relay.test");
        delivery = std::make_unique<DeliveryEngine>(
            workers.get_executor(), *http, crypto, config.delivery);
        coordinator = std::make_unique<BridgeCoordinator>(
            config, *store, *identities, *actors, *dedup, *pool, *delivery,
            *urls, transform);

        work.emplace(io.get_executor());
        io_thread = std::thread([this] { io.run(); });
        pool->start();
        transport.open("wss://relay.test");

        mw::HTTPServer::ListenAddress listen = mw::IPSocketInfo{"127.0.0.1", 18080};
        app = std::make_unique<App>(config, *urls, *identities, *verifier,
                                    *coordinator, transform, listen);
        auto start_res = app->start();
        ASSERT_TRUE(start_res) << "Failed to start app: "
                               << mw::errorMsg(start_res.error());
    }

    void TearDown() override
    {
        if(app != nullptr)
        {
            app->stop();
            app->wait();
        }
        coordinator.reset();
        if(delivery != nullptr)
        {
            delivery->shutdown();
        }
        if(pool != nullptr)
        {
            pool->stop();
        }
        work.reset();
        io.stop();
        if(io_thread.joinable())
        {
            io_thread.join();
        }
        workers.join();
    }

    // A POST of body signed by Alice.
    mw::HTTPRequest signedPost(const std::string& url, const std::string& body)
    {
        mw::HTTPRequest req(url);
        req.setPayload(body);
        req.setContentType("application/activity+json");
        EXPECT_TRUE(http_signature::signRequest(
                        req, "post", url, body, ALICE + "#main-key",
                        alice_private_key, crypto).has_value());
        return req;
    }

    std::string followBody() const
    {
        nlohmann::json follow = {
            {"id", "https://remote.test/follows/1"},
            {"type", "Follow"},
            {"actor", ALICE},
            {"object", urls->actor(user)},
        };
        return follow.dump();
    }

    Config config;
    std::string user;
    std::string npub;
    std::string alice_private_key;
    std::string alice_doc;
    std::unique_ptr<URLManager> urls;
    std::unique_ptr<Store> store;
    mw::Crypto crypto;
    GumboTextTransform transform;
    std::unique_ptr<IdentityMapper> identities;
    std::unique_ptr<HttpClientPool> http;
    std::unique_ptr<ActorResolver> actors;
    std::unique_ptr<SignatureVerifier> verifier;
    std::unique_ptr<DedupIndex> dedup;
    boost::asio::io_context io;
    std::optional<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>> work;
    std::thread io_thread;
    boost::asio::thread_pool workers{2};
    RelayTransportMock transport;
    std::unique_ptr<RelayPool> pool;
    std::unique_ptr<DeliveryEngine> delivery;
    std::unique_ptr<BridgeCoordinator> coordinator;
    std::unique_ptr<App> app;

    std::mutex http_lock;
    std::deque<mw::HTTPResponse> responses;
};

TEST_F(AppTest, WebFinger_Found)
{
    mw::HTTPSession client;
    auto res = client.get(ROOT + "/.well-known/webfinger?resource=acct:" + npub +
                          "@localhost:18080");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 200);
    auto j = nlohmann::json::parse((*res)->payloadAsStr());
    EXPECT_EQ(j["subject"], "acct:" + npub + "@localhost:18080");
    EXPECT_EQ(j["links"][0]["rel"], "self");
    EXPECT_EQ(j["links"][0]["href"], urls->actor(user));
}

TEST_F(AppTest, WebFinger_NotFound)
{
    mw::HTTPSession client;
    {
        auto res = client.get(ROOT + "/.well-known/webfinger?resource=acct:" +
                              npub + "@elsewhere.test");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 404);
    }
    {
        auto res = client.get(ROOT + "/.well-known/webfinger?resource="
                              "acct:alice@localhost:18080");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 404);
    }
    {
        auto res = client.get(ROOT + "/.well-known/webfinger");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 400);
    }
}

TEST_F(AppTest, NodeInfo)
{
    mw::HTTPSession client;
    {
        auto res = client.get(ROOT + "/.well-known/nodeinfo");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 200);
        auto j = nlohmann::json::parse((*res)->payloadAsStr());
        ASSERT_TRUE(j["links"].is_array());
        EXPECT_EQ(j["links"][0]["href"], ROOT + "/nodeinfo/2.1");
    }
    {
        auto res = client.get(ROOT + "/nodeinfo/2.1");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 200);
        auto j = nlohmann::json::parse((*res)->payloadAsStr());
        EXPECT_EQ(j["version"], "2.1");
        EXPECT_EQ(j["software"]["name"], "nostap");
        EXPECT_EQ(j["openRegistrations"], false);
        EXPECT_EQ(j["metadata"]["nodeName"], "TestNode");
    }
}

TEST_F(AppTest, UserDocument)
{
    mw::HTTPSession client;
    auto res = client.get(ROOT + "/users/" + npub);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 200);
    auto j = nlohmann::json::parse((*res)->payloadAsStr());
    EXPECT_EQ(j["type"], "Person");
    EXPECT_EQ(j["id"], urls->actor(user));
    EXPECT_EQ(j["inbox"], urls->inbox(user));
    EXPECT_THAT(j["publicKey"]["publicKeyPem"].get<std::string>(),
                HasSubstr("PUBLIC KEY"));

    // The same key always gets the same actor.
    auto again = client.get(ROOT + "/users/" + npub);
    ASSERT_TRUE(again.has_value());
    auto j2 = nlohmann::json::parse((*again)->payloadAsStr());
    EXPECT_EQ(j2["publicKey"], j["publicKey"]);
}

TEST_F(AppTest, UserDocument_NotFound)
{
    ASSIGN_OR_FAIL(DerivedIdentity alice, identities->resolveOrCreateIdentity(ALICE));
    mw::HTTPSession client;
    {
        auto res = client.get(ROOT + "/users/alice");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 404);
    }
    {
        // Keys standing for federated actors are not served as ours.
        auto res = client.get(ROOT + "/users/" +
                              bech32::encodeHex("npub", alice.pubkey));
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 404);
    }
}

TEST_F(AppTest, UserOutbox)
{
    mw::HTTPSession client;
    auto res = client.get(ROOT + "/users/" + npub + "/outbox");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 200);
    auto j = nlohmann::json::parse((*res)->payloadAsStr());
    EXPECT_EQ(j["type"], "OrderedCollection");
    EXPECT_EQ(j["totalItems"], 0);
}

TEST_F(AppTest, SystemActor)
{
    mw::HTTPSession client;
    auto res = client.get(ROOT + "/actor");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 200);
    auto j = nlohmann::json::parse((*res)->payloadAsStr());
    EXPECT_EQ(j["id"], urls->systemActor());
    EXPECT_EQ(j["publicKey"]["id"], urls->systemActorKeyId());
}

TEST_F(AppTest, Inbox_SignedFollow)
{
    mw::HTTPSession client;
    auto res = client.post(signedPost(ROOT + "/users/" + npub + "/inbox",
                                      followBody()));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 202);

    auto followers = client.get(ROOT + "/users/" + npub + "/followers");
    ASSERT_TRUE(followers.has_value());
    EXPECT_EQ((*followers)->status, 200);
    auto j = nlohmann::json::parse((*followers)->payloadAsStr());
    EXPECT_EQ(j["totalItems"], 1);
}

TEST_F(AppTest, Inbox_Unsigned)
{
    mw::HTTPSession client;
    mw::HTTPRequest req(ROOT + "/inbox");
    req.setPayload(followBody());
    auto res = client.post(req);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 401);

    ASSIGN_OR_FAIL(auto followers, identities->followerUris(user));
    EXPECT_TRUE(followers.empty());
}

TEST_F(AppTest, Inbox_TamperedBody)
{
    mw::HTTPSession client;
    mw::HTTPRequest req = signedPost(ROOT + "/inbox", followBody());
    req.setPayload(R"({"type":"Delete"})");
    auto res = client.post(req);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 401);
}

TEST_F(AppTest, Inbox_BadDocument)
{
    mw::HTTPSession client;
    auto res = client.post(signedPost(ROOT + "/inbox", "not json"));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->status, 400);
}

TEST_F(AppTest, Note_NotFound)
{
    mw::HTTPSession client;
    {
        auto res = client.get(ROOT + "/notes/nothing");
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 404);
    }
    {
        // Asks the relay, which never answers.
        auto res = client.get(ROOT + "/notes/" +
                              bech32::encodeHex("note", std::string(64, 'a')));
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 404);
    }
}
