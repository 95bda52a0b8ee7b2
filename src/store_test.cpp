#include <atomic>
#include <filesystem>
#include <format>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "store.hpp"
#include "test_utils.hpp"

class StoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store = std::make_unique<Store>(":memory:");
        auto res = store->init();
        if(!res)
        {
            FAIL() << "Failed to init store: " << errorMsg(res.error());
        }
    }

    std::unique_ptr<Store> store;
};

TEST_F(StoreTest, VirtualActorInsertIsFirstWriterWins)
{
    VirtualActor a;
    a.pubkey = std::string(64, 'a');
    a.uri = "https://bridge.example/users/npub1a";
    a.public_key_pem = "PUB1";
    a.private_key_pem = "PRIV1";
    a.created_at = 100;

    ASSIGN_OR_FAIL(bool inserted, store->insertVirtualActor(a));
    EXPECT_TRUE(inserted);

    VirtualActor b = a;
    b.public_key_pem = "PUB2";
    b.private_key_pem = "PRIV2";
    ASSIGN_OR_FAIL(bool inserted_again, store->insertVirtualActor(b));
    EXPECT_FALSE(inserted_again);

    ASSIGN_OR_FAIL(auto got, store->getVirtualActor(a.pubkey));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, a);

    ASSIGN_OR_FAIL(auto missing, store->getVirtualActor(std::string(64, 'b')));
    EXPECT_FALSE(missing.has_value());
}

TEST_F(StoreTest, ProfileUpdateKeepsKeys)
{
    VirtualActor a;
    a.pubkey = std::string(64, 'a');
    a.uri = "https://bridge.example/users/npub1a";
    a.public_key_pem = "PUB";
    a.private_key_pem = "PRIV";
    ASSERT_TRUE(store->insertVirtualActor(a).has_value());

    a.display_name = "Alice";
    a.summary = "hi";
    a.profile_updated_at = 42;
    a.public_key_pem = "SHOULD NOT CHANGE";
    ASSERT_TRUE(store->updateVirtualActorProfile(a).has_value());

    ASSIGN_OR_FAIL(auto got, store->getVirtualActor(a.pubkey));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->display_name, "Alice");
    EXPECT_EQ(got->profile_updated_at, 42);
    EXPECT_EQ(got->public_key_pem, "PUB");
}

TEST_F(StoreTest, DerivedIdentities)
{
    DerivedIdentity id{"https://a.example/users/bob", std::string(64, 'c'),
                       std::string(64, 'd')};
    ASSIGN_OR_FAIL(bool inserted, store->insertDerivedIdentity(id));
    EXPECT_TRUE(inserted);
    ASSIGN_OR_FAIL(auto by_uri, store->getDerivedIdentityByUri(id.actor_uri));
    ASSERT_TRUE(by_uri.has_value());
    EXPECT_EQ(*by_uri, id);
    ASSIGN_OR_FAIL(auto by_key, store->getDerivedIdentityByPubkey(id.pubkey));
    ASSERT_TRUE(by_key.has_value());
    EXPECT_EQ(by_key->actor_uri, id.actor_uri);
    ASSIGN_OR_FAIL(auto keys, store->derivedPubkeys());
    EXPECT_EQ(keys, std::vector<std::string>{id.pubkey});
}

TEST_F(StoreTest, DedupPurge)
{
    ASSERT_TRUE(store->putSeen("old", 10).has_value());
    ASSERT_TRUE(store->putSeen("new", 1000).has_value());
    ASSIGN_OR_FAIL(int purged, store->purgeSeenBefore(500));
    EXPECT_EQ(purged, 1);
    ASSIGN_OR_FAIL(auto old_seen, store->getSeen("old"));
    EXPECT_FALSE(old_seen.has_value());
    ASSIGN_OR_FAIL(auto new_seen, store->getSeen("new"));
    ASSERT_TRUE(new_seen.has_value());
    EXPECT_EQ(*new_seen, 1000);
}

TEST_F(StoreTest, Followers)
{
    const std::string subject(64, 'e');
    FollowerRecord r1{subject, "https://a.example/users/x",
                      FollowSource::FEDERATION, FollowState::ACTIVE, 1};
    FollowerRecord r2{subject, "https://b.example/users/y",
                      FollowSource::RELAY, FollowState::REMOVED, 2};
    ASSERT_TRUE(store->putFollower(r1).has_value());
    ASSERT_TRUE(store->putFollower(r2).has_value());

    ASSIGN_OR_FAIL(auto active, store->activeFollowers(subject));
    ASSERT_EQ(active.size(), 1);
    EXPECT_EQ(active[0], r1);

    ASSIGN_OR_FAIL(auto subjects, store->followedBy(r1.follower_uri));
    EXPECT_EQ(subjects, std::vector<std::string>{subject});
    ASSIGN_OR_FAIL(auto followed, store->followedSubjects());
    EXPECT_EQ(followed, std::vector<std::string>{subject});

    r1.state = FollowState::REMOVED;
    ASSERT_TRUE(store->putFollower(r1).has_value());
    ASSIGN_OR_FAIL(auto after, store->activeFollowers(subject));
    EXPECT_TRUE(after.empty());
    ASSIGN_OR_FAIL(auto none, store->followedSubjects());
    EXPECT_TRUE(none.empty());
}

TEST_F(StoreTest, Following)
{
    FollowingRecord r{std::string(64, 'f'), "https://a.example/users/x",
                      "https://bridge.example/follows/1",
                      FollowingState::PENDING, 5};
    ASSERT_TRUE(store->putFollowing(r).has_value());
    ASSIGN_OR_FAIL(auto by_id, store->getFollowingById(r.follow_id));
    ASSERT_TRUE(by_id.has_value());
    EXPECT_EQ(*by_id, r);

    ASSIGN_OR_FAIL(auto list, store->followingOf(r.pubkey));
    EXPECT_EQ(list.size(), 1);

    ASSERT_TRUE(store->deleteFollowing(r.pubkey, r.target_uri).has_value());
    ASSIGN_OR_FAIL(auto gone, store->getFollowing(r.pubkey, r.target_uri));
    EXPECT_FALSE(gone.has_value());
}

TEST_F(StoreTest, InboundFollows)
{
    InboundFollow f{"https://a.example/follows/1", std::string(64, 'a'),
                    "https://a.example/users/x"};
    ASSERT_TRUE(store->putInboundFollow(f).has_value());
    ASSIGN_OR_FAIL(auto got, store->getInboundFollow(f.follow_id));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, f);
    ASSIGN_OR_FAIL(auto missing,
                   store->getInboundFollow("https://a.example/follows/2"));
    EXPECT_FALSE(missing.has_value());
}

TEST_F(StoreTest, ObjectMapAndCursors)
{
    ASSERT_TRUE(
        store->putObjectMapping({"https://a.example/notes/1", "abcd"}).has_value());
    ASSIGN_OR_FAIL(auto ev, store->eventIdForObject("https://a.example/notes/1"));
    EXPECT_EQ(ev, std::optional<std::string>("abcd"));
    ASSIGN_OR_FAIL(auto obj, store->objectForEventId("abcd"));
    EXPECT_EQ(obj, std::optional<std::string>("https://a.example/notes/1"));

    ASSERT_TRUE(store->advanceRelayCursor("wss://r.example", 100).has_value());
    ASSERT_TRUE(store->advanceRelayCursor("wss://r.example", 50).has_value());
    ASSIGN_OR_FAIL(auto cursor, store->getRelayCursor("wss://r.example"));
    EXPECT_EQ(cursor, std::optional<int64_t>(100));
}

TEST_F(StoreTest, SystemConfig)
{
    ASSIGN_OR_FAIL(auto missing, store->getSystemConfig("secret_key"));
    EXPECT_FALSE(missing.has_value());
    ASSERT_TRUE(store->setSystemConfig("secret_key", "abc").has_value());
    ASSIGN_OR_FAIL(auto value, store->getSystemConfig("secret_key"));
    EXPECT_EQ(value, std::optional<std::string>("abc"));
}

TEST(StoreUninitialized, ReportsStoreUnavailable)
{
    Store store(":memory:");
    auto res = store.getVirtualActor("x");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::STORE_UNAVAILABLE);
}

class FileStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path = (std::filesystem::temp_directory_path() /
                ("nostap-store-" + std::to_string(::getpid()) + ".db")).string();
        removeFiles();
        store = std::make_unique<Store>(path);
        auto res = store->init();
        if(!res)
        {
            FAIL() << "Failed to init store: " << errorMsg(res.error());
        }
    }

    void TearDown() override
    {
        store.reset();
        removeFiles();
    }

    void removeFiles()
    {
        for(const char* suffix : {"", "-wal", "-shm"})
        {
            std::filesystem::remove(path + suffix);
        }
    }

    std::string path;
    std::unique_ptr<Store> store;
};

TEST_F(FileStoreTest, SameActorInsertedFromManyThreadsOnce)
{
    VirtualActor a;
    a.pubkey = std::string(64, 'c');
    a.uri = "https://bridge.example/users/npub1c";
    a.public_key_pem = "PUB";
    a.private_key_pem = "PRIV";

    std::atomic<int> inserted = 0;
    std::atomic<int> failed = 0;
    std::vector<std::thread> threads;
    for(int i = 0; i < 8; i++)
    {
        threads.emplace_back([&]()
        {
            auto r = store->insertVirtualActor(a);
            if(!r.has_value())
            {
                failed++;
            }
            else if(*r)
            {
                inserted++;
            }
        });
    }
    for(auto& t : threads)
    {
        t.join();
    }
    EXPECT_EQ(inserted.load(), 1);
    EXPECT_EQ(failed.load(), 0);
}

TEST_F(FileStoreTest, ConcurrentReadsAndWrites)
{
    std::atomic<int> failed = 0;
    std::vector<std::thread> threads;
    for(int i = 0; i < 8; i++)
    {
        threads.emplace_back([&, i]()
        {
            for(int j = 0; j < 20; j++)
            {
                std::string id = std::format("https://a.example/{}/{}", i, j);
                if(!store->putSeen(id, j).has_value())
                {
                    failed++;
                }
                auto seen = store->getSeen(id);
                if(!seen.has_value() || *seen != std::optional<int64_t>(j))
                {
                    failed++;
                }
            }
        });
    }
    for(auto& t : threads)
    {
        t.join();
    }
    EXPECT_EQ(failed.load(), 0);
}

TEST_F(FileStoreTest, DataSurvivesReopening)
{
    ASSERT_TRUE(store->setSystemConfig("secret_key", "abc").has_value());
    store = std::make_unique<Store>(path);
    ASSERT_TRUE(store->init().has_value());
    ASSIGN_OR_FAIL(auto value, store->getSystemConfig("secret_key"));
    EXPECT_EQ(value, std::optional<std::string>("abc"));
}
