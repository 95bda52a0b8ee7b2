#include "store.hpp"

#include <format>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

namespace
{

template<typename T>
E<T> storeResult(mw::E<T>&& r)
{
    return std::move(r).transform_error(fromStoreError);
}

using ActorTuple = std::tuple<std::string, std::string, std::string,
                              std::string, std::string, std::string,
                              std::string, int64_t, int64_t>;

VirtualActor rowToActor(const ActorTuple& row)
{
    VirtualActor a;
    a.pubkey = std::get<0>(row);
    a.uri = std::get<1>(row);
    a.display_name = std::get<2>(row);
    a.summary = std::get<3>(row);
    a.avatar = std::get<4>(row);
    a.public_key_pem = std::get<5>(row);
    a.private_key_pem = std::get<6>(row);
    a.created_at = std::get<7>(row);
    a.profile_updated_at = std::get<8>(row);
    return a;
}

using RemoteActorTuple =
    std::tuple<std::string, std::string, std::string, std::string,
               std::string, std::string, std::string, std::string,
               std::string, std::string, std::string, int64_t>;

RemoteActor rowToRemoteActor(const RemoteActorTuple& row)
{
    RemoteActor a;
    a.uri = std::get<0>(row);
    a.preferred_username = std::get<1>(row);
    a.name = std::get<2>(row);
    a.summary = std::get<3>(row);
    a.icon = std::get<4>(row);
    a.url = std::get<5>(row);
    a.inbox = std::get<6>(row);
    a.shared_inbox = std::get<7>(row);
    a.followers = std::get<8>(row);
    a.key_id = std::get<9>(row);
    a.public_key_pem = std::get<10>(row);
    a.fetched_at = std::get<11>(row);
    return a;
}

using FollowerTuple =
    std::tuple<std::string, std::string, int, int, int64_t>;

FollowerRecord rowToFollower(const FollowerTuple& row)
{
    FollowerRecord r;
    r.subject_pubkey = std::get<0>(row);
    r.follower_uri = std::get<1>(row);
    r.source = static_cast<FollowSource>(std::get<2>(row));
    r.state = static_cast<FollowState>(std::get<3>(row));
    r.updated_at = std::get<4>(row);
    return r;
}

using FollowingTuple =
    std::tuple<std::string, std::string, std::string, int, int64_t>;

FollowingRecord rowToFollowing(const FollowingTuple& row)
{
    FollowingRecord r;
    r.pubkey = std::get<0>(row);
    r.target_uri = std::get<1>(row);
    r.follow_id = std::get<2>(row);
    r.state = static_cast<FollowingState>(std::get<3>(row));
    r.updated_at = std::get<4>(row);
    return r;
}

constexpr char ACTOR_COLUMNS[] =
    "pubkey, uri, display_name, summary, avatar, public_key_pem, "
    "private_key_pem, created_at, profile_updated_at";
constexpr char REMOTE_ACTOR_COLUMNS[] =
    "uri, preferred_username, name, summary, icon, url, inbox, "
    "shared_inbox, followers, key_id, public_key_pem, fetched_at";
constexpr char FOLLOWER_COLUMNS[] =
    "subject_pubkey, follower_uri, source, state, updated_at";
constexpr char FOLLOWING_COLUMNS[] =
    "pubkey, target_uri, follow_id, state, updated_at";

} // namespace

constexpr char MEMORY_PATH[] = ":memory:";
constexpr int BUSY_TIMEOUT_MS = 5000;

Store::Connection::Connection(Store* owner, std::unique_ptr<mw::SQLite> own,
                              mw::SQLite* shared)
        : owner(owner), own(std::move(own)),
          conn(this->own != nullptr ? this->own.get() : shared)
{
}

Store::Connection::Connection(Connection&& other) noexcept
        : owner(other.owner), own(std::move(other.own)), conn(other.conn)
{
    other.owner = nullptr;
    other.conn = nullptr;
}

Store::Connection::~Connection()
{
    if(owner != nullptr && own != nullptr)
    {
        owner->giveBack(std::move(own));
    }
}

Store::Store(const std::string& path) : db_path(path) {}

E<std::unique_ptr<mw::SQLite>> Store::openConnection() const
{
    ASSIGN_OR_RETURN(auto conn, storeResult(mw::SQLite::connectFile(db_path)));
    // Concurrent writers on other connections wait instead of failing.
    DO_OR_RETURN(storeResult(conn->execute(
        std::format("PRAGMA busy_timeout = {};", BUSY_TIMEOUT_MS))));
    return conn;
}

E<Store::Connection> Store::connection()
{
    if(shared != nullptr)
    {
        return Connection(nullptr, nullptr, shared.get());
    }
    if(!ready.load())
    {
        return std::unexpected(storeUnavailable("Store is not initialized"));
    }
    {
        std::lock_guard<std::mutex> lock(idle_lock);
        if(!idle.empty())
        {
            std::unique_ptr<mw::SQLite> conn = std::move(idle.back());
            idle.pop_back();
            return Connection(this, std::move(conn), nullptr);
        }
    }
    ASSIGN_OR_RETURN(auto conn, openConnection());
    return Connection(this, std::move(conn), nullptr);
}

void Store::giveBack(std::unique_ptr<mw::SQLite> conn)
{
    std::lock_guard<std::mutex> lock(idle_lock);
    idle.push_back(std::move(conn));
}

E<void> Store::init()
{
    if(db_path == MEMORY_PATH)
    {
        ASSIGN_OR_RETURN(auto conn, storeResult(mw::SQLite::connectMemory()));
        DO_OR_RETURN(migrate(*conn));
        shared = std::move(conn);
        return {};
    }

    ASSIGN_OR_RETURN(auto conn, openConnection());
    DO_OR_RETURN(storeResult(conn->execute("PRAGMA journal_mode=WAL;")));
    DO_OR_RETURN(migrate(*conn));
    giveBack(std::move(conn));
    ready.store(true);
    return {};
}

E<void> Store::migrate(mw::SQLite& db)
{
    ASSIGN_OR_RETURN(int version,
                     storeResult(db.evalToValue<int>("PRAGMA user_version;")));

    if(version == 0)
    {
        spdlog::info("Creating database schema v1...");

        const std::vector<std::string> statements = {
            R"(CREATE TABLE IF NOT EXISTS virtual_actors (
                pubkey TEXT PRIMARY KEY,
                uri TEXT UNIQUE NOT NULL,
                display_name TEXT NOT NULL DEFAULT '',
                summary TEXT NOT NULL DEFAULT '',
                avatar TEXT NOT NULL DEFAULT '',
                public_key_pem TEXT NOT NULL,
                private_key_pem TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                profile_updated_at INTEGER NOT NULL DEFAULT 0
            );)",

            R"(CREATE TABLE IF NOT EXISTS derived_identities (
                actor_uri TEXT PRIMARY KEY,
                pubkey TEXT UNIQUE NOT NULL,
                secret_key TEXT NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS remote_actors (
                uri TEXT PRIMARY KEY,
                preferred_username TEXT NOT NULL DEFAULT '',
                name TEXT NOT NULL DEFAULT '',
                summary TEXT NOT NULL DEFAULT '',
                icon TEXT NOT NULL DEFAULT '',
                url TEXT NOT NULL DEFAULT '',
                inbox TEXT NOT NULL DEFAULT '',
                shared_inbox TEXT NOT NULL DEFAULT '',
                followers TEXT NOT NULL DEFAULT '',
                key_id TEXT NOT NULL DEFAULT '',
                public_key_pem TEXT NOT NULL DEFAULT '',
                fetched_at INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS dedup (
                id TEXT PRIMARY KEY,
                first_seen INTEGER NOT NULL
            );)",
            "CREATE INDEX IF NOT EXISTS dedup_first_seen ON dedup(first_seen);",

            R"(CREATE TABLE IF NOT EXISTS followers (
                subject_pubkey TEXT NOT NULL,
                follower_uri TEXT NOT NULL,
                source INTEGER NOT NULL,
                state INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                PRIMARY KEY(subject_pubkey, follower_uri)
            );)",
            "CREATE INDEX IF NOT EXISTS followers_by_follower "
            "ON followers(follower_uri);",

            R"(CREATE TABLE IF NOT EXISTS following (
                pubkey TEXT NOT NULL,
                target_uri TEXT NOT NULL,
                follow_id TEXT NOT NULL,
                state INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                PRIMARY KEY(pubkey, target_uri)
            );)",
            "CREATE INDEX IF NOT EXISTS following_by_id "
            "ON following(follow_id);",

            R"(CREATE TABLE IF NOT EXISTS object_map (
                ap_id TEXT PRIMARY KEY,
                event_id TEXT NOT NULL
            );)",
            "CREATE INDEX IF NOT EXISTS object_map_by_event "
            "ON object_map(event_id);",

            R"(CREATE TABLE IF NOT EXISTS relay_cursors (
                relay_url TEXT PRIMARY KEY,
                created_at INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS system_config (
                key TEXT PRIMARY KEY,
                value TEXT
            );)",

            "PRAGMA user_version = 1;"};

        for(const auto& sql : statements)
        {
            auto res = db.execute(sql);
            if(!res)
            {
                spdlog::error("Failed to execute SQL: {}", sql);
                return std::unexpected(fromStoreError(res.error()));
            }
        }
        version = 1;
    }

    if(version == 1)
    {
        spdlog::info("Migrating database schema to v2...");

        const std::vector<std::string> statements = {
            R"(CREATE TABLE IF NOT EXISTS inbound_follows (
                follow_id TEXT PRIMARY KEY,
                subject_pubkey TEXT NOT NULL,
                follower_uri TEXT NOT NULL
            );)",
            "PRAGMA user_version = 2;"};

        for(const auto& sql : statements)
        {
            auto res = db.execute(sql);
            if(!res)
            {
                spdlog::error("Failed to execute SQL: {}", sql);
                return std::unexpected(fromStoreError(res.error()));
            }
        }
    }

    return {};
}

E<std::optional<VirtualActor>> Store::getVirtualActor(const std::string& pubkey)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("SELECT ") + ACTOR_COLUMNS +
                            " FROM virtual_actors WHERE pubkey = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(pubkey)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string,
                              std::string, std::string, std::string,
                              std::string, int64_t, int64_t>(
            std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToActor(rows[0]);
}

E<bool> Store::insertVirtualActor(const VirtualActor& actor)
{
    auto guard = writes.lock("virtual_actor " + actor.pubkey);
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto check,
        storeResult(db->statementFromStr(
            "SELECT pubkey FROM virtual_actors WHERE pubkey = ?;")));
    DO_OR_RETURN(storeResult(check.bind(actor.pubkey)));
    ASSIGN_OR_RETURN(auto existing,
                     storeResult(db->eval<std::string>(std::move(check))));
    if(!existing.empty())
    {
        return false;
    }

    const std::string sql = std::string("INSERT INTO virtual_actors (") +
                            ACTOR_COLUMNS +
                            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(
        stmt.bind(actor.pubkey, actor.uri, actor.display_name, actor.summary,
                  actor.avatar, actor.public_key_pem, actor.private_key_pem,
                  actor.created_at, actor.profile_updated_at)));
    DO_OR_RETURN(storeResult(db->execute(std::move(stmt))));
    return true;
}

E<void> Store::updateVirtualActorProfile(const VirtualActor& actor)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const char* sql =
        "UPDATE virtual_actors SET display_name = ?, summary = ?, "
        "avatar = ?, profile_updated_at = ? WHERE pubkey = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(actor.display_name, actor.summary,
                                       actor.avatar, actor.profile_updated_at,
                                       actor.pubkey)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::optional<DerivedIdentity>>
Store::getDerivedIdentityByUri(const std::string& actor_uri)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT actor_uri, pubkey, secret_key FROM derived_identities "
            "WHERE actor_uri = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(actor_uri)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string>(
            std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return DerivedIdentity{std::get<0>(rows[0]), std::get<1>(rows[0]),
                           std::get<2>(rows[0])};
}

E<std::optional<DerivedIdentity>>
Store::getDerivedIdentityByPubkey(const std::string& pubkey)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT actor_uri, pubkey, secret_key FROM derived_identities "
            "WHERE pubkey = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(pubkey)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string>(
            std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return DerivedIdentity{std::get<0>(rows[0]), std::get<1>(rows[0]),
                           std::get<2>(rows[0])};
}

E<std::vector<std::string>> Store::derivedPubkeys()
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT pubkey FROM derived_identities ORDER BY pubkey;")));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<std::string>(std::move(stmt))));
    std::vector<std::string> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back(std::get<0>(row));
    }
    return result;
}

E<bool> Store::insertDerivedIdentity(const DerivedIdentity& id)
{
    auto guard = writes.lock("derived_identity " + id.actor_uri);
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto check,
        storeResult(db->statementFromStr(
            "SELECT pubkey FROM derived_identities WHERE actor_uri = ?;")));
    DO_OR_RETURN(storeResult(check.bind(id.actor_uri)));
    ASSIGN_OR_RETURN(auto existing,
                     storeResult(db->eval<std::string>(std::move(check))));
    if(!existing.empty())
    {
        return false;
    }

    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "INSERT INTO derived_identities (actor_uri, pubkey, secret_key) "
            "VALUES (?, ?, ?);")));
    DO_OR_RETURN(storeResult(stmt.bind(id.actor_uri, id.pubkey, id.secret_key)));
    DO_OR_RETURN(storeResult(db->execute(std::move(stmt))));
    return true;
}

E<std::optional<RemoteActor>> Store::getRemoteActor(const std::string& uri)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("SELECT ") + REMOTE_ACTOR_COLUMNS +
                            " FROM remote_actors WHERE uri = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(uri)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string,
                              std::string, std::string, std::string,
                              std::string, std::string, std::string,
                              std::string, std::string, int64_t>(
            std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToRemoteActor(rows[0]);
}

E<void> Store::putRemoteActor(const RemoteActor& a)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("INSERT OR REPLACE INTO remote_actors (") +
                            REMOTE_ACTOR_COLUMNS +
                            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(
        stmt.bind(a.uri, a.preferred_username, a.name, a.summary, a.icon, a.url,
                  a.inbox, a.shared_inbox, a.followers, a.key_id,
                  a.public_key_pem, a.fetched_at)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::optional<int64_t>> Store::getSeen(const std::string& id)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(auto stmt,
                     storeResult(db->statementFromStr(
                         "SELECT first_seen FROM dedup WHERE id = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(id)));
    ASSIGN_OR_RETURN(auto rows, storeResult(db->eval<int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return std::get<0>(rows[0]);
}

E<void> Store::putSeen(const std::string& id, int64_t first_seen)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "INSERT OR REPLACE INTO dedup (id, first_seen) VALUES (?, ?);")));
    DO_OR_RETURN(storeResult(stmt.bind(id, first_seen)));
    return storeResult(db->execute(std::move(stmt)));
}

E<int> Store::purgeSeenBefore(int64_t cutoff)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(auto count_stmt,
                     storeResult(db->statementFromStr(
                         "SELECT COUNT(*) FROM dedup WHERE first_seen < ?;")));
    DO_OR_RETURN(storeResult(count_stmt.bind(cutoff)));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<int64_t>(std::move(count_stmt))));

    ASSIGN_OR_RETURN(auto stmt,
                     storeResult(db->statementFromStr(
                         "DELETE FROM dedup WHERE first_seen < ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(cutoff)));
    DO_OR_RETURN(storeResult(db->execute(std::move(stmt))));
    return rows.empty() ? 0 : static_cast<int>(std::get<0>(rows[0]));
}

E<std::optional<FollowerRecord>>
Store::getFollower(const std::string& subject_pubkey,
                   const std::string& follower_uri)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql =
        std::string("SELECT ") + FOLLOWER_COLUMNS +
        " FROM followers WHERE subject_pubkey = ? AND follower_uri = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(subject_pubkey, follower_uri)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, int, int, int64_t>(
            std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToFollower(rows[0]);
}

E<void> Store::putFollower(const FollowerRecord& r)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("INSERT OR REPLACE INTO followers (") +
                            FOLLOWER_COLUMNS + ") VALUES (?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(
        r.subject_pubkey, r.follower_uri, static_cast<int>(r.source),
        static_cast<int>(r.state), r.updated_at)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::vector<FollowerRecord>>
Store::activeFollowers(const std::string& subject_pubkey)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("SELECT ") + FOLLOWER_COLUMNS +
                            " FROM followers WHERE subject_pubkey = ? AND "
                            "state = ? ORDER BY follower_uri;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(
        stmt.bind(subject_pubkey, static_cast<int>(FollowState::ACTIVE))));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, int, int, int64_t>(
            std::move(stmt)))));
    std::vector<FollowerRecord> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back(rowToFollower(row));
    }
    return result;
}

E<std::vector<std::string>> Store::followedBy(const std::string& follower_uri)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT subject_pubkey FROM followers WHERE follower_uri = ? "
            "AND state = ? ORDER BY updated_at;")));
    DO_OR_RETURN(storeResult(
        stmt.bind(follower_uri, static_cast<int>(FollowState::ACTIVE))));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<std::string>(std::move(stmt))));
    std::vector<std::string> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back(std::get<0>(row));
    }
    return result;
}

E<std::vector<std::string>> Store::followedSubjects()
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT DISTINCT subject_pubkey FROM followers WHERE state = ? "
            "ORDER BY subject_pubkey;")));
    DO_OR_RETURN(storeResult(stmt.bind(static_cast<int>(FollowState::ACTIVE))));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<std::string>(std::move(stmt))));
    std::vector<std::string> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back(std::get<0>(row));
    }
    return result;
}

E<void> Store::putInboundFollow(const InboundFollow& follow)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "INSERT OR REPLACE INTO inbound_follows "
            "(follow_id, subject_pubkey, follower_uri) VALUES (?, ?, ?);")));
    DO_OR_RETURN(storeResult(stmt.bind(follow.follow_id, follow.subject_pubkey,
                                       follow.follower_uri)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::optional<InboundFollow>>
Store::getInboundFollow(const std::string& follow_id)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT follow_id, subject_pubkey, follower_uri "
            "FROM inbound_follows WHERE follow_id = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(follow_id)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string>(
            std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return InboundFollow{std::get<0>(rows[0]), std::get<1>(rows[0]),
                         std::get<2>(rows[0])};
}

E<std::optional<FollowingRecord>>
Store::getFollowing(const std::string& pubkey, const std::string& target_uri)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("SELECT ") + FOLLOWING_COLUMNS +
                            " FROM following WHERE pubkey = ? AND "
                            "target_uri = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(pubkey, target_uri)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string, int,
                              int64_t>(std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToFollowing(rows[0]);
}

E<std::optional<FollowingRecord>>
Store::getFollowingById(const std::string& follow_id)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("SELECT ") + FOLLOWING_COLUMNS +
                            " FROM following WHERE follow_id = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(follow_id)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string, int,
                              int64_t>(std::move(stmt)))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToFollowing(rows[0]);
}

E<void> Store::putFollowing(const FollowingRecord& r)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("INSERT OR REPLACE INTO following (") +
                            FOLLOWING_COLUMNS + ") VALUES (?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(r.pubkey, r.target_uri, r.follow_id,
                                       static_cast<int>(r.state),
                                       r.updated_at)));
    return storeResult(db->execute(std::move(stmt)));
}

E<void> Store::deleteFollowing(const std::string& pubkey,
                               const std::string& target_uri)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "DELETE FROM following WHERE pubkey = ? AND target_uri = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(pubkey, target_uri)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::vector<FollowingRecord>> Store::followingOf(const std::string& pubkey)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const std::string sql = std::string("SELECT ") + FOLLOWING_COLUMNS +
                            " FROM following WHERE pubkey = ? "
                            "ORDER BY target_uri;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(pubkey)));
    ASSIGN_OR_RETURN(
        auto rows,
        storeResult((db->eval<std::string, std::string, std::string, int,
                              int64_t>(std::move(stmt)))));
    std::vector<FollowingRecord> result;
    result.reserve(rows.size());
    for(const auto& row : rows)
    {
        result.push_back(rowToFollowing(row));
    }
    return result;
}

E<std::optional<std::string>> Store::eventIdForObject(const std::string& ap_id)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(auto stmt,
                     storeResult(db->statementFromStr(
                         "SELECT event_id FROM object_map WHERE ap_id = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(ap_id)));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<std::string>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return std::get<0>(rows[0]);
}

E<std::optional<std::string>>
Store::objectForEventId(const std::string& event_id)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT ap_id FROM object_map WHERE event_id = ? LIMIT 1;")));
    DO_OR_RETURN(storeResult(stmt.bind(event_id)));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<std::string>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return std::get<0>(rows[0]);
}

E<void> Store::putObjectMapping(const ObjectMapping& mapping)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "INSERT OR REPLACE INTO object_map (ap_id, event_id) "
            "VALUES (?, ?);")));
    DO_OR_RETURN(storeResult(stmt.bind(mapping.ap_id, mapping.event_id)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::optional<int64_t>> Store::getRelayCursor(const std::string& relay_url)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "SELECT created_at FROM relay_cursors WHERE relay_url = ?;")));
    DO_OR_RETURN(storeResult(stmt.bind(relay_url)));
    ASSIGN_OR_RETURN(auto rows, storeResult(db->eval<int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return std::get<0>(rows[0]);
}

E<void> Store::advanceRelayCursor(const std::string& relay_url,
                                  int64_t created_at)
{
    ASSIGN_OR_RETURN(auto db, connection());
    ASSIGN_OR_RETURN(
        auto stmt,
        storeResult(db->statementFromStr(
            "INSERT INTO relay_cursors (relay_url, created_at) VALUES (?, ?) "
            "ON CONFLICT(relay_url) DO UPDATE SET "
            "created_at = MAX(created_at, excluded.created_at);")));
    DO_OR_RETURN(storeResult(stmt.bind(relay_url, created_at)));
    return storeResult(db->execute(std::move(stmt)));
}

E<std::optional<std::string>> Store::getSystemConfig(const std::string& key)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const char* sql = "SELECT value FROM system_config WHERE key = ?;";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(key)));
    ASSIGN_OR_RETURN(auto rows,
                     storeResult(db->eval<std::string>(std::move(stmt))));

    if(rows.empty())
    {
        return std::nullopt;
    }
    return std::get<0>(rows[0]);
}

E<void> Store::setSystemConfig(const std::string& key, const std::string& value)
{
    ASSIGN_OR_RETURN(auto db, connection());
    const char* sql =
        "INSERT OR REPLACE INTO system_config (key, value) VALUES (?, ?);";
    ASSIGN_OR_RETURN(auto stmt, storeResult(db->statementFromStr(sql)));
    DO_OR_RETURN(storeResult(stmt.bind(key, value)));
    return storeResult(db->execute(std::move(stmt)));
}
