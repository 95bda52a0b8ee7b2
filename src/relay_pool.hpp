#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "config.hpp"
#include "dedup_index.hpp"
#include "native_event.hpp"
#include "relay_transport.hpp"

enum class RelayState
{
    DISCONNECTED,
    CONNECTING,
    // Connected with every subscription issued.
    SUBSCRIBED,
    // Connected, but the relay closed one of our subscriptions.
    DEGRADED,
};

std::string_view relayStateName(RelayState state);

enum class RelayRole
{
    // Carries the subscriptions and every publication.
    CONTENT,
    // Only used for profiles: kind 0 publications and queries that ask
    // for nothing but kind 0.
    METADATA,
};

// Keeps one connection per configured relay, with the same set of
// subscriptions on each content relay. Events from all relays go through one dedup
// index, so each id reaches the handler once. Reconnects use
// exponential backoff and re-issue the subscriptions unchanged.
class RelayPool
{
public:
    // Gets every event seen for the first time, with the relay it came
    // from. Runs on the executor, without pool locks held.
    using EventHandler =
        std::function<void(const std::string& relay, const NativeEvent& event)>;
    using QueryHandler = std::function<void(std::vector<NativeEvent>)>;

    RelayPool(boost::asio::any_io_executor ex,
              RelayTransportInterface& transport, DedupIndex& dedup,
              const RelayBackoffConfig& backoff);
    ~RelayPool();
    RelayPool(const RelayPool&) = delete;
    RelayPool& operator=(const RelayPool&) = delete;

    // Relays added after start() connect right away. A relay added
    // with both roles is a content relay.
    void addRelay(const std::string& url,
                  RelayRole role = RelayRole::CONTENT);
    void setEventHandler(EventHandler handler);
    void start();
    // Closes every connection and cancels pending reconnects and
    // queries. Pending queries finish with what they have.
    void stop();

    // Adds or replaces a long-lived subscription on every content relay.
    void subscribe(const std::string& id, std::vector<Filter> filters);
    void unsubscribe(const std::string& id);

    // Sends the event to every relay currently in SUBSCRIBED state that
    // takes its kind, and returns their URLs. Relays that are down are skipped; each relay
    // acknowledges on its own.
    std::vector<std::string> publish(const NativeEvent& event);

    // One-shot lookup on every connected relay that takes the filters. Finishes when all of
    // them sent EOSE or the timeout expires. Results are verified,
    // match the filters, and are unique by id; they do not go through
    // the dedup index.
    void query(std::vector<Filter> filters, std::chrono::milliseconds timeout,
               QueryHandler done);
    // Blocking form of query(). Must not be called on the executor.
    std::vector<NativeEvent> querySync(std::vector<Filter> filters,
                                       std::chrono::milliseconds timeout);

    RelayState state(const std::string& url) const;
    // Content relays, the ones events are subscribed from.
    std::vector<std::string> relays() const;
    // Delay before reconnect attempt n (1-based).
    std::chrono::milliseconds backoffDelay(int attempt) const;

private:
    struct Relay
    {
        std::string url;
        RelayRole role = RelayRole::CONTENT;
        RelayState state = RelayState::DISCONNECTED;
        std::shared_ptr<RelayConnection> conn;
        // Bumped on every connect, so callbacks of an old connection
        // are ignored.
        uint64_t generation = 0;
        int failures = 0;
        std::unique_ptr<boost::asio::steady_timer> timer;
        // Subscriptions the relay closed on us.
        std::set<std::string> closed_subs;
    };

    struct Query
    {
        std::vector<Filter> filters;
        // Relays the REQ went to, and those that have not sent EOSE.
        std::set<std::string> sent_to;
        std::set<std::string> waiting_on;
        std::map<std::string, NativeEvent> results;
        std::unique_ptr<boost::asio::steady_timer> timer;
        QueryHandler done;
    };

    void connectLocked(Relay& relay);
    void scheduleReconnectLocked(Relay& relay);
    void onOpen(const std::string& url, uint64_t generation);
    void onClose(const std::string& url, uint64_t generation,
                 const std::string& reason);
    void onMessage(const std::string& url, uint64_t generation,
                   const std::string& text);
    void handleEvent(const std::string& url, const std::string& sub,
                     const NativeEvent& event);
    void handleEose(const std::string& url, const std::string& sub);
    void handleClosed(const std::string& url, const std::string& sub,
                      const std::string& message);
    // Takes a finished query out of the map; the caller runs its
    // handler after unlocking.
    std::unique_ptr<Query> takeQueryLocked(const std::string& sub);
    void finishQuery(const std::string& sub);
    Relay* findLocked(const std::string& url);

    boost::asio::any_io_executor executor;
    RelayTransportInterface& transport;
    DedupIndex& dedup;
    RelayBackoffConfig backoff;

    mutable std::mutex pool_lock;
    bool running = false;
    std::map<std::string, Relay> relays_by_url;
    std::map<std::string, std::vector<Filter>> subscriptions;
    std::map<std::string, std::unique_ptr<Query>> queries;
    uint64_t next_query = 0;
    EventHandler on_event;
};
