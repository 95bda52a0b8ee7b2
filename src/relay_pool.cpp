#include "relay_pool.hpp"

#include <algorithm>
#include <format>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace net = boost::asio;

std::string_view relayStateName(RelayState state)
{
    switch(state)
    {
    case RelayState::DISCONNECTED:
        return "disconnected";
    case RelayState::CONNECTING:
        return "connecting";
    case RelayState::SUBSCRIBED:
        return "subscribed";
    case RelayState::DEGRADED:
        return "degraded";
    }
    return "unknown";
}

namespace
{

bool profileOnly(const std::vector<Filter>& filters)
{
    return !filters.empty() &&
        std::all_of(filters.begin(), filters.end(), [](const Filter& f)
        {
            return !f.kinds.empty() &&
                std::all_of(f.kinds.begin(), f.kinds.end(), [](int k)
                {
                    return k == kind::METADATA;
                });
        });
}

} // namespace

RelayPool::RelayPool(net::any_io_executor ex,
                     RelayTransportInterface& transport_impl,
                     DedupIndex& dedup_index, const RelayBackoffConfig& conf)
    : executor(std::move(ex)), transport(transport_impl), dedup(dedup_index),
      backoff(conf)
{
}

RelayPool::~RelayPool()
{
    stop();
}

void RelayPool::addRelay(const std::string& url, RelayRole role)
{
    std::lock_guard<std::mutex> lock(pool_lock);
    if(Relay* known = findLocked(url); known != nullptr)
    {
        if(role == RelayRole::CONTENT && known->role != RelayRole::CONTENT)
        {
            known->role = RelayRole::CONTENT;
            if(known->conn && known->state == RelayState::SUBSCRIBED)
            {
                for(const auto& [sub, filters] : subscriptions)
                {
                    known->conn->send(reqMessage(sub, filters));
                }
            }
        }
        return;
    }
    Relay& relay = relays_by_url[url];
    relay.url = url;
    relay.role = role;
    relay.timer = std::make_unique<net::steady_timer>(executor);
    if(running)
    {
        connectLocked(relay);
    }
}

void RelayPool::setEventHandler(EventHandler handler)
{
    std::lock_guard<std::mutex> lock(pool_lock);
    on_event = std::move(handler);
}

void RelayPool::start()
{
    std::lock_guard<std::mutex> lock(pool_lock);
    if(running)
    {
        return;
    }
    running = true;
    for(auto& [url, relay] : relays_by_url)
    {
        connectLocked(relay);
    }
}

void RelayPool::stop()
{
    std::map<std::string, std::unique_ptr<Query>> pending;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        if(!running)
        {
            return;
        }
        running = false;
        for(auto& [url, relay] : relays_by_url)
        {
            relay.timer->cancel();
            if(relay.conn)
            {
                relay.conn->close();
                relay.conn.reset();
            }
            relay.generation++;
            relay.state = RelayState::DISCONNECTED;
            relay.closed_subs.clear();
        }
        pending.swap(queries);
    }
    for(auto& [sub, q] : pending)
    {
        q->timer->cancel();
        std::vector<NativeEvent> results;
        for(auto& [id, event] : q->results)
        {
            results.push_back(std::move(event));
        }
        q->done(std::move(results));
    }
}

RelayPool::Relay* RelayPool::findLocked(const std::string& url)
{
    auto it = relays_by_url.find(url);
    if(it == relays_by_url.end())
    {
        return nullptr;
    }
    return &it->second;
}

std::chrono::milliseconds RelayPool::backoffDelay(int attempt) const
{
    int64_t delay = backoff.base_ms;
    for(int i = 1; i < attempt && delay < backoff.max_ms; i++)
    {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, backoff.max_ms));
}

void RelayPool::connectLocked(Relay& relay)
{
    relay.generation++;
    relay.state = RelayState::CONNECTING;
    relay.closed_subs.clear();
    const std::string url = relay.url;
    const uint64_t generation = relay.generation;

    RelayCallbacks callbacks;
    callbacks.on_open = [this, url, generation]()
    {
        onOpen(url, generation);
    };
    callbacks.on_message = [this, url, generation](const std::string& text)
    {
        onMessage(url, generation, text);
    };
    callbacks.on_close = [this, url, generation](const std::string& reason)
    {
        onClose(url, generation, reason);
    };

    spdlog::debug("Connecting to relay {}", url);
    auto conn = transport.connect(url, std::move(callbacks));
    if(!conn.has_value())
    {
        // A URL that cannot be used will not get better by retrying.
        spdlog::error("Cannot connect to relay {}: {}", url,
                      errorMsg(conn.error()));
        relay.state = RelayState::DISCONNECTED;
        return;
    }
    relay.conn = std::move(*conn);
}

void RelayPool::scheduleReconnectLocked(Relay& relay)
{
    relay.failures++;
    auto delay = backoffDelay(relay.failures);
    spdlog::debug("Reconnecting to relay {} in {} ms", relay.url, delay.count());
    const std::string url = relay.url;
    const uint64_t generation = relay.generation;
    relay.timer->expires_after(delay);
    relay.timer->async_wait([this, url, generation](boost::system::error_code ec)
    {
        if(ec)
        {
            return;
        }
        std::lock_guard<std::mutex> lock(pool_lock);
        Relay* relay = findLocked(url);
        if(!running || relay == nullptr || relay->generation != generation)
        {
            return;
        }
        connectLocked(*relay);
    });
}

void RelayPool::onOpen(const std::string& url, uint64_t generation)
{
    std::lock_guard<std::mutex> lock(pool_lock);
    Relay* relay = findLocked(url);
    if(!running || relay == nullptr || relay->generation != generation ||
       !relay->conn)
    {
        return;
    }
    // The subscription set is re-issued exactly as it was registered.
    if(relay->role == RelayRole::CONTENT)
    {
        for(const auto& [sub, filters] : subscriptions)
        {
            relay->conn->send(reqMessage(sub, filters));
        }
    }
    relay->failures = 0;
    relay->state = RelayState::SUBSCRIBED;
    spdlog::debug("Relay {} is {}", url, relayStateName(relay->state));
}

void RelayPool::onClose(const std::string& url, uint64_t generation,
                        const std::string& reason)
{
    std::vector<std::string> finished;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        Relay* relay = findLocked(url);
        if(relay == nullptr || relay->generation != generation)
        {
            return;
        }
        spdlog::info("Relay {} disconnected: {}", url, reason);
        relay->conn.reset();
        relay->state = RelayState::DISCONNECTED;
        relay->closed_subs.clear();
        // Bump so late messages of this connection are ignored.
        relay->generation++;
        if(running)
        {
            scheduleReconnectLocked(*relay);
        }
        for(auto& [sub, q] : queries)
        {
            q->sent_to.erase(url);
            if(q->waiting_on.erase(url) > 0 && q->waiting_on.empty())
            {
                finished.push_back(sub);
            }
        }
    }
    for(const auto& sub : finished)
    {
        finishQuery(sub);
    }
}

void RelayPool::onMessage(const std::string& url, uint64_t generation,
                          const std::string& text)
{
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        Relay* relay = findLocked(url);
        if(!running || relay == nullptr || relay->generation != generation)
        {
            return;
        }
    }

    auto msg = parseRelayMessage(text);
    if(!msg.has_value())
    {
        spdlog::debug("Bad message from relay {}: {}", url,
                      errorMsg(msg.error()));
        return;
    }
    std::visit(Overloaded{
        [&](const relay_msg::Event& m)
        {
            handleEvent(url, m.subscription, m.event);
        },
        [&](const relay_msg::Eose& m)
        {
            handleEose(url, m.subscription);
        },
        [&](const relay_msg::Closed& m)
        {
            handleClosed(url, m.subscription, m.message);
        },
        [&](const relay_msg::Ok& m)
        {
            if(!m.accepted)
            {
                spdlog::warn("Relay {} rejected event {}: {}", url,
                             m.event_id, m.message);
            }
        },
        [&](const relay_msg::Notice& m)
        {
            spdlog::info("Notice from relay {}: {}", url, m.message);
        },
    }, *msg);
}

void RelayPool::handleEvent(const std::string& url, const std::string& sub,
                            const NativeEvent& event)
{
    bool is_query = false;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        auto q = queries.find(sub);
        if(q != queries.end())
        {
            is_query = true;
            if(q->second->results.contains(event.id))
            {
                return;
            }
        }
        else if(!subscriptions.contains(sub))
        {
            return;
        }
    }

    if(!event.verify())
    {
        spdlog::debug("Dropping event {} from {} with a bad signature",
                      event.id, url);
        return;
    }

    if(is_query)
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        auto q = queries.find(sub);
        if(q == queries.end())
        {
            return;
        }
        const auto& filters = q->second->filters;
        bool matches = std::any_of(filters.begin(), filters.end(),
                                   [&](const Filter& f)
                                   {
                                       return f.matches(event);
                                   });
        if(matches)
        {
            q->second->results.emplace(event.id, event);
        }
        return;
    }

    auto first_seen = dedup.markFirstSeen(event.id);
    if(!first_seen.has_value())
    {
        spdlog::error("Cannot record event {}: {}", event.id,
                      errorMsg(first_seen.error()));
        return;
    }
    if(!*first_seen)
    {
        return;
    }

    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        handler = on_event;
    }
    if(handler)
    {
        handler(url, event);
    }
}

void RelayPool::handleEose(const std::string& url, const std::string& sub)
{
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        auto q = queries.find(sub);
        if(q == queries.end())
        {
            return;
        }
        finished = q->second->waiting_on.erase(url) > 0 &&
            q->second->waiting_on.empty();
    }
    if(finished)
    {
        finishQuery(sub);
    }
}

void RelayPool::handleClosed(const std::string& url, const std::string& sub,
                             const std::string& message)
{
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        auto q = queries.find(sub);
        if(q != queries.end())
        {
            q->second->sent_to.erase(url);
            finished = q->second->waiting_on.erase(url) > 0 &&
                q->second->waiting_on.empty();
        }
        else if(subscriptions.contains(sub))
        {
            Relay* relay = findLocked(url);
            if(relay == nullptr || !relay->conn)
            {
                return;
            }
            spdlog::warn("Relay {} closed subscription {}: {}", url, sub,
                         message);
            relay->closed_subs.insert(sub);
            relay->state = RelayState::DEGRADED;
            relay->failures++;

            // Ask again after a backoff; the relay may have been
            // rate limiting.
            const uint64_t generation = relay->generation;
            relay->timer->expires_after(backoffDelay(relay->failures));
            relay->timer->async_wait(
                [this, url, generation](boost::system::error_code ec)
                {
                    if(ec)
                    {
                        return;
                    }
                    std::lock_guard<std::mutex> lock(pool_lock);
                    Relay* relay = findLocked(url);
                    if(!running || relay == nullptr ||
                       relay->generation != generation || !relay->conn)
                    {
                        return;
                    }
                    for(const auto& closed : relay->closed_subs)
                    {
                        auto it = subscriptions.find(closed);
                        if(it != subscriptions.end())
                        {
                            relay->conn->send(reqMessage(closed, it->second));
                        }
                    }
                    relay->closed_subs.clear();
                    relay->state = RelayState::SUBSCRIBED;
                });
        }
    }
    if(finished)
    {
        finishQuery(sub);
    }
}

void RelayPool::subscribe(const std::string& id, std::vector<Filter> filters)
{
    std::lock_guard<std::mutex> lock(pool_lock);
    subscriptions[id] = filters;
    for(auto& [url, relay] : relays_by_url)
    {
        if(relay.role == RelayRole::CONTENT && relay.conn &&
           (relay.state == RelayState::SUBSCRIBED ||
                          relay.state == RelayState::DEGRADED))
        {
            relay.conn->send(reqMessage(id, filters));
        }
    }
}

void RelayPool::unsubscribe(const std::string& id)
{
    std::lock_guard<std::mutex> lock(pool_lock);
    if(subscriptions.erase(id) == 0)
    {
        return;
    }
    for(auto& [url, relay] : relays_by_url)
    {
        relay.closed_subs.erase(id);
        if(relay.role == RelayRole::CONTENT && relay.conn &&
           (relay.state == RelayState::SUBSCRIBED ||
                          relay.state == RelayState::DEGRADED))
        {
            relay.conn->send(closeMessage(id));
        }
    }
}

std::vector<std::string> RelayPool::publish(const NativeEvent& event)
{
    const std::string msg = eventMessage(event);
    const bool profile = event.kind == kind::METADATA;
    std::vector<std::string> sent_to;
    std::lock_guard<std::mutex> lock(pool_lock);
    for(auto& [url, relay] : relays_by_url)
    {
        if(relay.role != RelayRole::CONTENT && !profile)
        {
            continue;
        }
        if(relay.state == RelayState::SUBSCRIBED && relay.conn)
        {
            relay.conn->send(msg);
            sent_to.push_back(url);
        }
    }
    if(sent_to.empty())
    {
        spdlog::warn("No relay available to publish {}", event.id);
    }
    return sent_to;
}

void RelayPool::query(std::vector<Filter> filters,
                      std::chrono::milliseconds timeout, QueryHandler done)
{
    const bool profile = profileOnly(filters);
    std::unique_lock<std::mutex> lock(pool_lock);
    auto q = std::make_unique<Query>();
    for(auto& [url, relay] : relays_by_url)
    {
        if(relay.role != RelayRole::CONTENT && !profile)
        {
            continue;
        }
        if(relay.conn && (relay.state == RelayState::SUBSCRIBED ||
                          relay.state == RelayState::DEGRADED))
        {
            q->sent_to.insert(url);
        }
    }
    if(!running || q->sent_to.empty())
    {
        lock.unlock();
        net::post(executor, [done = std::move(done)]()
        {
            done({});
        });
        return;
    }

    const std::string sub = std::format("q{}", next_query++);
    const std::string req = reqMessage(sub, filters);
    for(const auto& url : q->sent_to)
    {
        relays_by_url[url].conn->send(req);
    }
    q->waiting_on = q->sent_to;
    q->filters = std::move(filters);
    q->done = std::move(done);
    q->timer = std::make_unique<net::steady_timer>(executor);
    q->timer->expires_after(timeout);
    q->timer->async_wait([this, sub](boost::system::error_code ec)
    {
        if(ec)
        {
            return;
        }
        finishQuery(sub);
    });
    queries.emplace(sub, std::move(q));
}

std::unique_ptr<RelayPool::Query>
RelayPool::takeQueryLocked(const std::string& sub)
{
    auto it = queries.find(sub);
    if(it == queries.end())
    {
        return nullptr;
    }
    std::unique_ptr<Query> q = std::move(it->second);
    queries.erase(it);
    for(const auto& url : q->sent_to)
    {
        Relay* relay = findLocked(url);
        if(relay != nullptr && relay->conn)
        {
            relay->conn->send(closeMessage(sub));
        }
    }
    return q;
}

void RelayPool::finishQuery(const std::string& sub)
{
    std::unique_ptr<Query> q;
    {
        std::lock_guard<std::mutex> lock(pool_lock);
        q = takeQueryLocked(sub);
    }
    if(!q)
    {
        return;
    }
    q->timer->cancel();
    std::vector<NativeEvent> results;
    for(auto& [id, event] : q->results)
    {
        results.push_back(std::move(event));
    }
    std::sort(results.begin(), results.end(),
              [](const NativeEvent& a, const NativeEvent& b)
              {
                  return a.created_at > b.created_at;
              });
    q->done(std::move(results));
}

std::vector<NativeEvent>
RelayPool::querySync(std::vector<Filter> filters,
                     std::chrono::milliseconds timeout)
{
    auto promise = std::make_shared<std::promise<std::vector<NativeEvent>>>();
    auto future = promise->get_future();
    query(std::move(filters), timeout,
          [promise](std::vector<NativeEvent> events)
          {
              promise->set_value(std::move(events));
          });
    // The timer normally fires first; this only guards against an
    // executor that is not running.
    if(future.wait_for(timeout + std::chrono::seconds(1)) !=
       std::future_status::ready)
    {
        spdlog::warn("Relay query did not finish in time");
        return {};
    }
    return future.get();
}

RelayState RelayPool::state(const std::string& url) const
{
    std::lock_guard<std::mutex> lock(pool_lock);
    auto it = relays_by_url.find(url);
    if(it == relays_by_url.end())
    {
        return RelayState::DISCONNECTED;
    }
    return it->second.state;
}

std::vector<std::string> RelayPool::relays() const
{
    std::lock_guard<std::mutex> lock(pool_lock);
    std::vector<std::string> urls;
    for(const auto& [url, relay] : relays_by_url)
    {
        if(relay.role == RelayRole::CONTENT)
        {
            urls.push_back(url);
        }
    }
    return urls;
}
