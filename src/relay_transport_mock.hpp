#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "relay_transport.hpp"

// Records what is sent on a connection. Tests fire the callbacks.
class RelayConnectionMock : public RelayConnection
{
public:
    explicit RelayConnectionMock(RelayCallbacks cb) : callbacks(std::move(cb)) {}

    void send(std::string text) override
    {
        std::lock_guard<std::mutex> lock(sent_lock);
        sent.push_back(std::move(text));
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(sent_lock);
        closed = true;
    }

    std::vector<std::string> sentMessages() const
    {
        std::lock_guard<std::mutex> lock(sent_lock);
        return sent;
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(sent_lock);
        return closed;
    }

    RelayCallbacks callbacks;

private:
    mutable std::mutex sent_lock;
    std::vector<std::string> sent;
    bool closed = false;
};

// Scripted relay transport. Every connect() makes a new mock
// connection; tests open, feed and drop them by relay URL.
class RelayTransportMock : public RelayTransportInterface
{
public:
    E<std::shared_ptr<RelayConnection>>
    connect(const std::string& url, RelayCallbacks callbacks) override
    {
        auto conn = std::make_shared<RelayConnectionMock>(std::move(callbacks));
        std::lock_guard<std::mutex> lock(conns_lock);
        connections[url].push_back(conn);
        return conn;
    }

    // Most recent connection to a relay, or null.
    std::shared_ptr<RelayConnectionMock> latest(const std::string& url) const
    {
        std::lock_guard<std::mutex> lock(conns_lock);
        auto it = connections.find(url);
        if(it == connections.end() || it->second.empty())
        {
            return nullptr;
        }
        return it->second.back();
    }

    size_t connectCount(const std::string& url) const
    {
        std::lock_guard<std::mutex> lock(conns_lock);
        auto it = connections.find(url);
        return it == connections.end() ? 0 : it->second.size();
    }

    void open(const std::string& url) { latest(url)->callbacks.on_open(); }
    void receive(const std::string& url, const std::string& text)
    {
        latest(url)->callbacks.on_message(text);
    }
    void drop(const std::string& url, const std::string& reason = "dropped")
    {
        latest(url)->callbacks.on_close(reason);
    }

private:
    mutable std::mutex conns_lock;
    std::map<std::string, std::vector<std::shared_ptr<RelayConnectionMock>>>
        connections;
};
