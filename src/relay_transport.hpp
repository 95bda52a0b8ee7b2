#pragma once

#include <functional>
#include <memory>
#include <string>

#include "error.hpp"

// Callbacks of one relay connection. They run on the transport's
// executor, one at a time per connection.
struct RelayCallbacks
{
    std::function<void()> on_open;
    std::function<void(const std::string& text)> on_message;
    // Called once when the connection fails or the relay closes it.
    // Not called after close().
    std::function<void(const std::string& reason)> on_close;
};

// A streaming connection to one relay.
class RelayConnection
{
public:
    virtual ~RelayConnection() = default;
    // Queues a text frame. Write failures surface through on_close.
    virtual void send(std::string text) = 0;
    // Closes the connection and drops the callbacks.
    virtual void close() = 0;
};

class RelayTransportInterface
{
public:
    virtual ~RelayTransportInterface() = default;
    // Starts connecting to a ws:// or wss:// URL. INVALID_INPUT if the
    // URL cannot be used.
    virtual E<std::shared_ptr<RelayConnection>>
    connect(const std::string& url, RelayCallbacks callbacks) = 0;
};
