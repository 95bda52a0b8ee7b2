#include "beast_relay_transport.hpp"

#include <chrono>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <mw/url.hpp>
#include <spdlog/spdlog.h>

BeastRelayConnection::BeastRelayConnection(
    net::any_io_executor ex, ssl::context& ssl_ctx, std::string host_name,
    std::string port_str, std::string target_path, bool tls,
    RelayCallbacks cb)
    : strand(net::make_strand(ex)), resolver(strand),
      host(std::move(host_name)), port(std::move(port_str)),
      target(std::move(target_path)), callbacks(std::move(cb))
{
    if(tls)
    {
        tls_ws = std::make_unique<TlsStream>(strand, ssl_ctx);
    }
    else
    {
        plain_ws = std::make_unique<PlainStream>(strand);
    }
}

void BeastRelayConnection::start()
{
    resolver.async_resolve(
        host, port,
        [self = shared_from_this()](beast::error_code ec,
                                    tcp::resolver::results_type results)
        {
            self->onResolve(ec, std::move(results));
        });
}

void BeastRelayConnection::onResolve(beast::error_code ec,
                                     tcp::resolver::results_type results)
{
    if(ec)
    {
        fail("resolve", ec);
        return;
    }
    withStream([&](auto& ws)
    {
        beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(ws).async_connect(
            results,
            [self = shared_from_this()](beast::error_code ec,
                                        const tcp::endpoint&)
            {
                self->onConnect(ec);
            });
    });
}

void BeastRelayConnection::onConnect(beast::error_code ec)
{
    if(ec)
    {
        fail("connect", ec);
        return;
    }
    if(!tls_ws)
    {
        startWebsocketHandshake();
        return;
    }

    // SNI, so virtual-hosted relays present the right certificate.
    if(!SSL_set_tlsext_host_name(tls_ws->next_layer().native_handle(),
                                 host.c_str()))
    {
        fail("sni", beast::error_code(static_cast<int>(::ERR_get_error()),
                                      net::error::get_ssl_category()));
        return;
    }
    tls_ws->next_layer().set_verify_callback(ssl::host_name_verification(host));
    beast::get_lowest_layer(*tls_ws).expires_after(std::chrono::seconds(30));
    tls_ws->next_layer().async_handshake(
        ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec)
        {
            self->onTlsHandshake(ec);
        });
}

void BeastRelayConnection::onTlsHandshake(beast::error_code ec)
{
    if(ec)
    {
        fail("tls handshake", ec);
        return;
    }
    startWebsocketHandshake();
}

void BeastRelayConnection::startWebsocketHandshake()
{
    withStream([&](auto& ws)
    {
        // The websocket layer has its own timeouts.
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req)
            {
                req.set(beast::http::field::user_agent, "nostap");
            }));
        ws.read_message_max(4 * 1024 * 1024);
        std::string host_header = host;
        if(port != "80" && port != "443")
        {
            host_header += ":" + port;
        }
        ws.async_handshake(host_header, target,
                           [self = shared_from_this()](beast::error_code ec)
                           {
                               self->onHandshake(ec);
                           });
    });
}

void BeastRelayConnection::onHandshake(beast::error_code ec)
{
    if(ec)
    {
        fail("handshake", ec);
        return;
    }
    is_open = true;
    if(callbacks.on_open)
    {
        callbacks.on_open();
    }
    doRead();
    doWrite();
}

void BeastRelayConnection::doRead()
{
    withStream([&](auto& ws)
    {
        ws.async_read(read_buffer,
                      [self = shared_from_this()](beast::error_code ec,
                                                  std::size_t bytes)
                      {
                          self->onRead(ec, bytes);
                      });
    });
}

void BeastRelayConnection::onRead(beast::error_code ec,
                                  std::size_t bytes_transferred)
{
    if(ec)
    {
        fail("read", ec);
        return;
    }
    std::string message = beast::buffers_to_string(
        beast::buffers_prefix(bytes_transferred, read_buffer.data()));
    read_buffer.consume(bytes_transferred);
    if(callbacks.on_message)
    {
        callbacks.on_message(message);
    }
    doRead();
}

void BeastRelayConnection::send(std::string text)
{
    net::post(strand, [self = shared_from_this(), text = std::move(text)]()
    {
        if(self->closing)
        {
            return;
        }
        self->write_queue.push_back(std::move(text));
        self->doWrite();
    });
}

void BeastRelayConnection::doWrite()
{
    if(!is_open || is_writing || write_queue.empty())
    {
        return;
    }
    is_writing = true;
    withStream([&](auto& ws)
    {
        ws.text(true);
        ws.async_write(net::buffer(write_queue.front()),
                       [self = shared_from_this()](beast::error_code ec,
                                                   std::size_t bytes)
                       {
                           self->onWrite(ec, bytes);
                       });
    });
}

void BeastRelayConnection::onWrite(beast::error_code ec, std::size_t)
{
    is_writing = false;
    if(ec)
    {
        fail("write", ec);
        return;
    }
    write_queue.pop_front();
    doWrite();
}

void BeastRelayConnection::close()
{
    net::post(strand, [self = shared_from_this()]()
    {
        if(self->closing)
        {
            return;
        }
        self->closing = true;
        self->callbacks = {};
        self->resolver.cancel();
        if(!self->is_open)
        {
            self->withStream([](auto& ws)
            {
                beast::get_lowest_layer(ws).close();
            });
            return;
        }
        self->withStream([&](auto& ws)
        {
            ws.async_close(websocket::close_code::normal,
                           [self](beast::error_code ec)
                           {
                               if(ec)
                               {
                                   spdlog::debug("Relay close on {}: {}",
                                                 self->host, ec.message());
                               }
                           });
        });
    });
}

void BeastRelayConnection::fail(const std::string& what, beast::error_code ec)
{
    if(closing)
    {
        return;
    }
    closing = true;
    is_open = false;
    std::string reason = what + ": " + ec.message();
    auto on_close = std::move(callbacks.on_close);
    callbacks = {};
    if(on_close)
    {
        on_close(reason);
    }
}

BeastRelayTransport::BeastRelayTransport(net::any_io_executor ex)
    : executor(std::move(ex)), ssl_ctx(ssl::context::tls_client)
{
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);
}

E<std::shared_ptr<RelayConnection>>
BeastRelayTransport::connect(const std::string& url, RelayCallbacks callbacks)
{
    bool tls;
    if(url.starts_with("wss://"))
    {
        tls = true;
    }
    else if(url.starts_with("ws://"))
    {
        tls = false;
    }
    else
    {
        return std::unexpected(invalidInput("Not a websocket URL: " + url));
    }
    auto parsed = mw::URL::fromStr(url);
    if(!parsed.has_value() || parsed->host().empty())
    {
        return std::unexpected(invalidInput("Invalid relay URL: " + url));
    }
    std::string port = parsed->port();
    if(port.empty())
    {
        port = tls ? "443" : "80";
    }
    std::string target = parsed->path();
    if(target.empty())
    {
        target = "/";
    }
    if(!parsed->query().empty())
    {
        target += "?" + parsed->query();
    }

    auto conn = std::make_shared<BeastRelayConnection>(
        executor, ssl_ctx, parsed->host(), port, target, tls,
        std::move(callbacks));
    conn->start();
    return conn;
}
