#pragma once

#include <deque>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include "relay_transport.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// One websocket client connection, plain or TLS. All state lives on
// the connection's strand.
class BeastRelayConnection
    : public RelayConnection,
      public std::enable_shared_from_this<BeastRelayConnection>
{
public:
    BeastRelayConnection(net::any_io_executor ex, ssl::context& ssl_ctx,
                         std::string host, std::string port,
                         std::string target, bool tls,
                         RelayCallbacks callbacks);
    BeastRelayConnection(const BeastRelayConnection&) = delete;
    BeastRelayConnection& operator=(const BeastRelayConnection&) = delete;

    void start();
    void send(std::string text) override;
    void close() override;

private:
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    using PlainStream = websocket::stream<beast::tcp_stream>;

    template<typename F>
    void withStream(F&& f)
    {
        if(tls_ws)
        {
            f(*tls_ws);
        }
        else
        {
            f(*plain_ws);
        }
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec);
    void onTlsHandshake(beast::error_code ec);
    void startWebsocketHandshake();
    void onHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes_transferred);
    void fail(const std::string& what, beast::error_code ec);

    net::strand<net::any_io_executor> strand;
    tcp::resolver resolver;
    std::unique_ptr<TlsStream> tls_ws;
    std::unique_ptr<PlainStream> plain_ws;
    std::string host;
    std::string port;
    std::string target;
    RelayCallbacks callbacks;

    beast::flat_buffer read_buffer;
    std::deque<std::string> write_queue;
    bool is_writing = false;
    bool is_open = false;
    bool closing = false;
};

class BeastRelayTransport : public RelayTransportInterface
{
public:
    explicit BeastRelayTransport(net::any_io_executor ex);

    E<std::shared_ptr<RelayConnection>>
    connect(const std::string& url, RelayCallbacks callbacks) override;

private:
    net::any_io_executor executor;
    ssl::context ssl_ctx;
};
