#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// TLS WebSocket client. Handlers hold shared_from_this(), so the owner may drop
// its pointer at any time; pending operations finish against a live object.
class BeastWsTransport : public WsTransport
                       , public std::enable_shared_from_this<BeastWsTransport> {
public:
    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx,
                     std::chrono::milliseconds connectTimeout)
        : strand_(net::make_strand(ioc))
        , resolver_(strand_)
        , ws_(strand_, sslCtx)
        , connectTimeout_(connectTimeout)
    {}

    void connect(std::string host, std::string port, std::string target) override;
    void close() override;
    void send(std::string msg) override;
    void ping() override;

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onStatus(StatusCb cb) override { onStatus_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }
    void onPong(PongCb cb) override { onPong_ = std::move(cb); }

private:
    struct Outbound {
        enum class Kind { Text, Ping, Close };
        Kind kind;
        std::string payload;
    };

    // Callbacks
    MessageCb onMessage_;
    StatusCb  onStatus_;
    ErrorCb   onError_;
    PongCb    onPong_;

    // Beast state
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    websocket::response_type upgradeResponse_;
    beast::flat_buffer buf_;
    std::deque<Outbound> writeQueue_;
    std::chrono::milliseconds connectTimeout_;

    // State
    std::string host_;
    std::string port_;
    std::string target_;
    bool open_ = false;
    bool closing_ = false;
    bool down_ = false;

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(beast::error_code ec);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void enqueue(Outbound out);
    void doWrite();
    void onWrite(beast::error_code ec);
    void fail(beast::error_code ec, const char* stage, unsigned httpStatus = 0);
    void reportDown();
};
