#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include "relay/config/RelayConfig.hpp"
#include "relay/gateway/SendQueue.hpp"
#include "relay/registry/AttachmentScope.hpp"
#include "relay/registry/DownstreamConnection.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One downstream WebSocket client, bound to one channel for its whole life.
// The attachment lives as long as the read loop: any way the socket ends
// (client close, error, idle timeout, server close) releases it.
class DownstreamSession : public DownstreamConnection
                        , public std::enable_shared_from_this<DownstreamSession> {
public:
    using FinishedCb = std::function<void(ConnectionId)>;

    // registry == nullptr: streaming disabled, the upgrade is accepted then closed with 1011.
    DownstreamSession(tcp::socket&& socket,
                      ChannelRegistry* registry,
                      std::string channel,
                      const GatewayConfig& cfg,
                      FinishedCb onFinished);
    ~DownstreamSession() override;

    void run(http::request<http::string_body> upgrade);

    ConnectionId id() const override { return id_; }
    bool deliver(std::shared_ptr<const std::string> frame) override;
    void close(CloseCause cause) override;

    const std::string& channel() const { return channel_; }

    DownstreamSession(const DownstreamSession&) = delete;
    DownstreamSession& operator=(const DownstreamSession&) = delete;

private:
    void onAccept(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite(const SendQueue::Frame& frame);
    void onWrite(beast::error_code ec, std::size_t bytes);
    void doClose(CloseCause cause);
    void finish(const char* why);

    static websocket::close_reason reasonFor(CloseCause cause);

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    ChannelRegistry* registry_;
    const std::string channel_;
    const ConnectionId id_;
    std::chrono::milliseconds idleTimeout_;
    FinishedCb onFinished_;
    SendQueue queue_;

    // Strand-confined
    std::optional<AttachmentScope> attachment_;
    bool closing_ = false;
    bool finished_ = false;

    std::atomic<bool> open_{false};
};
