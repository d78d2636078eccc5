#include "DownstreamSession.hpp"
#include "RelayLogging.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <utility>

namespace {
std::atomic<ConnectionId> g_nextId{1};
}

DownstreamSession::DownstreamSession(tcp::socket&& socket,
                                     ChannelRegistry* registry,
                                     std::string channel,
                                     const GatewayConfig& cfg,
                                     FinishedCb onFinished)
    : ws_(std::move(socket))
    , registry_(registry)
    , channel_(std::move(channel))
    , id_(g_nextId.fetch_add(1))
    , idleTimeout_(cfg.idleTimeout)
    , onFinished_(std::move(onFinished))
    , queue_(SendQueue::Config{cfg.sendQueueMaxMessages, cfg.sendQueueMaxBytes, cfg.stallTimeout},
             SendQueue::Callbacks{[this](const SendQueue::Frame& frame) {
                 net::post(ws_.get_executor(), [self = shared_from_this(), frame] {
                     self->doWrite(frame);
                 });
             }})
{}

DownstreamSession::~DownstreamSession() {
    LOG_T(FlowRelay::LogCat::kGateway, "session {} destroyed", id_);
}

void DownstreamSession::run(http::request<http::string_body> upgrade) {
    net::dispatch(ws_.get_executor(),
        [self = shared_from_this(), req = std::move(upgrade)]() mutable {
            // the HTTP read deadline no longer applies; the websocket has its own timeouts
            beast::get_lowest_layer(self->ws_).expires_never();

            auto opt = websocket::stream_base::timeout::suggested(beast::role_type::server);
            opt.idle_timeout = self->idleTimeout_;
            opt.keep_alive_pings = true;
            self->ws_.set_option(opt);
            self->ws_.set_option(websocket::stream_base::decorator(
                [](websocket::response_type& res) {
                    res.set(http::field::server, "flowrelay");
                }));
            self->ws_.read_message_max(64 * 1024);

            self->ws_.async_accept(req,
                beast::bind_front_handler(&DownstreamSession::onAccept, self));
        });
}

void DownstreamSession::onAccept(beast::error_code ec) {
    if (ec) {
        frLog_Warning(Gateway, "Session {} upgrade failed: {}", id_, ec.message());
        finish("upgrade failed");
        return;
    }
    if (closing_ || finished_) return;

    if (!registry_) {
        frLog_Gateway("Session {} on {} refused: streaming disabled", id_, channel_);
        doClose(CloseCause::StreamingDisabled);
        return;
    }

    open_ = true;
    attachment_.emplace(*registry_, shared_from_this(), channel_);
    frLog_Gateway("Session {} streaming {}", id_, channel_);
    doRead();
}

void DownstreamSession::doRead() {
    ws_.async_read(buffer_,
        beast::bind_front_handler(&DownstreamSession::onRead, shared_from_this()));
}

void DownstreamSession::onRead(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        finish(ec == websocket::error::closed ? "client closed" : "read failed");
        if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
            LOG_D(FlowRelay::LogCat::kGateway, "session {} read error: {}", id_, ec.message());
        }
        return;
    }
    // Clients have nothing to say on a channel stream
    LOG_D(FlowRelay::LogCat::kGateway, "session {} ignoring {} byte client message", id_, bytes);
    buffer_.consume(buffer_.size());
    doRead();
}

bool DownstreamSession::deliver(std::shared_ptr<const std::string> frame) {
    if (!open_.load()) return false;
    return queue_.enqueue(frame) == SendQueue::Result::Accepted;
}

void DownstreamSession::doWrite(const SendQueue::Frame& frame) {
    if (closing_ || finished_) return;
    ws_.text(true);
    ws_.async_write(net::buffer(*frame),
        [self = shared_from_this(), frame](beast::error_code ec, std::size_t bytes) {
            self->onWrite(ec, bytes);
        });
}

void DownstreamSession::onWrite(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            frLog_Warning(Gateway, "Session {} write failed: {}", id_, ec.message());
        }
        finish("write failed");
        return;
    }
    frLog_DataN(1000, "session {} wrote {} bytes", id_, bytes);
    queue_.onWriteComplete();
}

void DownstreamSession::close(CloseCause cause) {
    net::post(ws_.get_executor(), [self = shared_from_this(), cause] {
        self->doClose(cause);
    });
}

void DownstreamSession::doClose(CloseCause cause) {
    if (closing_ || finished_) return;
    closing_ = true;
    open_ = false;
    queue_.shutdown();
    attachment_.reset();

    const auto reason = reasonFor(cause);
    frLog_Gateway("Closing session {} on {} ({} {})", id_, channel_,
                  static_cast<unsigned>(reason.code), std::string(reason.reason.data(), reason.reason.size()));

    ws_.async_close(reason, [self = shared_from_this()](beast::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            LOG_D(FlowRelay::LogCat::kGateway, "session {} close handshake: {}", self->id_, ec.message());
        }
        self->finish("closed by server");
    });
}

void DownstreamSession::finish(const char* why) {
    if (finished_) return;
    finished_ = true;
    open_ = false;
    queue_.shutdown();
    attachment_.reset();
    beast::get_lowest_layer(ws_).close();

    frLog_Gateway("Session {} on {} ended: {}", id_, channel_, why);
    if (onFinished_) onFinished_(id_);
}

websocket::close_reason DownstreamSession::reasonFor(CloseCause cause) {
    switch (cause) {
        case CloseCause::DeliveryFailed:
            return {websocket::close_code::policy_error, "backpressure"};
        case CloseCause::Shutdown:
            return {websocket::close_code::going_away, "server shutdown"};
        case CloseCause::StreamingDisabled:
            return {websocket::close_code::internal_error, "WebSocket streaming not available"};
    }
    return {websocket::close_code::normal};
}
