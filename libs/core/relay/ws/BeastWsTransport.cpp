#include "BeastWsTransport.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/beast/version.hpp>
#include <string_view>


void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    net::post(strand_, [self = shared_from_this(), h = std::move(host), p = std::move(port), t = std::move(target)]() mutable {
        self->host_ = std::move(h);
        self->port_ = std::move(p);
        self->target_ = std::move(t);
        self->resolver_.async_resolve(self->host_, self->port_,
            beast::bind_front_handler(&BeastWsTransport::onResolve, self));
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [self = shared_from_this()]{
        if (self->down_ || self->closing_) return;
        if (self->open_) {
            self->enqueue(Outbound{Outbound::Kind::Close, {}});
            self->closing_ = true;
            return;
        }
        // still resolving/connecting/handshaking: abort in place
        self->closing_ = true;
        self->resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(self->ws_).socket().close(ignored);
        self->reportDown();
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [self = shared_from_this(), m = std::move(msg)]() mutable {
        self->enqueue(Outbound{Outbound::Kind::Text, std::move(m)});
    });
}

void BeastWsTransport::ping() {
    net::post(strand_, [self = shared_from_this()]{
        self->enqueue(Outbound{Outbound::Kind::Ping, {}});
    });
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec, "resolve");
    beast::get_lowest_layer(ws_).expires_after(connectTimeout_);
    beast::get_lowest_layer(ws_).async_connect(results,
        beast::bind_front_handler(&BeastWsTransport::onConnect, shared_from_this()));
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return fail(ec, "connect");
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail(ssl_ec, "sni");
    }
    if (!SSL_set1_host(ws_.next_layer().native_handle(), host_.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail(ssl_ec, "hostname");
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    beast::get_lowest_layer(ws_).expires_after(connectTimeout_);
    ws_.next_layer().async_handshake(ssl::stream_base::client,
        beast::bind_front_handler(&BeastWsTransport::onSslHandshake, shared_from_this()));
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (ec) return fail(ec, "tls handshake");
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "flowrelay/" BOOST_BEAST_VERSION_STRING);
    }));
    // pongs surface here while a read is pending
    ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong && onPong_) onPong_();
    });
    std::string hostHeader = (port_ == "443") ? host_ : host_ + ":" + port_;
    ws_.async_handshake(upgradeResponse_, hostHeader, target_,
        beast::bind_front_handler(&BeastWsTransport::onWsHandshake, shared_from_this()));
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (ec) {
        const unsigned status = (ec == websocket::error::upgrade_declined)
            ? upgradeResponse_.result_int() : 0u;
        return fail(ec, "websocket handshake", status);
    }
    open_ = true;
    if (onStatus_) onStatus_(true);
    doRead();
    if (!writeQueue_.empty()) doWrite();
}

void BeastWsTransport::doRead() {
    ws_.async_read(buf_, beast::bind_front_handler(&BeastWsTransport::onRead, shared_from_this()));
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        if (closing_) return reportDown();
        return fail(ec, "read");
    }

    if (onMessage_) {
        auto b = buf_.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        buf_.consume(buf_.size());
        onMessage_(std::move(payload));
    } else {
        buf_.consume(buf_.size());
    }

    doRead();
}

void BeastWsTransport::enqueue(Outbound out) {
    if (down_) return;
    if (closing_ && out.kind != Outbound::Kind::Close) return;
    writeQueue_.push_back(std::move(out));
    if (open_ && writeQueue_.size() == 1) {
        doWrite();
    }
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty() || down_) return;
    auto self = shared_from_this();
    auto& front = writeQueue_.front();
    switch (front.kind) {
    case Outbound::Kind::Text:
        ws_.async_write(net::buffer(front.payload), [self](beast::error_code ec, std::size_t){
            self->onWrite(ec);
        });
        break;
    case Outbound::Kind::Ping:
        ws_.async_ping({}, [self](beast::error_code ec){ self->onWrite(ec); });
        break;
    case Outbound::Kind::Close:
        ws_.async_close(websocket::close_code::normal, [self](beast::error_code){
            self->reportDown();
        });
        break;
    }
}

void BeastWsTransport::onWrite(beast::error_code ec) {
    if (ec) return fail(ec, "write");
    writeQueue_.pop_front();
    if (!writeQueue_.empty()) doWrite();
}

void BeastWsTransport::fail(beast::error_code ec, const char* stage, unsigned httpStatus) {
    if (down_) return;
    if (closing_ && ec == net::error::operation_aborted) return reportDown();
    if (onError_) {
        TransportError err;
        err.message = std::string(stage) + ": " + ec.message();
        err.httpStatus = httpStatus;
        onError_(err);
    }
    reportDown();
}

void BeastWsTransport::reportDown() {
    if (down_) return;
    down_ = true;
    open_ = false;
    if (onStatus_) onStatus_(false);
}
