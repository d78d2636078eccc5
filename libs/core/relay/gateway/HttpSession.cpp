#include "HttpSession.hpp"
#include "RelayLogging.hpp"
#include "relay/gateway/Gateway.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <chrono>
#include <string>

namespace {

constexpr auto kRequestTimeout = std::chrono::seconds(30);

std::string toStd(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

} // namespace

HttpSession::HttpSession(tcp::socket&& socket, Gateway& gateway)
    : stream_(std::move(socket))
    , gateway_(gateway)
{}

void HttpSession::run() {
    net::dispatch(stream_.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    req_ = {};
    stream_.expires_after(kRequestTimeout);
    http::async_read(stream_, buffer_, req_,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        doShutdown();
        return;
    }
    if (ec) {
        if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
            LOG_D(FlowRelay::LogCat::kGateway, "http read: {}", ec.message());
        }
        return;
    }

    const auto target = toStd(req_.target());

    if (beast::websocket::is_upgrade(req_)) {
        auto channel = gateway_.routes().resolve(target);
        if (!channel) {
            frLog_Gateway("Upgrade refused, no route for {}", target);
            http::response<http::string_body> res{http::status::not_found, req_.version()};
            res.set(http::field::server, "flowrelay");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = R"({"detail":"Not Found"})";
            res.prepare_payload();
            sendResponse(std::move(res));
            return;
        }
        gateway_.openStream(stream_.release_socket(), std::move(*channel), std::move(req_));
        return;
    }

    const auto reply = gateway_.api().handle(HttpRequest{toStd(req_.method_string()), target});

    http::response<http::string_body> res{static_cast<http::status>(reply.status), req_.version()};
    res.set(http::field::server, "flowrelay");
    res.set(http::field::content_type, reply.contentType);
    res.keep_alive(req_.keep_alive());
    res.body() = reply.body;
    res.prepare_payload();
    sendResponse(std::move(res));
}

void HttpSession::sendResponse(http::response<http::string_body> res) {
    res_ = std::make_shared<http::response<http::string_body>>(std::move(res));
    const bool keepAlive = res_->keep_alive();
    http::async_write(stream_, *res_,
        beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), keepAlive));
}

void HttpSession::onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
    res_.reset();
    if (ec) {
        LOG_D(FlowRelay::LogCat::kGateway, "http write: {}", ec.message());
        return;
    }
    if (!keepAlive) {
        doShutdown();
        return;
    }
    doRead();
}

void HttpSession::doShutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        LOG_D(FlowRelay::LogCat::kGateway, "http shutdown: {}", ec.message());
    }
}
