#pragma once
#include <memory>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Gateway;

// Plain HTTP connection. Serves the status routes with keep-alive; an upgrade
// request on a channel route hands the socket over to a DownstreamSession.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Gateway& gateway);

    void run();

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void sendResponse(http::response<http::string_body> res);
    void onWrite(bool keepAlive, beast::error_code ec, std::size_t bytes);
    void doShutdown();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
    Gateway& gateway_;
};
