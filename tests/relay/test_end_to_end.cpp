/*
FlowRelay — End-to-End Tests
Role: Drive the whole relay over real loopback sockets
Testing Strategy: RelayService on an ephemeral port with a scripted upstream transport; Beast
                  WebSocket/HTTP clients on their own io_context, every read bounded by run_for.
Coverage: envelope delivery, shared upstream subscription, unsubscribe on last leave,
          unknown routes, status routes, operator reconnect, permanent upstream failure,
          disabled mode, shutdown close code, upgrades and reconnects refused while stopping
*/
#include <gtest/gtest.h>
#include "relay/RelayService.hpp"
#include "fixtures/mock_transport.hpp"
#include "fixtures/provider_frames.hpp"
#include "fixtures/wait.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <optional>
#include <thread>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using namespace std::chrono_literals;
using fixtures::waitFor;

namespace {

tcp::endpoint loopback(std::uint16_t port) {
    return {net::ip::make_address("127.0.0.1"), port};
}

// Minimal downstream consumer. Reads run on a private io_context with a deadline.
class WsClient {
public:
    WsClient(std::uint16_t port, const std::string& target) : ws_(ioc_) {
        ws_.next_layer().connect(loopback(port));
        ws_.handshake("127.0.0.1:" + std::to_string(port), target);
    }

    ~WsClient() {
        beast::error_code ec;
        ws_.next_layer().close(ec);
    }

    // Next text frame, or nullopt on close/error/timeout (see lastError()).
    std::optional<std::string> read(std::chrono::milliseconds timeout = 3000ms) {
        beast::flat_buffer buffer;
        bool done = false;
        beast::error_code result;
        ws_.async_read(buffer, [&](beast::error_code ec, std::size_t) {
            result = ec;
            done = true;
        });
        ioc_.restart();
        ioc_.run_for(timeout);
        if (!done) {
            beast::error_code ignored;
            ws_.next_layer().close(ignored);
            ioc_.restart();
            ioc_.run_for(1s);
            lastError_ = net::error::timed_out;
            return std::nullopt;
        }
        if (result) {
            lastError_ = result;
            return std::nullopt;
        }
        return beast::buffers_to_string(buffer.data());
    }

    void send(const std::string& text) { ws_.write(net::buffer(text)); }

    void close() { ws_.close(websocket::close_code::normal); }

    beast::error_code lastError() const { return lastError_; }
    const websocket::close_reason& reason() const { return ws_.reason(); }

private:
    net::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
    beast::error_code lastError_;
};

// One request/response on an open connection; the connection stays usable (keep-alive).
http::response<http::string_body> exchange(beast::tcp_stream& stream, http::verb verb, const std::string& target) {
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(true);
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return res;
}

http::response<http::string_body> request(std::uint16_t port, http::verb verb, const std::string& target) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(loopback(port));
    auto res = exchange(stream, verb, target);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

RelayConfig relayConfig(bool withToken) {
    RelayConfig cfg;
    cfg.upstream.host = "mock.local";
    if (withToken) cfg.upstream.token = "e2e-token-0001";
    cfg.upstream.baseDelay = 10ms;
    cfg.upstream.maxDelay = 40ms;
    cfg.upstream.jitter = 0.0;
    cfg.upstream.connectTimeout = 2s;
    cfg.gateway.address = "127.0.0.1";
    cfg.gateway.port = 0;
    cfg.gateway.threads = 2;
    cfg.shutdownGrace = 1000ms;
    return cfg;
}

}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        relay = std::make_unique<RelayService>(relayConfig(true), upstream.factory());
        relay->start();
        ASSERT_NE(relay->port(), 0);
    }

    void TearDown() override { relay.reset(); }

    std::uint16_t port() const { return relay->port(); }

    MockUpstream upstream;   // outlives the relay
    std::unique_ptr<RelayService> relay;
};

// =============================================================================
// Streaming
// =============================================================================

TEST_F(EndToEndTest, ProviderFrameReachesClientInEnvelope) {
    WsClient client(port(), "/api/stream/ws/flow");
    ASSERT_TRUE(waitFor([&] { return upstream.joins("flow-alerts") == 1; }));

    client.send("client chatter is ignored");
    upstream.inject(fixtures::flowAlertFrame("TSLA"));

    auto text = client.read();
    ASSERT_TRUE(text) << client.lastError().message();
    auto j = nlohmann::json::parse(*text);
    EXPECT_EQ(j["channel"], "flow-alerts");
    EXPECT_EQ(j["data"]["ticker"], "TSLA");
    ASSERT_TRUE(j["timestamp"].is_string());
    EXPECT_EQ(j["timestamp"].get<std::string>().back(), 'Z');
}

TEST_F(EndToEndTest, ClientsShareOneUpstreamSubscription) {
    auto first = std::make_unique<WsClient>(port(), "/api/stream/ws/gex/spy");
    auto second = std::make_unique<WsClient>(port(), "/api/stream/ws/gex/SPY");
    ASSERT_TRUE(waitFor([&] { return relay->registry().connectionCount("gex:SPY") == 2; }));
    ASSERT_TRUE(waitFor([&] { return upstream.joins("gex:SPY") == 1; }));

    upstream.inject(fixtures::gexFrame("SPY"));
    ASSERT_TRUE(first->read());
    ASSERT_TRUE(second->read());
    EXPECT_EQ(upstream.joins("gex:SPY"), 1);

    first->close();
    first.reset();
    ASSERT_TRUE(waitFor([&] { return relay->registry().connectionCount("gex:SPY") == 1; }));
    EXPECT_EQ(upstream.leaves("gex:SPY"), 0);

    second->close();
    second.reset();
    EXPECT_TRUE(waitFor([&] { return upstream.leaves("gex:SPY") == 1; }));
    EXPECT_TRUE(waitFor([&] { return relay->gateway().sessionCount() == 0; }));

    // a late frame for the released channel has no handler: dropped, connection unaffected
    upstream.inject(fixtures::gexFrame("SPY"));
    EXPECT_TRUE(waitFor([&] { return relay->feed()->stats().framesDropped == 1; }));
    EXPECT_EQ(relay->feed()->connectionState(), ConnectionState::Connected);
}

TEST_F(EndToEndTest, OtherChannelsAreNotDelivered) {
    WsClient flow(port(), "/api/stream/ws/flow");
    WsClient dark(port(), "/api/stream/ws/dark-pool");
    ASSERT_TRUE(waitFor([&] { return upstream.joins("dark_pool") == 1 && upstream.joins("flow-alerts") == 1; }));

    upstream.injectData("dark_pool", {{"ticker", "AAPL"}, {"size", 10000}});
    upstream.inject(fixtures::flowAlertFrame("NVDA"));

    auto text = flow.read();
    ASSERT_TRUE(text);
    EXPECT_EQ(nlohmann::json::parse(*text)["data"]["ticker"], "NVDA");
}

TEST_F(EndToEndTest, UnknownRouteIsRejected) {
    EXPECT_THROW(WsClient(port(), "/api/stream/ws/nope"), beast::system_error);
    EXPECT_THROW(WsClient(port(), "/api/stream/ws/gex/bad%20ticker"), beast::system_error);
    EXPECT_EQ(relay->gateway().sessionCount(), 0u);
}

// =============================================================================
// Operator routes
// =============================================================================

TEST_F(EndToEndTest, StatusRouteReportsConnectedUpstream) {
    WsClient client(port(), "/api/stream/ws/flow");
    ASSERT_TRUE(waitFor([&] { return relay->registry().connectionCount() == 1; }));

    auto res = request(port(), http::verb::get, "/api/stream/status");
    EXPECT_EQ(res.result(), http::status::ok);
    auto j = nlohmann::json::parse(res.body());
    EXPECT_EQ(j["status"], "connected");
    EXPECT_EQ(j["total_clients"], 1);
    EXPECT_EQ(j["upstream"]["uri"].get<std::string>().find("e2e-token-0001"), std::string::npos);
}

TEST_F(EndToEndTest, UnknownHttpRouteIs404) {
    auto res = request(port(), http::verb::get, "/api/stream/missing");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(nlohmann::json::parse(res.body())["detail"], "Not Found");
}

TEST_F(EndToEndTest, ReconnectRouteCyclesUpstream) {
    auto res = request(port(), http::verb::post, "/api/stream/reconnect");
    EXPECT_EQ(res.result(), http::status::accepted);
    EXPECT_TRUE(waitFor([&] { return upstream.connects() == 2 &&
                                     relay->feed()->connectionState() == ConnectionState::Connected; }));
}

// =============================================================================
// Upstream failure
// =============================================================================

TEST_F(EndToEndTest, PermanentUpstreamFailureKeepsClientsOpen) {
    WsClient client(port(), "/api/stream/ws/flow");
    ASSERT_TRUE(waitFor([&] { return upstream.joins("flow-alerts") == 1; }));

    upstream.setDefault(MockUpstream::Outcome::Network);
    upstream.drop();
    ASSERT_TRUE(waitFor([&] { return relay->feed()->isTerminal(); }));

    EXPECT_EQ(relay->gateway().sessionCount(), 1u);
    EXPECT_EQ(relay->registry().connectionCount("flow-alerts"), 1u);

    auto res = request(port(), http::verb::get, "/api/stream/status");
    auto j = nlohmann::json::parse(res.body());
    EXPECT_EQ(j["status"], "failed");
    EXPECT_NE(j["upstream"]["last_error"].get<std::string>().find("max reconnection attempts"),
              std::string::npos);

    // nothing arrives, but the relay does not hang up either
    EXPECT_FALSE(client.read(200ms));
    EXPECT_EQ(client.lastError(), net::error::timed_out);
}

// =============================================================================
// Shutdown
// =============================================================================

TEST_F(EndToEndTest, ShutdownClosesClientsAsGoingAway) {
    WsClient client(port(), "/api/stream/ws/congress");
    ASSERT_TRUE(waitFor([&] { return upstream.joins("congress_trades") == 1; }));

    std::thread stopper([&] { relay->stop(); });
    auto text = client.read();
    stopper.join();

    EXPECT_FALSE(text);
    EXPECT_EQ(client.lastError(), websocket::error::closed);
    EXPECT_EQ(client.reason().code, websocket::close_code::going_away);
    EXPECT_EQ(upstream.leaves("congress_trades"), 1);
}

TEST_F(EndToEndTest, StoppingGatewayRefusesUpgradesAndReconnects) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(loopback(port()));
    ASSERT_EQ(exchange(stream, http::verb::get, "/api/stream/health").result(), http::status::ok);

    relay->gateway().stopAccepting();

    // the keep-alive connection predates the stop and is still served
    auto res = exchange(stream, http::verb::post, "/api/stream/reconnect");
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    EXPECT_EQ(nlohmann::json::parse(res.body())["detail"], "Relay is shutting down");

    websocket::stream<tcp::socket> ws(stream.release_socket());
    EXPECT_THROW(ws.handshake("127.0.0.1", "/api/stream/ws/flow"), beast::system_error);
    EXPECT_EQ(relay->gateway().sessionCount(), 0u);
    EXPECT_EQ(relay->registry().connectionCount(), 0u);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(upstream.connects(), 1);
}

// =============================================================================
// Streaming disabled
// =============================================================================

TEST(EndToEndDisabled, UpgradeClosedWithInternalError) {
    RelayService relay(relayConfig(false));
    relay.start();
    ASSERT_FALSE(relay.streamingEnabled());

    WsClient client(relay.port(), "/api/stream/ws/flow");
    EXPECT_FALSE(client.read());
    EXPECT_EQ(client.reason().code, websocket::close_code::internal_error);
    EXPECT_EQ(std::string(client.reason().reason.data(), client.reason().reason.size()),
              "WebSocket streaming not available");

    auto res = request(relay.port(), http::verb::get, "/api/stream/status");
    EXPECT_EQ(nlohmann::json::parse(res.body())["status"], "disabled");
    EXPECT_EQ(request(relay.port(), http::verb::get, "/api/stream/health").result(),
              http::status::service_unavailable);
}
