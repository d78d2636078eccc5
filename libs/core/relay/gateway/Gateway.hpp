#pragma once
/*
FlowRelay — Gateway
Role: Downstream listener. Accepts TCP connections, serves the status routes, and upgrades channel
      routes into DownstreamSessions attached to the ChannelRegistry.
Inputs/Outputs: Client sockets in; per-session WebSocket streams and HTTP responses out.
Threading: Own io_context on GatewayConfig::threads threads. Every connection runs on its own strand.
           The session table is guarded by m_sessionsMutex.
Performance: Fan-out cost is in the registry; a session only copies a shared_ptr per frame.
Integration: Owned by RelayService. Sessions attach/detach through AttachmentScope.
Observability: frLog_Gateway for accept/upgrade/close; sessionCount() for tests.
Related: Gateway.cpp, HttpSession.hpp, DownstreamSession.hpp, StatusApi.hpp, ChannelRoutes.hpp.
Assumptions: The registry outlives the Gateway. registry access is skipped entirely when streaming
             is disabled (feed == nullptr).
*/
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include "relay/config/RelayConfig.hpp"
#include "relay/gateway/ChannelRoutes.hpp"
#include "relay/gateway/StatusApi.hpp"
#include "relay/registry/ChannelRegistry.hpp"

class DownstreamSession;

class Gateway {
public:
    // feed == nullptr: streaming disabled, upgrades are accepted and closed with 1011.
    Gateway(GatewayConfig cfg, ChannelRegistry& registry, IFeedControl* feed);
    ~Gateway();

    // Binds and starts the io threads. Throws std::runtime_error if the address cannot be bound.
    void start();
    void stopAccepting();
    // Closes every live session with 1001, waits up to grace for them to finish, joins the threads.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    std::uint16_t port() const { return m_boundPort.load(); }
    std::size_t sessionCount() const;

    const ChannelRoutes& routes() const { return m_routes; }
    const StatusApi& api() const { return m_api; }

    // Called by HttpSession once an upgrade request resolved to a channel.
    void openStream(boost::asio::ip::tcp::socket&& socket, std::string channel,
                    boost::beast::http::request<boost::beast::http::string_body>&& req);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

private:
    void doAccept();
    void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
    void run();
    void sessionFinished(ConnectionId id);

    GatewayConfig m_cfg;
    boost::asio::io_context m_ioc;
    ChannelRegistry& m_registry;
    IFeedControl* m_feed;
    ChannelRoutes m_routes;
    StatusApi m_api;

    boost::asio::ip::tcp::acceptor m_acceptor;
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_accepting{false};
    std::atomic<std::uint16_t> m_boundPort{0};
    std::mutex m_lifecycleMutex;

    mutable std::mutex m_sessionsMutex;
    std::condition_variable m_sessionsCv;
    std::unordered_map<ConnectionId, std::weak_ptr<DownstreamSession>> m_sessions;
};
