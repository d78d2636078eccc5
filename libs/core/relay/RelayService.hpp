#pragma once
/*
FlowRelay — RelayService
Role: Composition root. Owns the upstream feed, the channel registry and the downstream gateway,
      wires them together and runs the ordered shutdown.
Inputs/Outputs: RelayConfig in; a listening gateway and one upstream connection out.
Threading: start()/stop()/status() are called from the main thread; the components run their own
           io threads.
Performance: Delegation only.
Integration: Instantiated by flowrelay_server (and the end-to-end tests with a scripted transport).
Observability: Lifecycle through frLog_App; status() returns the GET /status document.
Related: RelayService.cpp, UpstreamFeedClient.hpp, ChannelRegistry.hpp, Gateway.hpp.
Assumptions: Without a credential the feed is not created and streaming is reported disabled.
*/
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include "relay/config/RelayConfig.hpp"
#include "relay/gateway/Gateway.hpp"
#include "relay/registry/ChannelRegistry.hpp"
#include "relay/upstream/UpstreamFeedClient.hpp"

class RelayService {
public:
    explicit RelayService(RelayConfig cfg, UpstreamFeedClient::TransportFactory factory = {});
    ~RelayService();

    // Starts the gateway and the upstream loop. An initial connect failure is logged and left to
    // the reconnection procedure; only a gateway bind failure throws.
    void start();
    // Stop accepting -> stop upstream (best-effort leaves) -> close downstream sessions.
    void stop();

    nlohmann::json status() const;

    bool streamingEnabled() const { return m_feed != nullptr; }
    std::uint16_t port() const { return m_gateway->port(); }

    UpstreamFeedClient* feed() { return m_feed.get(); }
    ChannelRegistry& registry() { return *m_registry; }
    Gateway& gateway() { return *m_gateway; }

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;
    RelayService(RelayService&&) = delete;
    RelayService& operator=(RelayService&&) = delete;

private:
    RelayConfig                         m_cfg;
    std::unique_ptr<IFeedSubscriber>    m_disabledFeed;
    std::unique_ptr<UpstreamFeedClient> m_feed;        // null when streaming is disabled
    std::unique_ptr<ChannelRegistry>    m_registry;
    std::unique_ptr<Gateway>            m_gateway;
    bool                                m_started = false;
};
