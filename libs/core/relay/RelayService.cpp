#include "RelayService.hpp"
#include "RelayLogging.hpp"
#include "relay/gateway/StatusApi.hpp"

namespace {

// Stands in for the feed when no credential is configured. The gateway never attaches
// sessions in that mode, so reaching it means a wiring fault.
class DisabledFeed : public IFeedSubscriber {
public:
    void subscribe(const std::string& channel, ChannelHandler) override {
        frLog_Warning(App, "subscribe({}) ignored: streaming disabled", channel);
    }
    void unsubscribe(const std::string& channel) override {
        frLog_Warning(App, "unsubscribe({}) ignored: streaming disabled", channel);
    }
};

} // namespace

RelayService::RelayService(RelayConfig cfg, UpstreamFeedClient::TransportFactory factory)
    : m_cfg(std::move(cfg))
{
    IFeedSubscriber* subscriber = nullptr;
    if (m_cfg.streamingEnabled()) {
        m_feed = std::make_unique<UpstreamFeedClient>(m_cfg.upstream, std::move(factory));
        subscriber = m_feed.get();
    } else {
        m_disabledFeed = std::make_unique<DisabledFeed>();
        subscriber = m_disabledFeed.get();
    }
    m_registry = std::make_unique<ChannelRegistry>(*subscriber);
    m_gateway = std::make_unique<Gateway>(m_cfg.gateway, *m_registry, m_feed.get());
}

RelayService::~RelayService() {
    stop();
}

void RelayService::start() {
    if (m_started) return;

    if (m_feed) {
        frLog_App("Connecting upstream {}", m_feed->connectionUri());
        try {
            m_feed->connect();
        } catch (const ConnectError& e) {
            frLog_Error(App, "Initial upstream connect failed: {}", e.what());
        }
        m_feed->listen();
    } else {
        frLog_Warning(App, "No API credential configured; streaming disabled, status routes only");
    }

    m_gateway->start();
    m_started = true;
    frLog_App("Relay started on port {}", m_gateway->port());
}

void RelayService::stop() {
    if (!m_started) return;
    m_started = false;

    frLog_App("Relay shutting down");
    m_gateway->stopAccepting();
    if (m_feed) {
        m_feed->stop(m_cfg.shutdownGrace);
    }
    m_gateway->stop(m_cfg.shutdownGrace);
    frLog_App("Relay stopped");
}

nlohmann::json RelayService::status() const {
    return buildStatusDocument(m_feed.get(), *m_registry);
}
