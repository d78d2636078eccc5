#include "StatusApi.hpp"
#include "RelayLogging.hpp"

namespace {

HttpResponse jsonResponse(unsigned status, const nlohmann::json& body) {
    HttpResponse r;
    r.status = status;
    r.body = body.dump();
    return r;
}

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

} // namespace

nlohmann::json toJson(const FeedStats& s) {
    nlohmann::json j;
    j["state"] = toString(s.state);
    j["connected"] = s.state == ConnectionState::Connected;
    j["running"] = s.running;
    j["terminal"] = s.terminal;
    j["reconnect_attempts"] = s.reconnectAttempts;
    j["subscribed_channels"] = s.channels;
    j["channel_count"] = s.channels.size();
    j["last_message_seconds_ago"] = s.lastMessageSecondsAgo
        ? nlohmann::json(*s.lastMessageSecondsAgo) : nlohmann::json(nullptr);
    j["uri"] = s.connectionUri;
    j["frames_received"] = s.framesReceived;
    j["frames_dropped"] = s.framesDropped;
    j["parse_errors"] = s.parseErrors;
    j["handler_errors"] = s.handlerErrors;
    j["reconnects"] = s.reconnects;
    j["last_error"] = s.lastError;
    return j;
}

nlohmann::json toJson(const RegistryStats& s) {
    nlohmann::json per = nlohmann::json::object();
    for (const auto& [channel, count] : s.perChannel) per[channel] = count;
    return {
        {"total_connections", s.totalConnections},
        {"active_channels", s.activeChannels},
        {"connections_by_channel", per},
        {"total_attaches", s.totalAttaches},
        {"total_detaches", s.totalDetaches},
        {"frames_delivered", s.framesDelivered},
        {"delivery_failures", s.deliveryFailures},
        {"uptime_seconds", s.uptimeSeconds},
        {"frames_per_second", s.framesPerSecond},
    };
}

std::string relayStatus(const IFeedControl* feed) {
    if (!feed) return "disabled";
    const auto s = feed->stats();
    if (s.terminal) return "failed";
    return toString(s.state);
}

nlohmann::json buildStatusDocument(const IFeedControl* feed, const ChannelRegistry& registry) {
    const auto reg = registry.stats();
    nlohmann::json doc;
    doc["status"] = relayStatus(feed);
    doc["enabled"] = feed != nullptr;
    doc["upstream"] = feed ? toJson(feed->stats()) : nlohmann::json(nullptr);
    doc["client_connections"] = toJson(reg);
    doc["total_clients"] = reg.totalConnections;
    return doc;
}

StatusApi::StatusApi(const ChannelRoutes& routes, const ChannelRegistry& registry, IFeedControl* feed)
    : m_routes(routes), m_registry(registry), m_feed(feed)
{
    m_handlers.emplace(makeKey("GET", "/status"), [this] { return status(); });
    m_handlers.emplace(makeKey("GET", "/channels"), [this] { return channels(); });
    m_handlers.emplace(makeKey("GET", "/health"), [this] { return health(); });
    m_handlers.emplace(makeKey("POST", "/reconnect"), [this] { return reconnect(); });
}

HttpResponse StatusApi::handle(const HttpRequest& req) const {
    LOG_D(FlowRelay::LogCat::kGateway, "{} {}", req.method, req.target);
    const auto rel = m_routes.relativePath(req.target);
    if (rel) {
        if (auto it = m_handlers.find(makeKey(req.method, *rel)); it != m_handlers.end()) {
            return it->second();
        }
    }
    return jsonResponse(404, {{"detail", "Not Found"}});
}

nlohmann::json StatusApi::channelsDocument() const {
    const auto perChannel = m_registry.stats().perChannel;
    nlohmann::json list = nlohmann::json::array();
    for (const auto& d : m_routes.catalogue()) {
        std::size_t subscribers = 0;
        if (d.perTicker) {
            for (const auto& [name, count] : perChannel) {
                if (name.rfind(d.channel, 0) == 0) subscribers += count;
            }
        } else if (auto it = perChannel.find(d.channel); it != perChannel.end()) {
            subscribers = it->second;
        }
        list.push_back({
            {"id", d.id},
            {"name", d.name},
            {"endpoint", m_routes.prefix() + d.endpoint},
            {"description", d.description},
            {"active_subscribers", subscribers},
            {"verified", d.verified},
        });
    }
    return {
        {"channels", list},
        {"total_channels", list.size()},
        {"enabled", m_feed != nullptr},
    };
}

HttpResponse StatusApi::status() const {
    return jsonResponse(200, buildStatusDocument(m_feed, m_registry));
}

HttpResponse StatusApi::channels() const {
    return jsonResponse(200, channelsDocument());
}

HttpResponse StatusApi::health() const {
    if (!m_feed) {
        return jsonResponse(503, {{"detail", "WebSocket streaming service not available"}});
    }
    const auto s = m_feed->stats();
    if (s.state != ConnectionState::Connected) {
        return jsonResponse(503, {{"detail", "Not connected to the upstream feed"}});
    }
    return jsonResponse(200, {
        {"status", "healthy"},
        {"connected", true},
        {"last_message_seconds_ago", s.lastMessageSecondsAgo
            ? nlohmann::json(*s.lastMessageSecondsAgo) : nlohmann::json(nullptr)},
    });
}

HttpResponse StatusApi::reconnect() const {
    if (!m_feed) {
        return jsonResponse(503, {{"detail", "WebSocket client not initialized"}});
    }
    if (m_shuttingDown.load()) {
        return jsonResponse(503, {{"detail", "Relay is shutting down"}});
    }
    frLog_Gateway("Operator requested upstream reconnection");
    if (!m_feed->forceReconnect()) {
        return jsonResponse(503, {{"detail", "Upstream feed is stopped"}});
    }
    return jsonResponse(202, {{"status", "reconnecting"}});
}
