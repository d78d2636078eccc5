#pragma once
/*
FlowRelay — StatusApi
Role: Operator HTTP surface under the route prefix: /status, /channels, /health, POST /reconnect.
Inputs/Outputs: Plain request (method + target) in, status code + JSON body out. No Beast types,
                so the routing table is testable without sockets.
Threading: handle() is const and may run concurrently on any gateway thread; it only reads
           the registry and the feed through their own locks.
Performance: Not on the data path.
Integration: Owned by Gateway; HttpSession calls handle() for every non-upgrade request.
Observability: Each request logged at debug through the gateway category.
Related: ChannelRoutes.hpp, ChannelRegistry.hpp, FeedInterfaces.hpp.
Assumptions: feed == nullptr means streaming is disabled (no credential configured).
*/
#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "relay/gateway/ChannelRoutes.hpp"
#include "relay/registry/ChannelRegistry.hpp"
#include "relay/upstream/FeedInterfaces.hpp"

struct HttpRequest {
    std::string method;
    std::string target;
};

struct HttpResponse {
    unsigned status = 200;
    std::string body;
    std::string contentType = "application/json";
};

nlohmann::json toJson(const FeedStats& s);
nlohmann::json toJson(const RegistryStats& s);

// "disabled" without a feed, "failed" once reconnection gave up, else the connection state.
std::string relayStatus(const IFeedControl* feed);

nlohmann::json buildStatusDocument(const IFeedControl* feed, const ChannelRegistry& registry);

class StatusApi {
public:
    StatusApi(const ChannelRoutes& routes, const ChannelRegistry& registry, IFeedControl* feed);

    HttpResponse handle(const HttpRequest& req) const;

    nlohmann::json channelsDocument() const;

    // From here on POST /reconnect answers 503.
    void beginShutdown() { m_shuttingDown = true; }

    StatusApi(const StatusApi&) = delete;
    StatusApi& operator=(const StatusApi&) = delete;

private:
    using Handler = std::function<HttpResponse()>;

    HttpResponse status() const;
    HttpResponse channels() const;
    HttpResponse health() const;
    HttpResponse reconnect() const;

    const ChannelRoutes& m_routes;
    const ChannelRegistry& m_registry;
    IFeedControl* m_feed;
    std::map<std::string, Handler> m_handlers;   // "METHOD /path"
    std::atomic<bool> m_shuttingDown{false};
};
