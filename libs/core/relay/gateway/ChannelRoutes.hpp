#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One entry of the public channel catalogue (GET /channels).
struct ChannelDescriptor {
    std::string id;
    std::string name;
    std::string endpoint;        // relative to the route prefix, e.g. "/ws/gex/{ticker}"
    std::string description;
    std::string channel;         // provider channel, or the prefix for ticker channels
    bool perTicker = false;
    bool verified = false;
};

// Maps downstream WebSocket targets onto provider channel names.
class ChannelRoutes {
public:
    explicit ChannelRoutes(std::string prefix = "/api/stream");

    // Channel for an upgrade target (query string ignored); nullopt when no route
    // matches or a path parameter fails validation.
    std::optional<std::string> resolve(std::string_view target) const;

    const std::vector<ChannelDescriptor>& catalogue() const { return m_catalogue; }
    const std::string& prefix() const { return m_prefix; }

    // Strips the prefix and the query string; nullopt if the target is outside the prefix.
    std::optional<std::string> relativePath(std::string_view target) const;

    static bool validTicker(std::string_view ticker);
    static bool validChannelName(std::string_view name);

private:
    std::string m_prefix;
    std::vector<ChannelDescriptor> m_catalogue;
};
