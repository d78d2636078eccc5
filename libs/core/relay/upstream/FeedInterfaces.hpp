#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class ConnectionState { Disconnected, Connecting, Connected, Reconnecting };

inline const char* toString(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

using ChannelHandler = std::function<void(const nlohmann::json& payload)>;

// What ChannelRegistry needs from the upstream side.
class IFeedSubscriber {
public:
    virtual ~IFeedSubscriber() = default;

    // Records the channel as desired and replaces its handler.
    virtual void subscribe(const std::string& channel, ChannelHandler handler) = 0;
    virtual void unsubscribe(const std::string& channel) = 0;
};

struct FeedStats {
    ConnectionState state = ConnectionState::Disconnected;
    bool running = false;
    bool terminal = false;                   // reconnection gave up or credential rejected
    int reconnectAttempts = 0;
    std::vector<std::string> channels;       // desired set
    std::optional<double> lastMessageSecondsAgo;
    std::string connectionUri;               // never carries the credential
    std::uint64_t framesReceived = 0;
    std::uint64_t framesDropped = 0;         // no handler registered
    std::uint64_t parseErrors = 0;
    std::uint64_t handlerErrors = 0;
    std::uint64_t reconnects = 0;            // successful re-establishments
    std::string lastError;
};

// Operator-facing view used by the status surface.
class IFeedControl {
public:
    virtual ~IFeedControl() = default;

    virtual ConnectionState connectionState() const = 0;
    virtual FeedStats stats() const = 0;
    // false if the feed has been stopped and will not reconnect
    virtual bool forceReconnect() = 0;
};
