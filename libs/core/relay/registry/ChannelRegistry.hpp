#pragma once
/*
FlowRelay — ChannelRegistry
Role: Owns channel -> attached downstream connections; drives upstream join/leave by reference count.
Inputs/Outputs: attach/detach from the Gateway; broadcast from the upstream receive loop.
Threading: One mutex serialises every mutation. The upstream subscribe/unsubscribe call is made while
           holding it, so the empty <-> non-empty transition and the upstream intent are one step.
           Delivery runs on a snapshot, outside the lock.
Performance: Broadcast serialises the envelope once and hands the same buffer to every connection.
Integration: Created by RelayService with the UpstreamFeedClient as its IFeedSubscriber.
Observability: RegistryStats; attach/detach through frLog_Registry.
Related: ChannelRegistry.cpp, AttachmentScope.hpp, DownstreamConnection.hpp, Envelope.hpp.
Assumptions: IFeedSubscriber implementations never call back into the registry synchronously.
*/
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "relay/registry/DownstreamConnection.hpp"
#include "relay/upstream/FeedInterfaces.hpp"

struct RegistryStats {
    std::size_t totalConnections = 0;
    std::size_t activeChannels = 0;
    std::map<std::string, std::size_t> perChannel;
    std::uint64_t totalAttaches = 0;
    std::uint64_t totalDetaches = 0;
    std::uint64_t framesDelivered = 0;
    std::uint64_t deliveryFailures = 0;
    double uptimeSeconds = 0.0;
    double framesPerSecond = 0.0;
};

class ChannelRegistry {
public:
    explicit ChannelRegistry(IFeedSubscriber& feed);

    // false if this connection was already attached to the channel.
    bool attach(const std::shared_ptr<DownstreamConnection>& conn, const std::string& channel);

    // Idempotent; unknown channel or connection is a no-op.
    void detach(ConnectionId id, const std::string& channel);

    // Delivers to a snapshot of the channel's connections; failed or expired ones are detached
    // (and closed). Returns the number of successful deliveries.
    std::size_t broadcast(const std::string& channel, const std::shared_ptr<const std::string>& frame);

    // Wraps the payload in the downstream envelope, then broadcast().
    std::size_t publish(const std::string& channel, const nlohmann::json& payload);

    std::size_t connectionCount() const;
    std::size_t connectionCount(const std::string& channel) const;
    std::vector<std::string> channels() const;
    RegistryStats stats() const;

    ChannelRegistry(const ChannelRegistry&) = delete;
    ChannelRegistry& operator=(const ChannelRegistry&) = delete;

private:
    using Members = std::unordered_map<ConnectionId, std::weak_ptr<DownstreamConnection>>;

    bool detachLocked(ConnectionId id, const std::string& channel);

    IFeedSubscriber& m_feed;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Members> m_channels;

    std::atomic<std::uint64_t> m_attaches{0};
    std::atomic<std::uint64_t> m_detaches{0};
    std::atomic<std::uint64_t> m_delivered{0};
    std::atomic<std::uint64_t> m_failures{0};
    const std::chrono::steady_clock::time_point m_startedAt;
};
