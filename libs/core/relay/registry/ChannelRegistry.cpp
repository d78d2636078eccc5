#include "ChannelRegistry.hpp"
#include "RelayLogging.hpp"
#include "relay/dispatch/Envelope.hpp"

ChannelRegistry::ChannelRegistry(IFeedSubscriber& feed)
    : m_feed(feed)
    , m_startedAt(std::chrono::steady_clock::now())
{}

bool ChannelRegistry::attach(const std::shared_ptr<DownstreamConnection>& conn, const std::string& channel) {
    if (!conn) return false;
    const auto id = conn->id();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& members = m_channels.try_emplace(channel).first->second;
    const bool wasEmpty = members.empty();
    const bool inserted = members.emplace(id, conn).second;
    if (!inserted) return false;

    ++m_attaches;
    if (wasEmpty) {
        // first member: activate upstream exactly once for this cycle
        m_feed.subscribe(channel, [this, channel](const nlohmann::json& payload) {
            publish(channel, payload);
        });
        frLog_Registry("Channel {} activated by connection {}", channel, id);
    }
    frLog_Registry("Connection {} attached to {} ({} on channel)", id, channel, members.size());
    return true;
}

void ChannelRegistry::detach(ConnectionId id, const std::string& channel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    detachLocked(id, channel);
}

bool ChannelRegistry::detachLocked(ConnectionId id, const std::string& channel) {
    auto it = m_channels.find(channel);
    if (it == m_channels.end()) return false;
    if (it->second.erase(id) == 0) return false;

    ++m_detaches;
    frLog_Registry("Connection {} detached from {} ({} left)", id, channel, it->second.size());
    if (it->second.empty()) {
        m_channels.erase(it);
        m_feed.unsubscribe(channel);
        frLog_Registry("Channel {} released, no listeners left", channel);
    }
    return true;
}

std::size_t ChannelRegistry::publish(const std::string& channel, const nlohmann::json& payload) {
    return broadcast(channel, Envelope::make(channel, payload));
}

std::size_t ChannelRegistry::broadcast(const std::string& channel, const std::shared_ptr<const std::string>& frame) {
    std::vector<std::shared_ptr<DownstreamConnection>> targets;
    std::vector<ConnectionId> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(channel);
        if (it == m_channels.end()) return 0;
        targets.reserve(it->second.size());
        for (const auto& [id, weak] : it->second) {
            if (auto conn = weak.lock()) {
                targets.push_back(std::move(conn));
            } else {
                expired.push_back(id);
            }
        }
    }

    std::size_t delivered = 0;
    std::vector<std::shared_ptr<DownstreamConnection>> failed;
    for (auto& conn : targets) {
        if (conn->deliver(frame)) {
            ++delivered;
        } else {
            failed.push_back(conn);
        }
    }
    m_delivered += delivered;

    if (!failed.empty() || !expired.empty()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& conn : failed) detachLocked(conn->id(), channel);
            for (const auto id : expired) detachLocked(id, channel);
        }
        m_failures += failed.size();
        for (const auto& conn : failed) {
            frLog_Warning(Registry, "Delivery to connection {} on {} failed, dropping it", conn->id(), channel);
            conn->close(CloseCause::DeliveryFailed);
        }
    }
    return delivered;
}

std::size_t ChannelRegistry::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t total = 0;
    for (const auto& [name, members] : m_channels) total += members.size();
    return total;
}

std::size_t ChannelRegistry::connectionCount(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_channels.find(channel);
    return it == m_channels.end() ? 0 : it->second.size();
}

std::vector<std::string> ChannelRegistry::channels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_channels.size());
    for (const auto& [name, members] : m_channels) out.push_back(name);
    return out;
}

RegistryStats ChannelRegistry::stats() const {
    RegistryStats s;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [name, members] : m_channels) {
            s.perChannel[name] = members.size();
            s.totalConnections += members.size();
        }
        s.activeChannels = m_channels.size();
    }
    s.totalAttaches = m_attaches.load();
    s.totalDetaches = m_detaches.load();
    s.framesDelivered = m_delivered.load();
    s.deliveryFailures = m_failures.load();
    s.uptimeSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_startedAt).count();
    s.framesPerSecond = s.uptimeSeconds > 0.0 ? static_cast<double>(s.framesDelivered) / s.uptimeSeconds : 0.0;
    return s;
}
