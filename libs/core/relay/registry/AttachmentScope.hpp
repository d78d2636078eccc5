#pragma once
#include <exception>
#include <memory>
#include <string>
#include "RelayLogging.hpp"
#include "relay/registry/ChannelRegistry.hpp"

// Attaches on construction, detaches on destruction: whatever path ends a
// session, the registry never keeps an attached-but-dead connection.
class AttachmentScope {
public:
    AttachmentScope(ChannelRegistry& registry,
                    const std::shared_ptr<DownstreamConnection>& conn,
                    std::string channel)
        : m_registry(registry)
        , m_id(conn->id())
        , m_channel(std::move(channel))
    {
        m_registry.attach(conn, m_channel);
    }

    ~AttachmentScope() {
        try {
            m_registry.detach(m_id, m_channel);
        } catch (const std::exception& e) {
            frLog_Error(Registry, "detach of {} from {} failed: {}", m_id, m_channel, e.what());
        }
    }

    const std::string& channel() const { return m_channel; }

    AttachmentScope(const AttachmentScope&) = delete;
    AttachmentScope& operator=(const AttachmentScope&) = delete;

private:
    ChannelRegistry& m_registry;
    ConnectionId m_id;
    std::string m_channel;
};
