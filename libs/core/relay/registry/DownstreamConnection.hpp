#pragma once
#include <cstdint>
#include <memory>
#include <string>

using ConnectionId = std::uint64_t;

enum class CloseCause { DeliveryFailed, Shutdown, StreamingDisabled };

// One external client session, as seen by ChannelRegistry. Owned by the Gateway;
// the registry only keeps weak references.
class DownstreamConnection {
public:
    virtual ~DownstreamConnection() = default;

    virtual ConnectionId id() const = 0;

    // Must not block. false means the frame was not accepted and the connection
    // should be dropped (closed socket, send queue over its bounds).
    virtual bool deliver(std::shared_ptr<const std::string> frame) = 0;

    virtual void close(CloseCause cause) = 0;
};
