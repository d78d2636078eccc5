#pragma once
#include <functional>
#include <string>

// Failure reported by a transport; httpStatus is set when the upgrade was refused.
struct TransportError {
    std::string message;
    unsigned httpStatus = 0;

    bool isAuthRejection() const { return httpStatus == 401 || httpStatus == 403; }
};

// Pure transport interface (no provider logic)
//
// Contract: after connect(), a transport reports exactly one onStatus(true) on
// success, and exactly one onStatus(false) when it goes down or fails to come
// up, preceded by onError() when the cause was not a local close().
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // own the data to avoid dangling views
    using StatusCb  = std::function<void(bool)>;
    using ErrorCb   = std::function<void(const TransportError&)>;
    using PongCb    = std::function<void()>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close() = 0;
    virtual void send(std::string msg) = 0; // serialized by implementation
    virtual void ping() = 0;                // answered through onPong

    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;
    virtual void onPong(PongCb) = 0;
};
