#pragma once
/*
FlowRelay — UpstreamFeedClient
Role: Owns the single provider WebSocket: join/leave protocol, receive loop, keepalive and reconnection.
Inputs/Outputs: subscribe/unsubscribe intents in; per-channel payloads out through registered handlers.
Threading: One io_context on a dedicated thread. Every state transition runs on m_strand; public
           methods only lock m_mutex (desired set + handlers) and post intents to the strand.
Performance: One JSON parse per inbound frame; handlers run on the io thread and must not block.
Integration: Owned by RelayService; ChannelRegistry drives subscribe/unsubscribe; Gateway reads stats.
Observability: Logs lifecycle through frLog_Upstream, per-frame detail through frLog_Data; FeedStats.
Related: UpstreamFeedClient.cpp, BeastWsTransport.hpp, SubscriptionManager.hpp, ReconnectPolicy.hpp.
Assumptions: Handlers do not call back into this client synchronously; connect()/stop() are not
             called from a handler.
*/
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include "relay/config/RelayConfig.hpp"
#include "relay/upstream/FeedInterfaces.hpp"
#include "relay/ws/ReconnectPolicy.hpp"
#include "relay/ws/SubscriptionManager.hpp"
#include "relay/ws/WsTransport.hpp"

namespace net = boost::asio;
namespace ssl = net::ssl;

class ConnectError : public std::runtime_error {
public:
    enum class Kind { Network, Auth, Timeout };

    ConnectError(Kind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    Kind kind() const noexcept { return m_kind; }

private:
    Kind m_kind;
};

class UpstreamFeedClient : public IFeedSubscriber, public IFeedControl {
public:
    using TransportFactory =
        std::function<std::shared_ptr<WsTransport>(net::io_context&, ssl::context&)>;

    // An empty factory selects BeastWsTransport.
    explicit UpstreamFeedClient(UpstreamConfig cfg,
                                TransportFactory factory = {},
                                ReconnectPolicy::JitterSource jitter = {});
    ~UpstreamFeedClient() override;

    // Blocks until Connected; throws ConnectError and leaves the state Disconnected.
    // Also the only way back from stop().
    void connect();
    // Starts the receive loop (keepalive + automatic reconnection) and returns.
    // If the initial connect is still in flight and then fails, the loop recovers through backoff.
    void listen();
    // Blocks until the loop ends (stop() or reconnection gave up); false on timeout.
    bool waitUntilStopped(std::chrono::milliseconds timeout);
    // Best-effort leave for every channel, close, join the io thread. Bounded by the grace period.
    // Final until the next connect(): listen(), forceReconnect() and wire syncs are ignored.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    void subscribe(const std::string& channel, ChannelHandler handler) override;
    void unsubscribe(const std::string& channel) override;

    ConnectionState connectionState() const override { return m_state.load(); }
    FeedStats stats() const override;
    bool forceReconnect() override;

    bool isTerminal() const { return m_terminal.load(); }
    bool isStopped() const { return m_stopped.load(); }
    std::string connectionUri() const;

    UpstreamFeedClient(const UpstreamFeedClient&) = delete;
    UpstreamFeedClient& operator=(const UpstreamFeedClient&) = delete;
    UpstreamFeedClient(UpstreamFeedClient&&) = delete;
    UpstreamFeedClient& operator=(UpstreamFeedClient&&) = delete;

private:
    // Connection lifecycle (strand)
    void ensureIoThread();
    void run();
    void startAttempt();
    void bindTransport(const std::shared_ptr<WsTransport>& transport, std::uint64_t gen);
    void teardownTransport();
    void handleUp();
    void handleDown();
    void scheduleReconnect();
    void giveUp(const std::string& reason);
    void setState(ConnectionState s);
    void setListening(bool on);

    // Receive loop (strand)
    void handleFrame(const std::string& raw);
    void syncChannel(const std::string& channel);
    void armIdleTimer();
    void onIdleExpired();
    void onPong();
    void onKeepaliveFailed();

    void setLastError(const std::string& msg);

    UpstreamConfig                  m_cfg;
    TransportFactory                m_factory;
    ReconnectPolicy                 m_policy;

    ssl::context                    m_sslCtx{ssl::context::tlsv12_client};
    net::io_context                 m_ioc;
    net::strand<net::io_context::executor_type> m_strand{m_ioc.get_executor()};
    net::steady_timer               m_backoffTimer{m_strand};
    net::steady_timer               m_idleTimer{m_strand};
    net::steady_timer               m_ackTimer{m_strand};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_workGuard;
    std::thread                     m_ioThread;
    std::mutex                      m_lifecycleMutex;

    // Strand-confined
    std::shared_ptr<WsTransport>    m_transport;
    std::uint64_t                   m_generation = 0;
    bool                            m_listening = false;
    bool                            m_awaitingAck = false;
    std::chrono::steady_clock::time_point m_lastActivity{};
    std::optional<TransportError>   m_pendingError;
    std::shared_ptr<std::promise<void>> m_connectPromise;
    std::shared_ptr<std::promise<void>> m_closedPromise;

    // Desired set and handlers; shared with subscribe/unsubscribe callers
    mutable std::mutex              m_mutex;
    SubscriptionManager             m_subscriptions;
    std::unordered_map<std::string, ChannelHandler> m_handlers;
    std::string                     m_lastError;

    std::atomic<ConnectionState>    m_state{ConnectionState::Disconnected};
    std::atomic<bool>               m_running{false};
    std::atomic<bool>               m_terminal{false};
    std::atomic<bool>               m_stopped{false};       // set by stop(), cleared by connect()
    std::atomic<int>                m_attempt{0};
    std::atomic<std::int64_t>       m_lastMessageMs{0};     // steady clock, 0 = never
    std::atomic<std::uint64_t>      m_framesReceived{0};
    std::atomic<std::uint64_t>      m_framesDropped{0};
    std::atomic<std::uint64_t>      m_parseErrors{0};
    std::atomic<std::uint64_t>      m_handlerErrors{0};
    std::atomic<std::uint64_t>      m_reconnects{0};

    // Receive-loop lifetime for waitUntilStopped()
    std::mutex                      m_loopMutex;
    std::condition_variable         m_loopCv;
    bool                            m_loopActive = false;
};
