/*
FlowRelay — UpstreamFeedClient
Role: Connection state machine (Disconnected/Connecting/Connected/Reconnecting) for the provider feed.
Threading: Transport callbacks are re-posted onto m_strand tagged with the transport generation, so
           callbacks from a transport that has been replaced are ignored.
Observability: Lifecycle via frLog_Upstream; drops and handler failures are counted in FeedStats.
Related: UpstreamFeedClient.hpp, FrameParser.hpp, ApiToken.hpp.
*/
#include "UpstreamFeedClient.hpp"
#include "RelayLogging.hpp"
#include "relay/auth/ApiToken.hpp"
#include "relay/dispatch/FrameParser.hpp"
#include "relay/ws/BeastWsTransport.hpp"
#include <boost/asio/post.hpp>
#include <utility>

namespace {

std::int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

ReconnectPolicy::Params policyParams(const UpstreamConfig& cfg) {
    ReconnectPolicy::Params p;
    p.baseDelay = cfg.baseDelay;
    p.maxDelay = cfg.maxDelay;
    p.maxAttempts = cfg.maxAttempts;
    p.jitter = cfg.jitter;
    return p;
}

}

UpstreamFeedClient::UpstreamFeedClient(UpstreamConfig cfg,
                                       TransportFactory factory,
                                       ReconnectPolicy::JitterSource jitter)
    : m_cfg(std::move(cfg))
    , m_factory(std::move(factory))
    , m_policy(policyParams(m_cfg), std::move(jitter))
{
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);

    if (!m_factory) {
        const auto timeout = m_cfg.connectTimeout;
        m_factory = [timeout](net::io_context& ioc, ssl::context& ctx) -> std::shared_ptr<WsTransport> {
            return std::make_shared<BeastWsTransport>(ioc, ctx, timeout);
        };
    }
    frLog_Upstream("UpstreamFeedClient initialized for {}", connectionUri());
}

UpstreamFeedClient::~UpstreamFeedClient() {
    stop();
}

std::string UpstreamFeedClient::connectionUri() const {
    return "wss://" + m_cfg.host + ":" + m_cfg.port + m_cfg.path;
}

// ============================================================================
// Lifecycle
// ============================================================================

void UpstreamFeedClient::ensureIoThread() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_ioThread.joinable()) return;
    m_workGuard.emplace(m_ioc.get_executor());
    m_ioc.restart();
    m_ioThread = std::thread(&UpstreamFeedClient::run, this);
}

void UpstreamFeedClient::run() {
    frLog_Upstream("IO context running for {}", connectionUri());
    for (;;) {
        try {
            m_ioc.run();
            break;
        } catch (const std::exception& e) {
            frLog_Error(Upstream, "Unhandled exception on upstream io thread: {}", e.what());
        }
    }
    frLog_Upstream("IO context stopped");
}

void UpstreamFeedClient::connect() {
    m_stopped = false;
    ensureIoThread();

    auto promise = std::make_shared<std::promise<void>>();
    auto result = promise->get_future();

    net::post(m_strand, [this, promise]{
        const auto state = m_state.load();
        if (state == ConnectionState::Connected) {
            promise->set_value();
            return;
        }
        if (state != ConnectionState::Disconnected) {
            promise->set_exception(std::make_exception_ptr(ConnectError(
                ConnectError::Kind::Network,
                std::string("connect() while ") + toString(state))));
            return;
        }
        m_running = true;
        m_terminal = false;
        m_attempt = 0;
        m_connectPromise = promise;
        setState(ConnectionState::Connecting);
        startAttempt();
    });

    if (result.wait_for(m_cfg.connectTimeout) == std::future_status::timeout) {
        // Abort only if the attempt is still ours; it may have completed meanwhile.
        auto aborted = std::make_shared<std::promise<bool>>();
        auto abortedResult = aborted->get_future();
        net::post(m_strand, [this, promise, aborted]{
            bool did = false;
            if (m_connectPromise == promise) {
                m_connectPromise.reset();
                teardownTransport();
                m_running = false;
                setState(ConnectionState::Disconnected);
                did = true;
            }
            aborted->set_value(did);
        });
        if (abortedResult.get()) {
            setLastError("connect timed out");
            throw ConnectError(ConnectError::Kind::Timeout,
                               "Timed out connecting to " + connectionUri());
        }
    }
    result.get();
}

void UpstreamFeedClient::listen() {
    if (m_stopped.load()) {
        frLog_Warning(Upstream, "listen() ignored: client was stopped");
        return;
    }
    ensureIoThread();
    net::post(m_strand, [this]{
        if (m_stopped.load()) return;
        if (m_terminal.load()) {
            frLog_Warning(Upstream, "listen() ignored: upstream feed is stopped permanently ({})", m_lastError);
            return;
        }
        m_running = true;
        setListening(true);
        switch (m_state.load()) {
        case ConnectionState::Connected:
            armIdleTimer();
            break;
        case ConnectionState::Disconnected:
            // initial connect failed or never attempted: recover through backoff
            setState(ConnectionState::Reconnecting);
            m_attempt = 0;
            scheduleReconnect();
            break;
        default:
            break;
        }
    });
}

bool UpstreamFeedClient::waitUntilStopped(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_loopMutex);
    return m_loopCv.wait_for(lock, timeout, [this]{ return !m_loopActive; });
}

void UpstreamFeedClient::stop(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    m_stopped = true;
    if (!m_ioThread.joinable()) return;

    frLog_Upstream("Stopping UpstreamFeedClient...");
    auto closed = std::make_shared<std::promise<void>>();
    auto closedResult = closed->get_future();

    net::post(m_strand, [this, closed]{
        m_running = false;
        setListening(false);
        m_backoffTimer.cancel();
        m_idleTimer.cancel();
        m_ackTimer.cancel();

        if (m_connectPromise) {
            m_connectPromise->set_exception(std::make_exception_ptr(
                ConnectError(ConnectError::Kind::Network, "client stopped")));
            m_connectPromise.reset();
        }

        if (m_transport && m_state.load() == ConnectionState::Connected) {
            std::vector<std::string> leaves;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                leaves = m_subscriptions.joined();
                m_subscriptions.resetWire();
            }
            for (const auto& ch : leaves) {
                m_transport->send(SubscriptionManager::buildLeaveMsg(ch));
            }
            frLog_Upstream("Sent leave for {} channel(s) before close", leaves.size());
            // handleDown() fulfils m_closedPromise once the close handshake ends
            m_closedPromise = closed;
            m_transport->close();
        } else {
            teardownTransport();
            setState(ConnectionState::Disconnected);
            closed->set_value();
        }
    });

    if (closedResult.wait_for(grace) == std::future_status::timeout) {
        frLog_Warning(Upstream, "Upstream close did not finish within {} ms; abandoning it", grace.count());
    }

    m_workGuard.reset();
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }

    m_transport.reset();
    m_closedPromise.reset();
    m_running = false;
    setState(ConnectionState::Disconnected);
    setListening(false);
    frLog_Upstream("UpstreamFeedClient stopped");
}

bool UpstreamFeedClient::forceReconnect() {
    if (m_stopped.load()) {
        frLog_Warning(Upstream, "Forced reconnect ignored: client was stopped");
        return false;
    }
    ensureIoThread();
    net::post(m_strand, [this]{
        if (m_stopped.load()) return;
        frLog_Upstream("Forced reconnect requested (state {})", toString(m_state.load()));
        if (m_connectPromise) {
            m_connectPromise->set_exception(std::make_exception_ptr(
                ConnectError(ConnectError::Kind::Network, "superseded by forced reconnect")));
            m_connectPromise.reset();
        }
        m_backoffTimer.cancel();
        m_idleTimer.cancel();
        m_ackTimer.cancel();
        teardownTransport();
        m_running = true;
        m_terminal = false;
        setListening(true);
        setState(ConnectionState::Reconnecting);
        m_attempt = 1;
        startAttempt();
    });
    return true;
}

// ============================================================================
// Subscription intents
// ============================================================================

void UpstreamFeedClient::subscribe(const std::string& channel, ChannelHandler handler) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[channel] = std::move(handler);
        m_subscriptions.add(channel);
    }
    frLog_Upstream("Subscribed to channel: {}", channel);
    // after stop() the channel stays desired and is joined by the next connect()
    if (!m_stopped.load()) net::post(m_strand, [this, channel]{ syncChannel(channel); });
}

void UpstreamFeedClient::unsubscribe(const std::string& channel) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_subscriptions.remove(channel)) return;
        m_handlers.erase(channel);
    }
    frLog_Upstream("Unsubscribed from channel: {}", channel);
    if (!m_stopped.load()) net::post(m_strand, [this, channel]{ syncChannel(channel); });
}

// Brings the wire in line with the desired set for one channel. Intents are
// evaluated against the current state rather than replayed, so any interleaving
// of subscribe/unsubscribe converges with at most one join or leave on the wire.
void UpstreamFeedClient::syncChannel(const std::string& channel) {
    if (m_stopped.load() || m_state.load() != ConnectionState::Connected || !m_transport) return;

    std::string frame;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool desired = m_subscriptions.isDesired(channel);
        const bool joined = m_subscriptions.isJoined(channel);
        if (desired && !joined) {
            m_subscriptions.markJoined(channel);
            frame = SubscriptionManager::buildJoinMsg(channel);
        } else if (!desired && joined) {
            m_subscriptions.markLeft(channel);
            frame = SubscriptionManager::buildLeaveMsg(channel);
        }
    }
    if (!frame.empty()) {
        m_transport->send(std::move(frame));
    }
}

// ============================================================================
// Connection state machine (strand)
// ============================================================================

void UpstreamFeedClient::setState(ConnectionState s) {
    const auto prev = m_state.exchange(s);
    if (prev != s) {
        frLog_Upstream("Upstream state {} -> {}", toString(prev), toString(s));
    }
}

void UpstreamFeedClient::setListening(bool on) {
    m_listening = on;
    {
        std::lock_guard<std::mutex> lock(m_loopMutex);
        m_loopActive = on;
    }
    if (!on) m_loopCv.notify_all();
}

void UpstreamFeedClient::setLastError(const std::string& msg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastError = msg;
}

void UpstreamFeedClient::startAttempt() {
    teardownTransport();
    const auto gen = ++m_generation;
    m_pendingError.reset();
    try {
        m_transport = m_factory(m_ioc, m_sslCtx);
    } catch (const std::exception& e) {
        frLog_Error(Upstream, "Failed to create transport: {}", e.what());
    }
    if (!m_transport) {
        m_pendingError = TransportError{"transport unavailable", 0};
        handleDown();
        return;
    }
    bindTransport(m_transport, gen);
    frLog_Upstream("Connecting to {} (attempt {})", connectionUri(), m_attempt.load());
    m_transport->connect(m_cfg.host, m_cfg.port, ApiToken::buildTarget(m_cfg.path, m_cfg.token));
}

void UpstreamFeedClient::bindTransport(const std::shared_ptr<WsTransport>& transport, std::uint64_t gen) {
    transport->onStatus([this, gen](bool up){
        net::post(m_strand, [this, gen, up]{
            if (gen != m_generation) return;
            if (up) handleUp(); else handleDown();
        });
    });
    transport->onError([this, gen](const TransportError& err){
        net::post(m_strand, [this, gen, err]{
            if (gen != m_generation) return;
            m_pendingError = err;
            setLastError(err.message);
        });
    });
    transport->onMessage([this, gen](std::string payload){
        net::post(m_strand, [this, gen, p = std::move(payload)]{
            if (gen != m_generation) return;
            handleFrame(p);
        });
    });
    transport->onPong([this, gen]{
        net::post(m_strand, [this, gen]{
            if (gen != m_generation) return;
            onPong();
        });
    });
}

// Forgets the current transport; its late callbacks fail the generation check.
void UpstreamFeedClient::teardownTransport() {
    m_idleTimer.cancel();
    m_ackTimer.cancel();
    m_awaitingAck = false;
    if (m_transport) {
        ++m_generation;
        m_transport->close();
        m_transport.reset();
    }
}

void UpstreamFeedClient::handleUp() {
    const bool wasReconnecting = m_state.load() == ConnectionState::Reconnecting;
    m_attempt = 0;
    m_pendingError.reset();
    m_lastActivity = std::chrono::steady_clock::now();
    setState(ConnectionState::Connected);
    if (wasReconnecting) ++m_reconnects;

    // Provider-side set starts empty on a fresh socket: join the whole desired set,
    // including channels that were added while we were down.
    std::vector<std::string> joins;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.resetWire();
        joins = m_subscriptions.pendingJoins();
        for (const auto& ch : joins) m_subscriptions.markJoined(ch);
        m_lastError.clear();
    }
    for (const auto& ch : joins) {
        m_transport->send(SubscriptionManager::buildJoinMsg(ch));
    }
    frLog_Upstream("WebSocket connected to {}; joined {} channel(s)", connectionUri(), joins.size());

    if (m_connectPromise) {
        m_connectPromise->set_value();
        m_connectPromise.reset();
    }
    if (m_listening) armIdleTimer();
}

void UpstreamFeedClient::handleDown() {
    m_idleTimer.cancel();
    m_ackTimer.cancel();
    m_awaitingAck = false;
    m_transport.reset();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.resetWire();
    }
    const TransportError err = m_pendingError.value_or(TransportError{"connection closed", 0});
    m_pendingError.reset();

    if (m_closedPromise) {
        m_closedPromise->set_value();
        m_closedPromise.reset();
    }
    if (!m_running.load()) {
        setState(ConnectionState::Disconnected);
        return;
    }

    switch (m_state.load()) {
    case ConnectionState::Connecting: {
        ConnectError::Kind kind = ConnectError::Kind::Network;
        if (err.isAuthRejection()) {
            kind = ConnectError::Kind::Auth;
            m_terminal = true;
            frLog_Error(Upstream, "Upstream rejected the credential (HTTP {})", err.httpStatus);
        } else {
            frLog_Error(Upstream, "Failed to connect: {}", err.message);
        }
        if (m_connectPromise) {
            m_connectPromise->set_exception(std::make_exception_ptr(ConnectError(kind, err.message)));
            m_connectPromise.reset();
        }
        if (m_listening && kind != ConnectError::Kind::Auth) {
            // listen() arrived while the initial connect was in flight
            setState(ConnectionState::Reconnecting);
            m_attempt = 0;
            scheduleReconnect();
            break;
        }
        setState(ConnectionState::Disconnected);
        m_running = false;
        setListening(false);
        break;
    }
    case ConnectionState::Connected:
        frLog_Warning(Upstream, "WebSocket connection closed: {}", err.message);
        if (!m_listening) {
            setState(ConnectionState::Disconnected);
            m_running = false;
            break;
        }
        setState(ConnectionState::Reconnecting);
        m_attempt = 0;
        scheduleReconnect();
        break;
    case ConnectionState::Reconnecting:
        if (err.isAuthRejection()) {
            giveUp(fmt::format("credential rejected during reconnect (HTTP {})", err.httpStatus));
            break;
        }
        frLog_Warning(Upstream, "Reconnect attempt {} failed: {}", m_attempt.load(), err.message);
        scheduleReconnect();
        break;
    case ConnectionState::Disconnected:
        break;
    }
}

void UpstreamFeedClient::scheduleReconnect() {
    const int next = m_attempt.load() + 1;
    const auto delay = m_policy.delayFor(next);
    if (!delay) {
        giveUp(fmt::format("max reconnection attempts ({}) reached", m_cfg.maxAttempts));
        return;
    }
    m_attempt = next;
    frLog_Upstream("Reconnecting in {} ms (attempt {}/{})", delay->count(), next, m_cfg.maxAttempts);

    m_backoffTimer.expires_after(*delay);
    m_backoffTimer.async_wait([this](const boost::system::error_code& ec){
        if (ec || !m_running.load()) return;
        if (m_state.load() != ConnectionState::Reconnecting) return;
        startAttempt();
    });
}

void UpstreamFeedClient::giveUp(const std::string& reason) {
    teardownTransport();
    m_backoffTimer.cancel();
    m_terminal = true;
    m_running = false;
    setLastError(reason);
    setState(ConnectionState::Disconnected);
    setListening(false);
    frLog_Error(Upstream, "Upstream feed stopped permanently: {}", reason);
}

// ============================================================================
// Receive loop (strand)
// ============================================================================

void UpstreamFeedClient::handleFrame(const std::string& raw) {
    m_lastActivity = std::chrono::steady_clock::now();
    m_lastMessageMs = steadyNowMs();
    ++m_framesReceived;

    auto event = FrameParser::parse(raw);
    if (auto* bad = std::get_if<MalformedFrame>(&event)) {
        ++m_parseErrors;
        frLog_Warning(Upstream, "Unexpected message format ({}), {} bytes dropped", bad->reason, raw.size());
        return;
    }

    auto& frame = std::get<DataFrame>(event);
    ChannelHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handlers.find(frame.channel);
        if (it != m_handlers.end()) handler = it->second;
    }
    if (!handler) {
        // likely raced with a just-completed unsubscribe
        ++m_framesDropped;
        LOG_D(FlowRelay::LogCat::kUpstream, "No handler registered for channel: {}", frame.channel);
        return;
    }

    try {
        handler(frame.payload);
    } catch (const std::exception& e) {
        ++m_handlerErrors;
        frLog_Error(Upstream, "Error in handler for {}: {}", frame.channel, e.what());
    }
    frLog_Data("Frame on {} ({} bytes)", frame.channel, raw.size());
}

void UpstreamFeedClient::armIdleTimer() {
    if (m_awaitingAck) return;
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = now - m_lastActivity;
    const auto remaining = elapsed >= m_cfg.receiveTimeout
        ? std::chrono::steady_clock::duration::zero()
        : std::chrono::steady_clock::duration(m_cfg.receiveTimeout) - elapsed;

    m_idleTimer.expires_after(remaining);
    const auto gen = m_generation;
    m_idleTimer.async_wait([this, gen](const boost::system::error_code& ec){
        if (ec || gen != m_generation) return;
        onIdleExpired();
    });
}

void UpstreamFeedClient::onIdleExpired() {
    if (m_state.load() != ConnectionState::Connected || !m_transport || !m_listening) return;

    // Traffic arrived since the timer was armed: just wait out the remainder.
    if (std::chrono::steady_clock::now() - m_lastActivity < m_cfg.receiveTimeout) {
        armIdleTimer();
        return;
    }

    LOG_D(FlowRelay::LogCat::kUpstream, "No messages for {} ms, sending keepalive ping",
          m_cfg.receiveTimeout.count());
    m_awaitingAck = true;
    m_transport->ping();

    m_ackTimer.expires_after(m_cfg.keepaliveAckTimeout);
    const auto gen = m_generation;
    m_ackTimer.async_wait([this, gen](const boost::system::error_code& ec){
        if (ec || gen != m_generation || !m_awaitingAck) return;
        onKeepaliveFailed();
    });
}

void UpstreamFeedClient::onPong() {
    if (!m_awaitingAck) return;
    m_awaitingAck = false;
    m_ackTimer.cancel();
    m_lastActivity = std::chrono::steady_clock::now();
    LOG_D(FlowRelay::LogCat::kUpstream, "Connection alive (pong received)");
    if (m_listening) armIdleTimer();
}

// No ack inside the window: same path as an abnormal close.
void UpstreamFeedClient::onKeepaliveFailed() {
    frLog_Warning(Upstream, "Keepalive not acknowledged within {} ms, triggering reconnect",
                  m_cfg.keepaliveAckTimeout.count());
    setLastError("keepalive timeout");
    m_pendingError = TransportError{"keepalive timeout", 0};
    if (m_transport) {
        ++m_generation;
        m_transport->close();
    }
    handleDown();
}

// ============================================================================
// Status
// ============================================================================

FeedStats UpstreamFeedClient::stats() const {
    FeedStats s;
    s.state = m_state.load();
    s.running = m_running.load();
    s.terminal = m_terminal.load();
    s.reconnectAttempts = m_attempt.load();
    s.connectionUri = connectionUri();
    s.framesReceived = m_framesReceived.load();
    s.framesDropped = m_framesDropped.load();
    s.parseErrors = m_parseErrors.load();
    s.handlerErrors = m_handlerErrors.load();
    s.reconnects = m_reconnects.load();
    if (const auto last = m_lastMessageMs.load(); last != 0) {
        s.lastMessageSecondsAgo = static_cast<double>(steadyNowMs() - last) / 1000.0;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        s.channels = m_subscriptions.desired();
        s.lastError = m_lastError;
    }
    return s;
}
