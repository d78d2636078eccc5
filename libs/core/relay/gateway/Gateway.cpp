#include "Gateway.hpp"
#include "RelayLogging.hpp"
#include "relay/gateway/DownstreamSession.hpp"
#include "relay/gateway/HttpSession.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace {

[[noreturn]] void bindFailure(const char* what, const GatewayConfig& cfg, const beast::error_code& ec) {
    throw std::runtime_error(fmt::format("Gateway: {} {}:{} failed: {}", what, cfg.address, cfg.port, ec.message()));
}

} // namespace

Gateway::Gateway(GatewayConfig cfg, ChannelRegistry& registry, IFeedControl* feed)
    : m_cfg(std::move(cfg))
    , m_registry(registry)
    , m_feed(feed)
    , m_routes(m_cfg.routePrefix)
    , m_api(m_routes, m_registry, m_feed)
    , m_acceptor(net::make_strand(m_ioc))
{}

Gateway::~Gateway() {
    try {
        stop();
    } catch (const std::exception& e) {
        frLog_Error(Gateway, "Gateway shutdown failed: {}", e.what());
    }
}

void Gateway::start() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (!m_threads.empty()) return;

    beast::error_code ec;
    const auto address = net::ip::make_address(m_cfg.address, ec);
    if (ec) bindFailure("parse address", m_cfg, ec);

    const tcp::endpoint endpoint{address, m_cfg.port};
    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) bindFailure("open", m_cfg, ec);
    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) bindFailure("set_option", m_cfg, ec);
    m_acceptor.bind(endpoint, ec);
    if (ec) bindFailure("bind", m_cfg, ec);
    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) bindFailure("listen", m_cfg, ec);

    m_boundPort = m_acceptor.local_endpoint().port();
    m_accepting = true;
    doAccept();

    const int threads = m_cfg.threads > 0 ? m_cfg.threads : 1;
    m_threads.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        m_threads.emplace_back([this] { run(); });
    }
    frLog_Gateway("Gateway listening on {}:{}{} ({} thread(s){})", m_cfg.address, port(), m_routes.prefix(),
                  threads, m_feed ? "" : ", streaming disabled");
}

void Gateway::run() {
    for (;;) {
        try {
            m_ioc.run();
            break;
        } catch (const std::exception& e) {
            frLog_Error(Gateway, "Unhandled exception on gateway io thread: {}", e.what());
        }
    }
}

void Gateway::doAccept() {
    m_acceptor.async_accept(net::make_strand(m_ioc),
        beast::bind_front_handler(&Gateway::onAccept, this));
}

void Gateway::onAccept(beast::error_code ec, tcp::socket socket) {
    if (!m_accepting) return;
    if (ec) {
        if (ec != net::error::operation_aborted) {
            frLog_Warning(Gateway, "accept failed: {}", ec.message());
        }
    } else {
        std::make_shared<HttpSession>(std::move(socket), *this)->run();
    }
    doAccept();
}

void Gateway::stopAccepting() {
    m_api.beginShutdown();
    {
        // openStream() checks the flag under the same lock, so stop() sees every session it admitted
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        if (!m_accepting.exchange(false)) return;
    }
    net::post(m_acceptor.get_executor(), [this] {
        beast::error_code ec;
        m_acceptor.close(ec);
        if (ec) {
            frLog_Warning(Gateway, "closing listener: {}", ec.message());
        }
    });
    frLog_Gateway("Gateway no longer accepting connections");
}

void Gateway::openStream(tcp::socket&& socket, std::string channel, http::request<http::string_body>&& req) {
    std::shared_ptr<DownstreamSession> session;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        if (!m_accepting) {
            frLog_Gateway("Refusing upgrade for {}: gateway is shutting down", channel);
            beast::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
            return;
        }
        session = std::make_shared<DownstreamSession>(
            std::move(socket), m_feed ? &m_registry : nullptr, std::move(channel), m_cfg,
            [this](ConnectionId id) { sessionFinished(id); });
        m_sessions.emplace(session->id(), session);
    }
    LOG_D(FlowRelay::LogCat::kGateway, "Upgrading session {} for {}", session->id(), session->channel());
    session->run(std::move(req));
}

void Gateway::sessionFinished(ConnectionId id) {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    m_sessions.erase(id);
    m_sessionsCv.notify_all();
}

std::size_t Gateway::sessionCount() const {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    return m_sessions.size();
}

void Gateway::stop(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (m_threads.empty()) return;

    stopAccepting();

    std::vector<std::shared_ptr<DownstreamSession>> live;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        for (const auto& [id, weak] : m_sessions) {
            if (auto s = weak.lock()) live.push_back(std::move(s));
        }
    }
    frLog_Gateway("Closing {} downstream session(s)", live.size());
    for (const auto& s : live) s->close(CloseCause::Shutdown);
    live.clear();

    {
        std::unique_lock<std::mutex> lock(m_sessionsMutex);
        if (!m_sessionsCv.wait_for(lock, grace, [this] { return m_sessions.empty(); })) {
            frLog_Warning(Gateway, "{} session(s) still open after {} ms; dropping them", m_sessions.size(), grace.count());
        }
    }

    m_ioc.stop();
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();

    if (m_acceptor.is_open()) {
        beast::error_code ec;
        m_acceptor.close(ec);
        if (ec) {
            frLog_Warning(Gateway, "closing listener: {}", ec.message());
        }
    }
    m_boundPort = 0;
    frLog_Gateway("Gateway stopped");
}
