/*
FlowRelay — RelayConfig
Role: JSON parsing, environment overrides and validation for RelayConfig.
Observability: Every failure is a std::runtime_error whose message names the key.
Related: RelayConfig.hpp, ApiToken.cpp.
*/
#include "RelayConfig.hpp"
#include "relay/auth/ApiToken.hpp"
#include "Log.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

std::chrono::milliseconds readMs(const nlohmann::json& section, const char* key,
                                 std::chrono::milliseconds def, const std::string& where) {
    if (!section.contains(key)) return def;
    const auto& v = section.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw std::runtime_error("RelayConfig: '" + where + "." + key + "' must be a positive integer (ms)");
    }
    return std::chrono::milliseconds(v.get<long long>());
}

template <typename T>
T readValue(const nlohmann::json& section, const char* key, T def, const std::string& where) {
    if (!section.contains(key)) return def;
    try {
        return section.at(key).get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("RelayConfig: invalid value for '" + where + "." + key + "': " + ex.what());
    }
}

const nlohmann::json& sectionOf(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!root.contains(name)) return empty;
    const auto& s = root.at(name);
    if (!s.is_object()) {
        throw std::runtime_error(std::string("RelayConfig: '") + name + "' must be an object");
    }
    return s;
}

std::uint16_t parsePort(const std::string& value, const std::string& label) {
    try {
        std::size_t used = 0;
        const auto port = std::stoul(value, &used);
        if (used != value.size() || port == 0U || port > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(port);
    } catch (const std::exception&) {
        throw std::runtime_error("RelayConfig: invalid port for '" + label + "': " + value);
    }
}

}

EnvLookup processEnvironment() {
    return [](const char* name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name)) return std::string(v);
        return std::nullopt;
    };
}

RelayConfig RelayConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("RelayConfig: top-level document must be an object");
    }
    RelayConfig cfg;

    const auto& up = sectionOf(j, "upstream");
    cfg.upstream.host = readValue<std::string>(up, "host", cfg.upstream.host, "upstream");
    if (up.contains("port")) {
        // accept both "443" and 443
        const auto& p = up.at("port");
        std::string port = p.is_number_integer() ? std::to_string(p.get<long long>())
                                                 : readValue<std::string>(up, "port", cfg.upstream.port, "upstream");
        parsePort(port, "upstream.port");
        cfg.upstream.port = port;
    }
    cfg.upstream.path  = readValue<std::string>(up, "path", cfg.upstream.path, "upstream");
    cfg.upstream.token = readValue<std::string>(up, "token", cfg.upstream.token, "upstream");
    cfg.upstream.receiveTimeout      = readMs(up, "receive_timeout_ms", cfg.upstream.receiveTimeout, "upstream");
    cfg.upstream.keepaliveAckTimeout = readMs(up, "keepalive_ack_timeout_ms", cfg.upstream.keepaliveAckTimeout, "upstream");
    cfg.upstream.connectTimeout      = readMs(up, "connect_timeout_ms", cfg.upstream.connectTimeout, "upstream");
    cfg.upstream.baseDelay           = readMs(up, "base_delay_ms", cfg.upstream.baseDelay, "upstream");
    cfg.upstream.maxDelay            = readMs(up, "max_delay_ms", cfg.upstream.maxDelay, "upstream");
    cfg.upstream.maxAttempts = readValue<int>(up, "max_attempts", cfg.upstream.maxAttempts, "upstream");
    cfg.upstream.jitter      = readValue<double>(up, "jitter", cfg.upstream.jitter, "upstream");

    const auto& gw = sectionOf(j, "gateway");
    cfg.gateway.address = readValue<std::string>(gw, "address", cfg.gateway.address, "gateway");
    if (gw.contains("port")) {
        const int port = readValue<int>(gw, "port", cfg.gateway.port, "gateway");
        if (port < 0 || port > 65535) {
            throw std::runtime_error("RelayConfig: 'gateway.port' out of range");
        }
        cfg.gateway.port = static_cast<std::uint16_t>(port);
    }
    cfg.gateway.threads     = readValue<int>(gw, "threads", cfg.gateway.threads, "gateway");
    cfg.gateway.routePrefix = readValue<std::string>(gw, "route_prefix", cfg.gateway.routePrefix, "gateway");
    cfg.gateway.sendQueueMaxMessages = readValue<std::size_t>(gw, "send_queue_max_messages", cfg.gateway.sendQueueMaxMessages, "gateway");
    cfg.gateway.sendQueueMaxBytes    = readValue<std::size_t>(gw, "send_queue_max_bytes", cfg.gateway.sendQueueMaxBytes, "gateway");
    cfg.gateway.stallTimeout = readMs(gw, "stall_timeout_ms", cfg.gateway.stallTimeout, "gateway");
    cfg.gateway.idleTimeout  = readMs(gw, "idle_timeout_ms", cfg.gateway.idleTimeout, "gateway");

    cfg.logLevel      = readValue<std::string>(j, "log_level", cfg.logLevel, "root");
    cfg.shutdownGrace = readMs(j, "shutdown_grace_ms", cfg.shutdownGrace, "root");

    cfg.validate();
    return cfg;
}

RelayConfig RelayConfig::load(const std::string& path, bool required) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw std::runtime_error("RelayConfig: failed to open config file: " + path);
        }
        return RelayConfig{};
    }

    nlohmann::json j;
    try {
        file >> j;
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("RelayConfig: failed to parse JSON from " + path + ": " + ex.what());
    }
    return fromJson(j);
}

void RelayConfig::applyEnvironment(const EnvLookup& env) {
    if (auto token = ApiToken::fromEnvironment(env)) {
        upstream.token = *token;
    }
    if (auto port = env("FLOWRELAY_PORT"); port && !port->empty()) {
        gateway.port = parsePort(*port, "FLOWRELAY_PORT");
    }
    if (auto level = env("FLOWRELAY_LOG"); level && !level->empty()) {
        logLevel = *level;
    }
    validate();
}

void RelayConfig::validate() const {
    if (upstream.host.empty()) {
        throw std::runtime_error("RelayConfig: 'upstream.host' must not be empty");
    }
    if (upstream.path.empty() || upstream.path.front() != '/') {
        throw std::runtime_error("RelayConfig: 'upstream.path' must start with '/'");
    }
    if (upstream.maxAttempts < 1) {
        throw std::runtime_error("RelayConfig: 'upstream.max_attempts' must be >= 1");
    }
    if (upstream.jitter < 0.0 || upstream.jitter >= 1.0) {
        throw std::runtime_error("RelayConfig: 'upstream.jitter' must be in [0, 1)");
    }
    if (upstream.maxDelay < upstream.baseDelay) {
        throw std::runtime_error("RelayConfig: 'upstream.max_delay_ms' must be >= 'upstream.base_delay_ms'");
    }
    if (gateway.threads < 1) {
        throw std::runtime_error("RelayConfig: 'gateway.threads' must be >= 1");
    }
    if (!gateway.routePrefix.empty() &&
        (gateway.routePrefix.front() != '/' || gateway.routePrefix.back() == '/')) {
        throw std::runtime_error("RelayConfig: 'gateway.route_prefix' must start with '/' and not end with '/'");
    }
    if (gateway.sendQueueMaxMessages == 0 || gateway.sendQueueMaxBytes == 0) {
        throw std::runtime_error("RelayConfig: send queue bounds must be positive");
    }
    if (!FlowRelay::Log::tryParseLevel(logLevel)) {
        throw std::runtime_error("RelayConfig: 'log_level' must be one of trace|debug|info|warn|error, got: " + logLevel);
    }
}
