#pragma once
/*
FlowRelay — RelayConfig
Role: Typed configuration for the upstream feed, the downstream gateway and the process.
Inputs/Outputs: Reads a JSON document (nlohmann) and environment overrides; yields a validated RelayConfig.
Threading: Built once on the main thread before any component starts; read-only afterwards.
Performance: Not on any hot path.
Integration: Consumed by RelayService, UpstreamFeedClient, Gateway and the feed CLI.
Observability: Throws std::runtime_error naming the offending key; never logs the credential.
Related: RelayConfig.cpp, ApiToken.hpp.
Assumptions: Durations in the file are milliseconds (keys suffixed _ms).
*/
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Environment accessor; injectable so tests do not touch the process environment.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

EnvLookup processEnvironment();

struct UpstreamConfig {
    std::string host = "api.unusualwhales.com";
    std::string port = "443";
    std::string path = "/socket";
    std::string token;                                   // empty => streaming disabled

    std::chrono::milliseconds receiveTimeout{30000};     // silence before a keepalive probe
    std::chrono::milliseconds keepaliveAckTimeout{10000};
    std::chrono::milliseconds connectTimeout{30000};

    std::chrono::milliseconds baseDelay{5000};
    std::chrono::milliseconds maxDelay{60000};
    int maxAttempts = 5;
    double jitter = 0.1;                                 // fraction of the nominal delay, +/-
};

struct GatewayConfig {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    int threads = 2;
    std::string routePrefix = "/api/stream";

    std::size_t sendQueueMaxMessages = 500;
    std::size_t sendQueueMaxBytes = 16 * 1024 * 1024;
    std::chrono::milliseconds stallTimeout{20000};
    std::chrono::milliseconds idleTimeout{300000};
};

struct RelayConfig {
    UpstreamConfig upstream;
    GatewayConfig gateway;
    std::string logLevel = "info";
    std::chrono::milliseconds shutdownGrace{2000};

    bool streamingEnabled() const { return !upstream.token.empty(); }

    static RelayConfig fromJson(const nlohmann::json& j);

    // A missing file is an error only when the caller asked for that file explicitly.
    static RelayConfig load(const std::string& path, bool required);

    void applyEnvironment(const EnvLookup& env);
    void validate() const;
};
