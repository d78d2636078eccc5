#pragma once

#include "Log.hpp"
#include <atomic>
#include <cstdint>
#include <string_view>

// =============================================================================
// FLOWRELAY LOGGING CATEGORIES
// =============================================================================
// Five categories on top of FlowRelay::Log. Per-frame call sites go through
// the throttled macros so a busy feed does not flood the console.

namespace FlowRelay::LogCat {
    inline constexpr std::string_view kApp      = "app";       // lifecycle, config, shutdown
    inline constexpr std::string_view kUpstream = "upstream";  // provider connection, reconnects
    inline constexpr std::string_view kRegistry = "registry";  // attach/detach, fan-out
    inline constexpr std::string_view kGateway  = "gateway";   // accept, downstream sessions, HTTP
    inline constexpr std::string_view kData     = "data";      // per-frame diagnostics
}

namespace FlowRelay::log_throttle {
    inline constexpr unsigned kApp      = 1;
    inline constexpr unsigned kUpstream = 1;
    inline constexpr unsigned kRegistry = 1;
    inline constexpr unsigned kGateway  = 1;
    inline constexpr unsigned kData     = 100;   // every 100th frame
}

// Throttled call site; interval overridable with FLOWRELAY_LOG_<Cat>_INTERVAL
#define FRLOG_THROTTLED(level, Cat, defaultInterval, fmt, ...)                            \
    do {                                                                                   \
        static std::atomic<std::uint32_t> _counter{0};                                     \
        static const unsigned _interval =                                                  \
            ::FlowRelay::Log::throttleInterval("FLOWRELAY_LOG_" #Cat "_INTERVAL", (defaultInterval)); \
        if ((_counter.fetch_add(1, std::memory_order_relaxed) % _interval) == 0) {         \
            LOG_IMPL(level, ::FlowRelay::LogCat::k##Cat, fmt __VA_OPT__(,) __VA_ARGS__);   \
        }                                                                                  \
    } while(false)

#define frLog_App(fmt, ...)       FRLOG_THROTTLED(INFO,  App,      ::FlowRelay::log_throttle::kApp,      fmt __VA_OPT__(,) __VA_ARGS__)
#define frLog_Upstream(fmt, ...)  FRLOG_THROTTLED(INFO,  Upstream, ::FlowRelay::log_throttle::kUpstream, fmt __VA_OPT__(,) __VA_ARGS__)
#define frLog_Registry(fmt, ...)  FRLOG_THROTTLED(DEBUG, Registry, ::FlowRelay::log_throttle::kRegistry, fmt __VA_OPT__(,) __VA_ARGS__)
#define frLog_Gateway(fmt, ...)   FRLOG_THROTTLED(INFO,  Gateway,  ::FlowRelay::log_throttle::kGateway,  fmt __VA_OPT__(,) __VA_ARGS__)
#define frLog_Data(fmt, ...)      FRLOG_THROTTLED(DEBUG, Data,     ::FlowRelay::log_throttle::kData,     fmt __VA_OPT__(,) __VA_ARGS__)

#define frLog_DataN(n, fmt, ...)  FRLOG_THROTTLED(DEBUG, Data, n, fmt __VA_OPT__(,) __VA_ARGS__)

// Never throttled
#define frLog_Warning(Cat, fmt, ...) LOG_IMPL(WARN,  ::FlowRelay::LogCat::k##Cat, fmt __VA_OPT__(,) __VA_ARGS__)
#define frLog_Error(Cat, fmt, ...)   LOG_IMPL(ERROR, ::FlowRelay::LogCat::k##Cat, fmt __VA_OPT__(,) __VA_ARGS__)

// Runtime control:
//   export FLOWRELAY_LOG=debug                 # level
//   export FLOWRELAY_LOG_Data_INTERVAL=1       # every frame
//   export FLOWRELAY_LOG_Gateway_INTERVAL=10   # every 10th gateway event
