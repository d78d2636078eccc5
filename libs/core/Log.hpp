#pragma once
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace FlowRelay {
namespace Log {

enum class Level { TRACE=0, DEBUG, INFO, WARN, ERROR };

inline std::optional<Level> tryParseLevel(std::string_view s) {
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info")  return Level::INFO;
    if (s == "warn")  return Level::WARN;
    if (s == "error") return Level::ERROR;
    return std::nullopt;
}

inline Level parseLevel(const char* env) {
    if(!env) return Level::INFO;
    return tryParseLevel(env).value_or(Level::ERROR);
}

inline std::atomic<Level>& runtimeLevel() {
    static std::atomic<Level> level = []{
#ifdef NDEBUG
        Level def = Level::INFO;
#else
        Level def = Level::DEBUG;
#endif
        if(const char* env = std::getenv("FLOWRELAY_LOG"))
            return parseLevel(env);
        return def;
    }();
    return level;
}

inline void setLevel(Level lvl) { runtimeLevel().store(lvl); }

inline bool enabled(Level lvl) { return lvl >= runtimeLevel().load(std::memory_order_relaxed); }

inline const char* toString(Level lvl) {
    switch(lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        default:           return "ERROR";
    }
}

inline std::string_view baseName(const char* file) {
    std::string_view f(file);
    size_t pos = f.find_last_of("/\\");
    return pos==std::string_view::npos ? f : f.substr(pos+1);
}

// Interval for throttled call sites; FLOWRELAY_LOG_<Category>_INTERVAL wins over the default.
inline unsigned throttleInterval(const char* envName, unsigned def) {
    if (const char* env = std::getenv(envName)) {
        int v = std::atoi(env);
        if (v > 0) return static_cast<unsigned>(v);
    }
    return def == 0 ? 1u : def;
}

template<class... Args>
inline void log(Level lvl, std::string_view category, const char* file, int line,
                fmt::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(lvl)) return;
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    auto msg = fmt::format(fmt, std::forward<Args>(args)...);
    // one write per line so lines from the io threads do not interleave
    std::FILE* out = lvl >= Level::WARN ? stderr : stdout;
    fmt::print(out, "[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{}:{}] {}\n",
               std::chrono::floor<std::chrono::seconds>(now),
               us%1000000,
               toString(lvl), category, baseName(file), line, msg);
}

}
}

#define LOG_IMPL(level, cat, fmt, ...) ::FlowRelay::Log::log(::FlowRelay::Log::Level::level, cat, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_T(cat, fmt, ...) LOG_IMPL(TRACE, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_D(cat, fmt, ...) LOG_IMPL(DEBUG, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_I(cat, fmt, ...) LOG_IMPL(INFO,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_W(cat, fmt, ...) LOG_IMPL(WARN,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_E(cat, fmt, ...) LOG_IMPL(ERROR, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
