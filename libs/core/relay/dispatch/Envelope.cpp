#include "Envelope.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <ctime>

namespace Envelope {

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(t), ms);
}

Frame make(const std::string& channel, const nlohmann::json& payload,
           std::chrono::system_clock::time_point now) {
    nlohmann::json out;
    out["channel"] = channel;
    out["timestamp"] = isoTimestamp(now);
    out["data"] = payload;
    return std::make_shared<const std::string>(out.dump());
}

}
