#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Downstream frame: {"channel": ..., "timestamp": <UTC ISO-8601, ms>, "data": <payload>}
// Serialised once and shared by every recipient of a broadcast.
namespace Envelope {

using Frame = std::shared_ptr<const std::string>;

std::string isoTimestamp(std::chrono::system_clock::time_point tp);

Frame make(const std::string& channel, const nlohmann::json& payload,
           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

}
