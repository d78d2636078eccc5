#pragma once
#include <nlohmann/json.hpp>
#include <string>

/// Provider frames in the shape the streaming socket sends them:
/// ["<channel>", <payload>]
namespace fixtures {

inline nlohmann::json flowAlertPayload(const std::string& ticker = "SPY") {
    return {
        {"id", "c2d7bb6e-5c0e-4c43-9a2d-0f0e0ad1b001"},
        {"ticker", ticker},
        {"option_chain", ticker + "251017C00580000"},
        {"type", "call"},
        {"strike", "580"},
        {"expiry", "2025-10-17"},
        {"total_premium", "1250000"},
        {"total_size", 2500},
        {"has_sweep", true},
        {"executed_at", 1760443496789LL}
    };
}

inline nlohmann::json gexPayload(const std::string& ticker = "SPY") {
    return {
        {"ticker", ticker},
        {"gamma_per_one_percent_move_oi", "-1523345.12"},
        {"price", "579.81"},
        {"timestamp", 1760443496000LL}
    };
}

inline std::string frame(const std::string& channel, const nlohmann::json& payload) {
    return nlohmann::json::array({channel, payload}).dump();
}

inline std::string flowAlertFrame(const std::string& ticker = "SPY") {
    return frame("flow-alerts", flowAlertPayload(ticker));
}

inline std::string gexFrame(const std::string& ticker = "SPY") {
    return frame("gex:" + ticker, gexPayload(ticker));
}

// Provider acknowledgement of a join: ["<channel>", {"response": {}, "status": "ok"}]
inline std::string joinAck(const std::string& channel) {
    return frame(channel, {{"response", nlohmann::json::object()}, {"status", "ok"}});
}

}
