#pragma once
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Desired channel set plus what the provider currently has joined on this wire.
// The desired set survives reconnects; the wire set is reset on every new connection.
class SubscriptionManager {
public:
    // true when the channel was not desired before
    bool add(const std::string& channel) { return m_desired.insert(channel).second; }
    bool remove(const std::string& channel) { return m_desired.erase(channel) > 0; }

    bool isDesired(const std::string& channel) const { return m_desired.count(channel) > 0; }
    bool isJoined(const std::string& channel) const { return m_joined.count(channel) > 0; }

    std::vector<std::string> desired() const { return {m_desired.begin(), m_desired.end()}; }
    std::vector<std::string> joined() const { return {m_joined.begin(), m_joined.end()}; }

    void markJoined(const std::string& channel) { m_joined.insert(channel); }
    void markLeft(const std::string& channel) { m_joined.erase(channel); }
    void resetWire() { m_joined.clear(); }

    // Desired channels not yet joined on the current wire, in name order.
    std::vector<std::string> pendingJoins() const {
        std::vector<std::string> out;
        for (const auto& ch : m_desired) {
            if (!m_joined.count(ch)) out.push_back(ch);
        }
        return out;
    }

    static std::string buildJoinMsg(const std::string& channel) { return buildMsg("join", channel); }
    static std::string buildLeaveMsg(const std::string& channel) { return buildMsg("leave", channel); }

private:
    std::set<std::string> m_desired;
    std::set<std::string> m_joined;

    static std::string buildMsg(const char* type, const std::string& channel) {
        nlohmann::json msg;
        msg["channel"] = channel;
        msg["msg_type"] = type;
        return msg.dump();
    }
};
