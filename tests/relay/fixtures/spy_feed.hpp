#pragma once
#include "relay/upstream/FeedInterfaces.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/// Upstream stand-in: records subscribe/unsubscribe calls and lets the test
/// push payloads through the registered handlers. Also answers IFeedControl.
class SpyFeed : public IFeedSubscriber, public IFeedControl {
public:
    void subscribe(const std::string& channel, ChannelHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("subscribe:" + channel);
        handlers_[channel] = std::move(handler);
    }

    void unsubscribe(const std::string& channel) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("unsubscribe:" + channel);
        handlers_.erase(channel);
    }

    // Invokes the handler as the receive loop would; throws if none registered.
    void emit(const std::string& channel, const nlohmann::json& payload) {
        ChannelHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(channel);
            if (it == handlers_.end()) throw std::runtime_error("SpyFeed: no handler for " + channel);
            h = it->second;
        }
        h(payload);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    int count(const std::string& call) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(calls_.begin(), calls_.end(), call));
    }
    bool hasHandler(const std::string& channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.count(channel) > 0;
    }

    // IFeedControl
    ConnectionState connectionState() const override { return stats_.state; }
    FeedStats stats() const override { return stats_; }
    bool forceReconnect() override {
        ++forced_;
        return acceptReconnect_;
    }

    FeedStats stats_;
    int forced_ = 0;
    bool acceptReconnect_ = true;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::map<std::string, ChannelHandler> handlers_;
};
