#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Bounded per-session outbound queue. The front entry is the frame being written;
// at most one write is in flight. Overflowing a bound, or a write that has not
// completed within stallTimeout, closes the queue and the caller drops the session.
class SendQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Frame = std::shared_ptr<const std::string>;

    struct Config {
        std::size_t maxMessages = 500;
        std::size_t maxBytes = 16 * 1024 * 1024;
        std::chrono::milliseconds stallTimeout{20000};
    };

    struct Callbacks {
        std::function<void(const Frame&)> startWrite;   // invoked outside the queue lock
    };

    enum class Result { Accepted, Overflow, Stalled, Closed };

    SendQueue(const Config& config, Callbacks callbacks);

    SendQueue(const SendQueue&) = delete;
    SendQueue& operator=(const SendQueue&) = delete;

    Result enqueue(const Frame& payload, Clock::time_point now = Clock::now());
    void onWriteComplete(Clock::time_point now = Clock::now());
    void shutdown();

    std::size_t queuedMessages() const;
    std::size_t queuedBytes() const;
    bool closed() const;

private:
    void clearLocked();

    const Config config_;
    Callbacks callbacks_;

    mutable std::mutex mutex_;
    std::deque<Frame> queue_;
    std::size_t queuedBytes_ = 0;
    bool writeInProgress_ = false;
    Clock::time_point writeStartedAt_{};
    bool closed_ = false;
};

const char* toString(SendQueue::Result r);
