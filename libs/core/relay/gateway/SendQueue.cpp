#include "SendQueue.hpp"
#include "RelayLogging.hpp"
#include <utility>

SendQueue::SendQueue(const Config& config, Callbacks callbacks)
    : config_(config), callbacks_(std::move(callbacks)) {}

SendQueue::Result SendQueue::enqueue(const Frame& payload, Clock::time_point now) {
    if (!payload) {
        return Result::Accepted;
    }

    Frame toWrite;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Result::Closed;
        }

        if (writeInProgress_ && now - writeStartedAt_ > config_.stallTimeout) {
            frLog_Warning(Gateway, "send queue stalled: write pending for more than {} ms, {} frames queued",
                          config_.stallTimeout.count(), queue_.size());
            closed_ = true;
            clearLocked();
            return Result::Stalled;
        }

        queue_.push_back(payload);
        queuedBytes_ += payload->size();

        if (queue_.size() > config_.maxMessages || queuedBytes_ > config_.maxBytes) {
            frLog_Warning(Gateway, "send queue over bounds: {} frames / {} bytes", queue_.size(), queuedBytes_);
            closed_ = true;
            clearLocked();
            return Result::Overflow;
        }

        if (!writeInProgress_) {
            writeInProgress_ = true;
            writeStartedAt_ = now;
            toWrite = queue_.front();
        }
    }

    if (toWrite && callbacks_.startWrite) {
        callbacks_.startWrite(toWrite);
    }
    return Result::Accepted;
}

void SendQueue::onWriteComplete(Clock::time_point now) {
    Frame next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.empty()) {
            writeInProgress_ = false;
            return;
        }

        const auto bytes = queue_.front()->size();
        queue_.pop_front();
        queuedBytes_ = queuedBytes_ >= bytes ? queuedBytes_ - bytes : 0;

        if (!queue_.empty()) {
            next = queue_.front();
            writeInProgress_ = true;
            writeStartedAt_ = now;
        } else {
            writeInProgress_ = false;
        }
    }

    if (next && callbacks_.startWrite) {
        callbacks_.startWrite(next);
    }
}

void SendQueue::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    clearLocked();
}

std::size_t SendQueue::queuedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t SendQueue::queuedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queuedBytes_;
}

bool SendQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void SendQueue::clearLocked() {
    queue_.clear();
    queuedBytes_ = 0;
    writeInProgress_ = false;
}

const char* toString(SendQueue::Result r) {
    switch (r) {
        case SendQueue::Result::Accepted: return "accepted";
        case SendQueue::Result::Overflow: return "overflow";
        case SendQueue::Result::Stalled:  return "stalled";
        case SendQueue::Result::Closed:   return "closed";
    }
    return "unknown";
}
