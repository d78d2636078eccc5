#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <random>

// Exponential backoff: base * 2^(attempt-1), capped at maxDelay, then +/- jitter.
// Attempts are 1-based; anything past maxAttempts means give up.
class ReconnectPolicy {
public:
    struct Params {
        std::chrono::milliseconds baseDelay{5000};
        std::chrono::milliseconds maxDelay{60000};
        int maxAttempts = 5;
        double jitter = 0.1;
    };

    // Sample in [-1, 1]; defaults to a uniform draw from m_gen.
    using JitterSource = std::function<double()>;

    explicit ReconnectPolicy(Params p);
    ReconnectPolicy(Params p, JitterSource source);

    std::chrono::milliseconds nominalDelay(int attempt) const;
    std::chrono::milliseconds jitteredDelay(int attempt);

    // Delay before the given attempt, or nullopt once the attempt limit is reached.
    std::optional<std::chrono::milliseconds> delayFor(int attempt);

    bool exhausted(int attempt) const { return attempt > m_params.maxAttempts; }
    const Params& params() const { return m_params; }

private:
    Params m_params;
    JitterSource m_source;
    std::mt19937 m_gen;
};
