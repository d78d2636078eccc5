#include "ReconnectPolicy.hpp"
#include <algorithm>

ReconnectPolicy::ReconnectPolicy(Params p)
    : m_params(p)
    , m_gen(std::random_device{}())
{}

ReconnectPolicy::ReconnectPolicy(Params p, JitterSource source)
    : m_params(p)
    , m_source(std::move(source))
    , m_gen(std::random_device{}())
{}

std::chrono::milliseconds ReconnectPolicy::nominalDelay(int attempt) const {
    if (attempt < 1) attempt = 1;
    // doubling stops at the cap, so no overflow however long the outage
    auto delay = m_params.baseDelay;
    for (int i = 1; i < attempt && delay < m_params.maxDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, m_params.maxDelay);
}

std::chrono::milliseconds ReconnectPolicy::jitteredDelay(int attempt) {
    const auto nominal = nominalDelay(attempt);
    if (m_params.jitter <= 0.0) return nominal;
    double sample = 0.0;
    if (m_source) {
        sample = std::clamp(m_source(), -1.0, 1.0);
    } else {
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        sample = dist(m_gen);
    }
    const double factor = 1.0 + sample * m_params.jitter;
    const auto ms = static_cast<long long>(static_cast<double>(nominal.count()) * factor);
    return std::chrono::milliseconds(std::max(0LL, ms));
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::delayFor(int attempt) {
    if (exhausted(attempt)) return std::nullopt;
    return jitteredDelay(attempt);
}
