// Upstream connectivity probe: connect with the configured credential, join a few
// channels, print what arrives for a while, then summarise.
#include "RelayLogging.hpp"
#include "relay/auth/ApiToken.hpp"
#include "relay/config/RelayConfig.hpp"
#include "relay/upstream/UpstreamFeedClient.hpp"
#include <fmt/core.h>
#include <atomic>
#include <chrono>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kPreviewChars = 100;

void usage(const char* argv0) {
    fmt::print(stderr, "Usage: {} [--config <file>] [--duration <seconds>] [channel...]\n", argv0);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "flowrelay.json";
    bool explicitConfig = false;
    int durationSec = 30;
    std::vector<std::string> channels;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--duration" && i + 1 < argc) {
            try {
                durationSec = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                usage(argv[0]);
                return 1;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            explicitConfig = true;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            channels.push_back(arg);
        }
    }
    if (channels.empty()) channels = {"flow-alerts", "gex:SPY"};

    RelayConfig cfg;
    try {
        cfg = RelayConfig::load(configPath, explicitConfig);
        cfg.applyEnvironment(processEnvironment());
        cfg.validate();
    } catch (const std::exception& e) {
        fmt::print(stderr, "flowrelay_feed: configuration error: {}\n", e.what());
        return 1;
    }
    if (auto level = FlowRelay::Log::tryParseLevel(cfg.logLevel)) {
        FlowRelay::Log::setLevel(*level);
    }
    if (!cfg.streamingEnabled()) {
        fmt::print(stderr, "flowrelay_feed: no API token (set one of {}, {}, {})\n",
                   ApiToken::kEnvVars[0], ApiToken::kEnvVars[1], ApiToken::kEnvVars[2]);
        return 1;
    }

    fmt::print("[FlowRelay feed probe] token {} | {} s | channels:", ApiToken::redact(cfg.upstream.token), durationSec);
    for (const auto& c : channels) fmt::print(" {}", c);
    fmt::print("\n");

    UpstreamFeedClient client(cfg.upstream);
    try {
        client.connect();
    } catch (const ConnectError& e) {
        fmt::print(stderr, "Connect failed: {}\n", e.what());
        return 1;
    }
    fmt::print("Connected to {}\n", client.connectionUri());

    std::atomic<std::uint64_t> total{0};
    std::mutex countsMutex;
    std::map<std::string, std::uint64_t> perChannel;

    for (const auto& channel : channels) {
        client.subscribe(channel, [&, channel](const nlohmann::json& payload) {
            const auto n = ++total;
            {
                std::lock_guard<std::mutex> lock(countsMutex);
                ++perChannel[channel];
            }
            auto text = payload.dump();
            if (text.size() > kPreviewChars) text = text.substr(0, kPreviewChars) + "...";
            fmt::print("#{} [{}] {}\n", n, channel, text);
        });
    }
    client.listen();

    if (!client.waitUntilStopped(std::chrono::seconds(durationSec))) {
        fmt::print("Duration elapsed\n");
    } else {
        fmt::print("Feed stopped early: {}\n", client.stats().lastError);
    }
    client.stop(cfg.shutdownGrace);

    fmt::print("\n=== Summary ===\n");
    fmt::print("Messages received: {}\n", total.load());
    std::lock_guard<std::mutex> lock(countsMutex);
    for (const auto& channel : channels) {
        fmt::print("  {:<24} {}\n", channel, perChannel[channel]);
    }
    return 0;
}
