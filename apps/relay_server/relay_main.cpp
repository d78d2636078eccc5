#include "RelayLogging.hpp"
#include "relay/RelayService.hpp"
#include "relay/config/RelayConfig.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <fmt/core.h>
#include <csignal>
#include <exception>
#include <string>

namespace {

void usage(const char* argv0) {
    fmt::print(stderr, "Usage: {} [--config <file>] [--log-level trace|debug|info|warn|error]\n", argv0);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "flowrelay.json";
    bool explicitConfig = false;
    std::string levelOverride;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            explicitConfig = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            levelOverride = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    RelayConfig cfg;
    try {
        cfg = RelayConfig::load(configPath, explicitConfig);
        cfg.applyEnvironment(processEnvironment());
        if (!levelOverride.empty()) cfg.logLevel = levelOverride;
        cfg.validate();
    } catch (const std::exception& e) {
        fmt::print(stderr, "flowrelay: configuration error: {}\n", e.what());
        return 1;
    }

    if (auto level = FlowRelay::Log::tryParseLevel(cfg.logLevel)) {
        FlowRelay::Log::setLevel(*level);
    }

    try {
        RelayService relay(cfg);
        relay.start();

        boost::asio::io_context signals;
        boost::asio::signal_set set(signals, SIGINT, SIGTERM);
        set.async_wait([](const boost::system::error_code& ec, int sig) {
            if (!ec) frLog_App("Received signal {}, shutting down", sig);
        });
        signals.run();

        relay.stop();
    } catch (const std::exception& e) {
        frLog_Error(App, "Relay failed: {}", e.what());
        return 1;
    }
    return 0;
}
