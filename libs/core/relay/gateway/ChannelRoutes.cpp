#include "ChannelRoutes.hpp"
#include "relay/dispatch/Channels.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

constexpr std::string_view kWs = "/ws/";
constexpr std::size_t kMaxTicker = 12;
constexpr std::size_t kMaxChannel = 64;

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool startsWith(std::string_view s, std::string_view p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

} // namespace

ChannelRoutes::ChannelRoutes(std::string prefix)
    : m_prefix(std::move(prefix))
{
    while (!m_prefix.empty() && m_prefix.back() == '/') m_prefix.pop_back();

    m_catalogue = {
        {"flow-alerts", "Options Flow Alerts", "/ws/flow",
         "Real-time options flow activity and unusual trades", ch::kFlowAlerts, false, true},
        {"gex", "Gamma Exposure", "/ws/gex/{ticker}",
         "Gamma exposure updates for one ticker", ch::kGexPrefix, true, true},
        {"option-trades", "Option Trades", "/ws/option-trades/{ticker}",
         "Option trade prints for one ticker", ch::kOptionTradesPrefix, true, true},
        {"market-movers", "Market Movers", "/ws/market-movers",
         "Real-time market movers and top gainers/losers", ch::kMarketMovers, false, false},
        {"dark-pool", "Dark Pool", "/ws/dark-pool",
         "Real-time dark pool activity and volume", ch::kDarkPool, false, false},
        {"congress", "Congress Trades", "/ws/congress",
         "Real-time congressional trade filings", ch::kCongressTrades, false, false},
    };
}

std::optional<std::string> ChannelRoutes::relativePath(std::string_view target) const {
    if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);
    if (!startsWith(target, m_prefix)) return std::nullopt;
    auto rest = target.substr(m_prefix.size());
    if (rest.empty() || rest.front() != '/') return std::nullopt;
    return std::string(rest);
}

std::optional<std::string> ChannelRoutes::resolve(std::string_view target) const {
    const auto rel = relativePath(target);
    if (!rel || !startsWith(*rel, kWs)) return std::nullopt;
    const std::string_view route = std::string_view(*rel).substr(kWs.size());

    if (route == "flow")          return std::string(ch::kFlowAlerts);
    if (route == "market-movers") return std::string(ch::kMarketMovers);
    if (route == "dark-pool")     return std::string(ch::kDarkPool);
    if (route == "congress")      return std::string(ch::kCongressTrades);

    constexpr std::string_view kGex = "gex/";
    constexpr std::string_view kTrades = "option-trades/";
    constexpr std::string_view kGeneric = "channel/";

    if (startsWith(route, kGex)) {
        const auto ticker = route.substr(kGex.size());
        if (!validTicker(ticker)) return std::nullopt;
        return std::string(ch::kGexPrefix) + upper(ticker);
    }
    if (startsWith(route, kTrades)) {
        const auto ticker = route.substr(kTrades.size());
        if (!validTicker(ticker)) return std::nullopt;
        return std::string(ch::kOptionTradesPrefix) + upper(ticker);
    }
    if (startsWith(route, kGeneric)) {
        const auto name = route.substr(kGeneric.size());
        if (!validChannelName(name)) return std::nullopt;
        return std::string(name);
    }
    return std::nullopt;
}

bool ChannelRoutes::validTicker(std::string_view ticker) {
    if (ticker.empty() || ticker.size() > kMaxTicker) return false;
    return std::all_of(ticker.begin(), ticker.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-';
    });
}

bool ChannelRoutes::validChannelName(std::string_view name) {
    if (name.empty() || name.size() > kMaxChannel) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == ':' || c == '-';
    });
}
