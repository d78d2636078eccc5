#pragma once

// Provider channel names. Parameterised channels are prefix + upper-case ticker.
namespace ch {
    inline constexpr const char* kFlowAlerts          = "flow-alerts";
    inline constexpr const char* kGexPrefix           = "gex:";
    inline constexpr const char* kOptionTradesPrefix  = "option_trades:";
    inline constexpr const char* kMarketMovers        = "market_movers";
    inline constexpr const char* kDarkPool            = "dark_pool";
    inline constexpr const char* kCongressTrades      = "congress_trades";
}
