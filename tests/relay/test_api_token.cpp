/*
FlowRelay — ApiToken Tests
Role: Verify credential lookup order, redaction and target construction
*/
#include <gtest/gtest.h>
#include "relay/auth/ApiToken.hpp"
#include <map>

namespace {

EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

}

TEST(ApiToken, FirstNonEmptyVariableWins) {
    auto env = fakeEnv({{"UW_API_TOKEN", ""}, {"UW_KEY", "key-b"}, {"UNUSUAL_WHALES_API_KEY", "key-c"}});
    EXPECT_EQ(ApiToken::fromEnvironment(env), std::optional<std::string>("key-b"));
}

TEST(ApiToken, PrimaryVariablePreferred) {
    auto env = fakeEnv({{"UW_API_TOKEN", "key-a"}, {"UNUSUAL_WHALES_API_KEY", "key-c"}});
    EXPECT_EQ(ApiToken::fromEnvironment(env), std::optional<std::string>("key-a"));
}

TEST(ApiToken, MissingEverywhere) {
    EXPECT_FALSE(ApiToken::fromEnvironment(fakeEnv({})).has_value());
}

TEST(ApiToken, RedactKeepsLastFour) {
    EXPECT_EQ(ApiToken::redact("abcdefghijklmnop"), "***mnop");
    EXPECT_EQ(ApiToken::redact("short"), "***");
}

TEST(ApiToken, TargetCarriesEncodedToken) {
    EXPECT_EQ(ApiToken::buildTarget("/socket", "a b/c"), "/socket?token=a%20b%2Fc");
    EXPECT_EQ(ApiToken::buildTarget("/socket?v=2", "tok"), "/socket?v=2&token=tok");
    EXPECT_EQ(ApiToken::buildTarget("/socket", ""), "/socket");
}
