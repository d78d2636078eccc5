#pragma once
/*
FlowRelay — ApiToken
Role: Locates the provider credential and builds the connection target that embeds it.
Inputs/Outputs: Environment lookups in; token, redacted token and request target out.
Threading: Stateless helpers; callable from any thread.
Integration: RelayConfig::applyEnvironment and UpstreamFeedClient.
Observability: Only redacted forms are meant for logs and status documents.
*/
#include <array>
#include <optional>
#include <string>
#include "relay/config/RelayConfig.hpp"

namespace ApiToken {

// Checked in order, first non-empty value wins.
inline constexpr std::array<const char*, 3> kEnvVars = {
    "UW_API_TOKEN", "UW_KEY", "UNUSUAL_WHALES_API_KEY"
};

std::optional<std::string> fromEnvironment(const EnvLookup& env);

// "***wxyz"; tokens shorter than 12 characters collapse to "***".
std::string redact(const std::string& token);

// path + "?token=" + percent-encoded token
std::string buildTarget(const std::string& path, const std::string& token);

std::string percentEncode(const std::string& value);

}
