#include "ApiToken.hpp"
#include <fmt/format.h>

namespace ApiToken {

std::optional<std::string> fromEnvironment(const EnvLookup& env) {
    for (const char* name : kEnvVars) {
        if (auto value = env(name); value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::string redact(const std::string& token) {
    if (token.size() < 12) return "***";
    return "***" + token.substr(token.size() - 4);
}

std::string percentEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

std::string buildTarget(const std::string& path, const std::string& token) {
    std::string target = path.empty() ? "/" : path;
    if (token.empty()) return target;
    target += (target.find('?') == std::string::npos) ? '?' : '&';
    target += "token=";
    target += percentEncode(token);
    return target;
}

}
