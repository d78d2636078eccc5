#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

// Inbound provider frame: ["<channel>", <payload>]; trailing elements are ignored
struct DataFrame { std::string channel; nlohmann::json payload; };
struct MalformedFrame { std::string reason; };

using FrameEvent = std::variant<DataFrame, MalformedFrame>;

class FrameParser {
public:
    static FrameEvent parse(std::string_view raw) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            return MalformedFrame{std::string("invalid json: ") + e.what()};
        }
        return parseJson(std::move(j));
    }

    static FrameEvent parseJson(nlohmann::json j) {
        if (!j.is_array() || j.size() < 2) {
            return MalformedFrame{"expected [channel, payload] array"};
        }
        if (!j[0].is_string() || j[0].get_ref<const std::string&>().empty()) {
            return MalformedFrame{"channel must be a non-empty string"};
        }
        DataFrame frame;
        frame.channel = j[0].get<std::string>();
        frame.payload = std::move(j[1]);
        return frame;
    }
};
