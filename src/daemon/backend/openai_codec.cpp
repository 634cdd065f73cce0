#include "backend/openai_codec.hpp"

#include <format>

using json = nlohmann::json;

namespace openai {

namespace {

constexpr int kVisionMaxTokens = 4096;

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string base64_encode(std::span<const uint8_t> data) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kAlphabet[(v >> 18) & 0x3f]);
        out.push_back(kAlphabet[(v >> 12) & 0x3f]);
        out.push_back(kAlphabet[(v >> 6) & 0x3f]);
        out.push_back(kAlphabet[v & 0x3f]);
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t v = data[i] << 16;
        out.push_back(kAlphabet[(v >> 18) & 0x3f]);
        out.push_back(kAlphabet[(v >> 12) & 0x3f]);
        out += "==";
    } else if (rest == 2) {
        uint32_t v = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kAlphabet[(v >> 18) & 0x3f]);
        out.push_back(kAlphabet[(v >> 12) & 0x3f]);
        out.push_back(kAlphabet[(v >> 6) & 0x3f]);
        out.push_back('=');
    }
    return out;
}

json chat_body(const CompletionRequest& request) {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", request.system}});
    for (const auto& turn : request.history) {
        messages.push_back({{"role", turn.role}, {"content", turn.content}});
    }
    messages.push_back({{"role", "user"}, {"content", request.user}});

    json body = {
        {"model", request.model},
        {"messages", std::move(messages)},
    };

    // Search models reject sampling parameters.
    if (request.web_search) {
        body["web_search_options"] = json::object();
    } else {
        body["temperature"] = request.temperature;
    }
    return body;
}

json vision_body(const std::string& model, const std::string& system,
                 const std::string& user, std::span<const uint8_t> png) {
    json content = json::array({
        {{"type", "text"}, {"text", user}},
        {{"type", "image_url"},
         {"image_url", {{"url", "data:image/png;base64," + base64_encode(png)}}}},
    });

    return {
        {"model", model},
        {"messages", json::array({
            {{"role", "system"}, {"content", system}},
            {{"role", "user"}, {"content", std::move(content)}},
        })},
        {"max_tokens", kVisionMaxTokens},
    };
}

std::string error_message(long http_status, const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error") && j["error"].is_object() && j["error"].contains("message")) {
            return j["error"]["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // fall through to the status code
    }
    return std::format("HTTP error {}", http_status);
}

std::expected<std::string, std::string> parse_chat_response(long http_status, const std::string& body) {
    if (http_status != 200) {
        return std::unexpected(error_message(http_status, body));
    }

    try {
        auto j = json::parse(body);
        const auto& choices = j.at("choices");
        if (!choices.is_array() || choices.empty()) {
            return std::unexpected("response contained no choices");
        }
        const auto& content = choices[0].at("message").at("content");
        if (content.is_null()) return std::string();
        return trim(content.get<std::string>());
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed response: ") + e.what());
    }
}

std::expected<std::string, std::string> parse_transcription_response(long http_status,
                                                                     const std::string& body) {
    if (http_status != 200) {
        return std::unexpected(error_message(http_status, body));
    }

    try {
        auto j = json::parse(body);
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body);
        }
        return trim(j["text"].get<std::string>());
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace openai
