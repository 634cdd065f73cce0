#include "keymap.hpp"

#include <cctype>

using json = nlohmann::json;

namespace {

std::string normalize(std::string_view key) {
    std::string k(key);
    for (auto& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (k == "escape") k = "esc";
    return k;
}

json set(const char* option, const char* value) {
    return {{"cmd", "set"}, {option, value}};
}

json toggle(const char* option) {
    return {{"cmd", "toggle_option"}, {"option", option}};
}

std::optional<json> recording_key(const std::string& k, const KeyContext& ctx) {
    if (k == "esc" || k == "q") return json{{"cmd", "cancel"}};

    if (k == "0") return set("language", "auto");
    if (k == "1") return set("language", "en");
    if (k == "2") return set("language", "ru");

    if (k == "t") return set("mode", "transcribe");
    if (k == "a") return set("mode", "ask");
    if (k == "r") return set("mode", "respond");
    if (k == "c") return set("mode", "code");
    if (k == "p") return set("mode", "process");

    if (k == "v") return toggle("clipboard");
    if (k == "o") return toggle("output");
    if (k == "x") {
        if (!ctx.has_terminology) return std::nullopt;
        return toggle("terminology");
    }

    if (ctx.mode == "transcribe") {
        if (k == "d") return set("format", "standard");
        if (k == "n") return set("format", "structured");
        if (k == "s") return set("format", "condensed");
    }

    if (ctx.mode == "code") {
        if (k == "u") return set("code_language", "auto");
        if (k == "y") return set("code_language", "python");
        if (k == "b") return set("code_language", "bash");
    }

    return std::nullopt;
}

} // namespace

KeyContext KeyContext::from_status(const json& status) {
    return KeyContext{
        .state = status.value("state", ""),
        .mode = status.value("mode", ""),
        .has_terminology = status.value("has_terminology", false),
    };
}

std::optional<json> command_for_key(std::string_view key, const KeyContext& ctx) {
    auto k = normalize(key);

    if (ctx.state == "recording") {
        return recording_key(k, ctx);
    }

    if (ctx.state == "showing_result") {
        if (k == "esc") return json{{"cmd", "dismiss"}};
        if (k == "c") return json{{"cmd", "dismiss"}, {"copy", true}};
        return std::nullopt;
    }

    if (ctx.state == "error" && k == "esc") {
        return json{{"cmd", "dismiss"}};
    }

    return std::nullopt;
}
