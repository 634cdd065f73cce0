#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void load_session(const json& s, SessionOptions& opts) {
    if (s.contains("mode")) {
        auto name = s["mode"].get<std::string>();
        if (auto m = parse_mode(name)) opts.mode = *m;
        else std::println(stderr, "config: unknown mode '{}'", name);
    }
    if (s.contains("language")) {
        auto code = s["language"].get<std::string>();
        if (is_valid_language(code)) opts.language = code;
        else std::println(stderr, "config: invalid language '{}'", code);
    }
    if (s.contains("format")) {
        auto name = s["format"].get<std::string>();
        if (auto f = parse_formatting(name)) opts.formatting = *f;
        else std::println(stderr, "config: unknown format '{}'", name);
    }
    if (s.contains("code_language")) {
        auto name = s["code_language"].get<std::string>();
        if (auto l = parse_code_language(name)) opts.code_language = *l;
        else std::println(stderr, "config: unknown code language '{}'", name);
    }
    if (s.contains("output")) {
        auto name = s["output"].get<std::string>();
        if (auto r = parse_routing(name)) opts.routing = *r;
        else std::println(stderr, "config: unknown output '{}'", name);
    }
    if (s.contains("use_clipboard")) opts.use_clipboard = s["use_clipboard"].get<bool>();
    if (s.contains("terminology")) opts.terminology = s["terminology"].get<bool>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    // Parse into a copy so a type error halfway through leaves pure defaults.
    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("url")) parsed.backend.url = b["url"].get<std::string>();
            if (b.contains("transcription_model")) parsed.backend.transcription_model = b["transcription_model"].get<std::string>();
            if (b.contains("chat_model")) parsed.backend.chat_model = b["chat_model"].get<std::string>();
            if (b.contains("vision_model")) parsed.backend.vision_model = b["vision_model"].get<std::string>();
            if (b.contains("search_model")) parsed.backend.search_model = b["search_model"].get<std::string>();
            if (b.contains("timeout_s")) parsed.backend.timeout_s = b["timeout_s"].get<long>();
        }

        if (j.contains("processing")) {
            auto& p = j["processing"];
            if (p.contains("post_processing")) parsed.processing.post_processing = p["post_processing"].get<bool>();
            if (p.contains("cleanup_prompt")) parsed.processing.cleanup_prompt = p["cleanup_prompt"].get<std::string>();
            if (p.contains("web_search")) parsed.processing.web_search = p["web_search"].get<bool>();
            if (p.contains("terminology")) parsed.processing.terminology = p["terminology"].get<std::vector<std::string>>();
        }

        if (j.contains("session")) {
            load_session(j["session"], parsed.session);
        }

        if (j.contains("delivery")) {
            auto& d = j["delivery"];
            if (d.contains("settle_ms")) parsed.delivery.settle_ms = d["settle_ms"].get<uint32_t>();
            if (d.contains("error_clear_ms")) parsed.delivery.error_clear_ms = d["error_clear_ms"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) parsed.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_seconds")) parsed.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

        if (j.contains("credentials")) {
            auto& c = j["credentials"];
            if (c.contains("env")) parsed.credentials.env = c["env"].get<std::string>();
            if (c.contains("key_file")) parsed.credentials.key_file = c["key_file"].get<std::string>();
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
