#pragma once

#include "session_context.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string url = "https://api.openai.com/v1";
        std::string transcription_model = "whisper-1";
        std::string chat_model = "gpt-4o-mini";
        std::string vision_model = "gpt-4o";
        std::string search_model = "gpt-4o-search-preview";
        long timeout_s = 120;
    } backend;

    struct Processing {
        bool post_processing = true;
        std::string cleanup_prompt; // empty: built-in prompt
        bool web_search = false;
        std::vector<std::string> terminology;
    } processing;

    // Applied to every fresh session.
    SessionOptions session;

    struct Delivery {
        uint32_t settle_ms = 500;
        uint32_t error_clear_ms = 3000;
    } delivery;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 300;

        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    struct Credentials {
        std::string env = "OPENAI_API_KEY";
        std::string key_file; // empty: <config dir>/api_key
    } credentials;

    static Config load(const std::string& path);
    static Config load_default();
};
