#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// What the key map needs to know about the daemon, taken from a status reply.
struct KeyContext {
    std::string state;  // "recording", "showing_result", ...
    std::string mode;   // "transcribe", "code", ...
    bool has_terminology = false;

    static KeyContext from_status(const nlohmann::json& status);
};

// The daemon command a key press stands for, or nothing if the key does nothing in this
// state. Keys are single characters (case-insensitive) or "esc"/"escape".
std::optional<nlohmann::json> command_for_key(std::string_view key, const KeyContext& ctx);
