#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// Human-readable names for the identifiers the daemon reports.
std::string_view mode_label(std::string_view mode);
std::string_view language_label(std::string_view code);
std::string_view format_label(std::string_view format);
std::string_view code_language_label(std::string_view lang);
std::string_view state_label(std::string_view state);

// One-line summary of a status frame, e.g. "Recording 3.2s | Ask | English | chat".
std::string status_line(const nlohmann::json& status);
