#include "labels.hpp"

#include <format>

std::string_view mode_label(std::string_view mode) {
    if (mode == "transcribe") return "Transcribe";
    if (mode == "ask") return "Ask";
    if (mode == "respond") return "Respond";
    if (mode == "code") return "Code";
    if (mode == "process") return "Process";
    return mode;
}

std::string_view language_label(std::string_view code) {
    if (code == "auto") return "Auto-detect";
    if (code == "en") return "English";
    if (code == "ru") return "Russian";
    return code;
}

std::string_view format_label(std::string_view format) {
    if (format == "standard") return "Default";
    if (format == "structured") return "Structured";
    if (format == "condensed") return "Condensed";
    return format;
}

std::string_view code_language_label(std::string_view lang) {
    if (lang == "auto") return "Auto";
    if (lang == "python") return "Python";
    if (lang == "bash") return "Bash";
    return lang;
}

std::string_view state_label(std::string_view state) {
    if (state == "idle") return "Idle";
    if (state == "recording") return "Recording";
    if (state == "transcribing") return "Transcribing...";
    if (state == "processing") return "Processing...";
    if (state == "showing_result") return "Result";
    if (state == "error") return "Error";
    return state;
}

std::string status_line(const nlohmann::json& status) {
    auto state = status.value("state", "");
    auto mode = status.value("mode", "");

    std::string line(state_label(state));
    if (state == "recording" && status.contains("duration")) {
        line += std::format(" {:.1f}s", status["duration"].get<double>());
    }
    if (state == "idle") return line;

    line += std::format(" | {} | {}", mode_label(mode),
                        language_label(status.value("language", "auto")));

    if (mode == "transcribe") {
        line += std::format(" | {}", format_label(status.value("format", "standard")));
        if (status.value("has_terminology", false)) {
            line += status.value("terminology", false) ? " | terms on" : " | terms off";
        }
    } else if (mode == "code") {
        line += std::format(" | {}", code_language_label(status.value("code_language", "auto")));
    }

    if (mode == "respond" || mode == "process") {
        auto clip = status.value("clipboard", "empty");
        bool used = mode == "process" || status.value("use_clipboard", true);
        line += used ? std::format(" | clipboard: {}", clip) : " | clipboard off";
    }

    if (mode != "ask") line += std::format(" | {}", status.value("output", "paste"));

    if (auto turns = status.value("history_turns", 0); turns > 0) {
        line += std::format(" | {} turn{}", turns, turns == 1 ? "" : "s");
    }

    if (status.contains("message")) {
        line += "\n" + status["message"].get<std::string>();
    }
    return line;
}
