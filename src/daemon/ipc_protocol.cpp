#include "ipc_protocol.hpp"

namespace ipc {

nlohmann::json ok(const std::string& message) {
    return {{"status", "ok"}, {"message", message}};
}

nlohmann::json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

nlohmann::json status_json(const StatusView& view) {
    const auto& o = view.options;
    nlohmann::json j = {
        {"status", "ok"},
        {"state", state_name(view.state)},
        {"mode", mode_name(o.mode)},
        {"language", o.language},
        {"format", formatting_name(o.formatting)},
        {"code_language", code_language_name(o.code_language)},
        {"use_clipboard", o.use_clipboard},
        {"output", routing_name(o.routing)},
        {"terminology", o.terminology},
        {"has_terminology", view.has_terminology},
        {"clipboard", clipboard_kind_name(view.clipboard)},
        {"history_turns", view.history_turns},
    };
    if (view.state == SessionState::Recording) {
        j["duration"] = view.recording_s;
    }
    if (!view.message.empty()) {
        j["message"] = view.message;
    }
    return j;
}

} // namespace ipc
