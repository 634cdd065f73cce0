#include "keymap.hpp"
#include "labels.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Transcription plus a completion can take as long as two backend timeouts.
constexpr int kPipelineTimeoutMs = 300000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--mode M] [--output paste|chat]   Start recording");
    std::println(stderr, "  stop                                     Stop recording and wait for the result");
    std::println(stderr, "  toggle [--mode M] [--output paste|chat]  Start or stop recording");
    std::println(stderr, "  cancel                                   Discard the recording in progress");
    std::println(stderr, "  dismiss [--copy]                         Close the shown result");
    std::println(stderr, "  status                                   Show session state and options");
    std::println(stderr, "  last [--copy]                            Show the last result");
    std::println(stderr, "  set <option> <value>                     Change an option while recording");
    std::println(stderr, "      options: mode, language, format, code_language, output,");
    std::println(stderr, "               use_clipboard (on|off), terminology (on|off)");
    std::println(stderr, "  key <key>                                Act on a key press (t, a, 0, esc, ...)");
    std::println(stderr, "  watch [--levels]                         Follow status changes");
}

std::optional<bool> parse_switch(const std::string& v) {
    if (v == "on" || v == "true" || v == "1") return true;
    if (v == "off" || v == "false" || v == "0") return false;
    return std::nullopt;
}

std::optional<json> build_set(const std::string& option, const std::string& value) {
    json cmd = {{"cmd", "set"}};
    if (option == "use_clipboard" || option == "clipboard") {
        auto on = parse_switch(value);
        if (!on) return std::nullopt;
        cmd["use_clipboard"] = *on;
    } else if (option == "terminology") {
        auto on = parse_switch(value);
        if (!on) return std::nullopt;
        cmd["terminology"] = *on;
    } else if (option == "mode" || option == "language" || option == "format" ||
               option == "code_language" || option == "output") {
        cmd[option] = value;
    } else {
        return std::nullopt;
    }
    return cmd;
}

constexpr int kDefaultTimeoutMs = 30000;

std::optional<json> exchange(IpcClient& client, const json& cmd, int timeout_ms = kDefaultTimeoutMs) {
    auto reply = client.request(cmd, timeout_ms);
    if (!reply) {
        std::println(stderr, "{}", reply.error());
        return std::nullopt;
    }
    return std::move(*reply);
}

int watch(IpcClient& client, bool levels) {
    if (!client.send({{"cmd", "watch"}})) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    while (true) {
        auto frame = client.recv(-1);
        if (!frame) {
            std::println(stderr, "{}", IpcClient::describe(frame.error()));
            return frame.error() == IpcClient::RecvError::Closed ? 0 : 1;
        }
        const json& event = *frame;
        auto kind = event.value("event", "");
        if (kind == "status") {
            std::println("{}", status_line(event));
        } else if (kind == "hide") {
            std::println("(hidden)");
        } else if (kind == "level" && levels) {
            int bars = static_cast<int>(event.value("value", 0.0) * 40.0);
            std::println("level {}", std::string(static_cast<size_t>(bars), '#'));
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string mode;
    std::string output;
    bool copy = false;
    bool levels = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            mode = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--copy") {
            copy = true;
        } else if (arg == "--levels") {
            levels = true;
        } else {
            positional.push_back(arg);
        }
    }

    json cmd;
    if (command == "start" || command == "toggle") {
        cmd = {{"cmd", command}};
        if (!mode.empty()) cmd["mode"] = mode;
        if (!output.empty()) cmd["output"] = output;
    } else if (command == "stop" || command == "cancel" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "dismiss" || command == "last") {
        cmd = {{"cmd", command}, {"copy", copy}};
    } else if (command == "set") {
        if (positional.size() != 2) {
            usage(argv[0]);
            return 1;
        }
        auto set = build_set(positional[0], positional[1]);
        if (!set) {
            std::println(stderr, "Invalid option or value: {} {}", positional[0], positional[1]);
            return 1;
        }
        cmd = std::move(*set);
    } else if (command == "key") {
        if (positional.size() != 1) {
            usage(argv[0]);
            return 1;
        }
    } else if (command != "watch") {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voxkeyd running?");
        return 1;
    }

    if (command == "watch") {
        return watch(client, levels);
    }

    if (command == "key") {
        auto status = exchange(client, {{"cmd", "status"}});
        if (!status) return 1;

        auto mapped = command_for_key(positional[0], KeyContext::from_status(*status));
        if (!mapped) {
            // Inert key for the current state.
            return 0;
        }
        cmd = std::move(*mapped);
    }

    bool waits = command == "stop" || command == "toggle";
    auto reply = exchange(client, cmd, waits ? kPipelineTimeoutMs : kDefaultTimeoutMs);
    if (!reply) return 1;
    const json& response = *reply;

    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (response.contains("state")) {
        std::println("{}", status_line(response));
    } else if (command == "last") {
        if (response.value("text", "").empty()) {
            std::println("(no result yet)");
        } else {
            std::println("{}", response["text"].get<std::string>());
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else {
        std::println("{}", response.value("message", "OK"));
    }

    return 0;
}
