#include "platform/linux/sway_focus.hpp"

#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

constexpr std::array<std::string_view, 6> kTerminals = {
    "kitty", "Alacritty", "alacritty", "foot", "footclient", "org.wezfurlong.wezterm",
};

} // namespace

SwayFocus::SwayFocus() = default;

SwayFocus::~SwayFocus() {
    if (query_fd_ >= 0) ::close(query_fd_);
}

bool SwayFocus::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock, sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return false;
    }

    query_fd_ = fd;
    return true;
}

std::optional<AppHandle> SwayFocus::capture_current() {
    auto tree = request(MSG_GET_TREE);
    if (!tree) return std::nullopt;
    return find_focused(*tree);
}

std::expected<void, std::string> SwayFocus::reactivate(const AppHandle& app) {
    if (!connected()) return std::unexpected("sway IPC not connected");

    auto reply = request(MSG_RUN_COMMAND, std::format("[con_id={}] focus", app.id));
    if (!reply) return std::unexpected("sway IPC request failed");

    // Reply is one result object per command.
    if (!reply->is_array() || reply->empty() || !(*reply)[0].value("success", false)) {
        std::string err = "focus command rejected";
        if (reply->is_array() && !reply->empty()) {
            err = (*reply)[0].value("error", err);
        }
        return std::unexpected(std::format("{} ({})", err, app.app_id));
    }
    return {};
}

std::expected<void, std::string> SwayFocus::simulate_paste(const std::optional<AppHandle>& target) {
    auto focused = target ? std::nullopt : capture_current();
    return subprocess::run(paste_command_for(target, focused));
}

std::optional<AppHandle> SwayFocus::find_focused(const nlohmann::json& node) {
    if (node.value("focused", false)) {
        AppHandle app;
        app.id = node.value("id", int64_t{0});
        if (node.contains("app_id") && node["app_id"].is_string()) {
            app.app_id = node["app_id"].get<std::string>();
        } else if (node.contains("window_properties")) {
            // XWayland views carry their class here instead.
            app.app_id = node["window_properties"].value("class", "");
        }
        if (node.contains("name") && node["name"].is_string()) {
            app.title = node["name"].get<std::string>();
        }
        return app;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (const auto& child : node[key]) {
            if (auto app = find_focused(child)) return app;
        }
    }
    return std::nullopt;
}

bool SwayFocus::is_terminal(std::string_view app_id) {
    return std::ranges::find(kTerminals, app_id) != kTerminals.end();
}

std::vector<std::string> SwayFocus::paste_command(std::string_view app_id) {
    if (is_terminal(app_id)) {
        return {"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"};
    }
    return {"wtype", "-M", "ctrl", "-k", "v"};
}

std::vector<std::string> SwayFocus::paste_command_for(const std::optional<AppHandle>& target,
                                                     const std::optional<AppHandle>& focused) {
    if (target) return paste_command(target->app_id);
    return paste_command(focused ? focused->app_id : std::string_view());
}

std::optional<nlohmann::json> SwayFocus::request(uint32_t type, const std::string& payload) {
    if (!connected()) return std::nullopt;
    if (!send_message(type, payload)) return std::nullopt;

    uint32_t reply_type;
    std::string reply;
    if (!recv_message(reply_type, reply)) return std::nullopt;

    try {
        return nlohmann::json::parse(reply);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: bad reply: {}", e.what());
        return std::nullopt;
    }
}

bool SwayFocus::send_message(uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(query_fd_, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(query_fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayFocus::recv_message(uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(query_fd_, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(query_fd_, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
