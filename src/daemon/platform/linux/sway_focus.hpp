#pragma once

#include "platform/focus_gateway.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

// Focus tracking through Sway's i3-ipc socket; paste is simulated with wtype.
class SwayFocus : public FocusGateway {
public:
    SwayFocus();
    ~SwayFocus() override;

    SwayFocus(const SwayFocus&) = delete;
    SwayFocus& operator=(const SwayFocus&) = delete;

    // Connect to $SWAYSOCK. Returns false if unset or unreachable; every later call then
    // degrades to "no application known".
    bool connect();
    bool connected() const { return query_fd_ >= 0; }

    std::optional<AppHandle> capture_current() override;
    std::expected<void, std::string> reactivate(const AppHandle& app) override;
    std::expected<void, std::string> simulate_paste(const std::optional<AppHandle>& target) override;

    // Depth-first search of a GET_TREE reply for the focused view.
    static std::optional<AppHandle> find_focused(const nlohmann::json& node);

    // Terminal emulators take Ctrl+Shift+V instead of Ctrl+V.
    static bool is_terminal(std::string_view app_id);
    static std::vector<std::string> paste_command(std::string_view app_id);
    // Target app first; the focused view only when no target is known.
    static std::vector<std::string> paste_command_for(const std::optional<AppHandle>& target,
                                                      const std::optional<AppHandle>& focused);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    bool send_message(uint32_t type, const std::string& payload = "");
    bool recv_message(uint32_t& type, std::string& payload);
    std::optional<nlohmann::json> request(uint32_t type, const std::string& payload = "");

    int query_fd_ = -1;
};
