#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

// The application that had focus when recording started.
struct AppHandle {
    int64_t id = 0;     // compositor container id
    std::string app_id; // e.g. "kitty", "firefox"
    std::string title;

    bool operator==(const AppHandle&) const = default;
};

class FocusGateway {
public:
    virtual ~FocusGateway() = default;
    virtual std::optional<AppHandle> capture_current() = 0;
    virtual std::expected<void, std::string> reactivate(const AppHandle& app) = 0;
    // Paste chord into whatever has focus now, chosen for `target` when it is known.
    virtual std::expected<void, std::string> simulate_paste(const std::optional<AppHandle>& target) = 0;
};
