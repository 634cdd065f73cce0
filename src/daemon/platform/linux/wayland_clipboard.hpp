#pragma once

#include "platform/clipboard_gateway.hpp"

#include <optional>
#include <string>
#include <string_view>

// Clipboard access through wl-clipboard (wl-paste / wl-copy).
class WaylandClipboard : public ClipboardGateway {
public:
    ClipboardSnapshot snapshot() override;
    std::expected<void, std::string> write_text(const std::string& text) override;

    // Picks the MIME type to read from `wl-paste --list-types` output: a PNG image wins over
    // text. Nothing when the clipboard offers neither.
    static std::optional<std::string> preferred_type(std::string_view list_types);
};
