#include "platform/linux/wayland_clipboard.hpp"

#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <array>
#include <print>
#include <ranges>

namespace {

constexpr std::string_view kImageType = "image/png";

constexpr std::array<std::string_view, 5> kTextTypes = {
    "text/plain;charset=utf-8", "text/plain", "UTF8_STRING", "STRING", "TEXT",
};

} // namespace

std::optional<std::string> WaylandClipboard::preferred_type(std::string_view list_types) {
    std::optional<std::string> text_type;

    for (auto part : list_types | std::views::split('\n')) {
        std::string_view type(part.begin(), part.end());
        if (!type.empty() && type.back() == '\r') type.remove_suffix(1);

        if (type == kImageType) return std::string(kImageType);
        if (!text_type && std::ranges::find(kTextTypes, type) != kTextTypes.end()) {
            text_type = std::string(type);
        }
    }
    return text_type;
}

ClipboardSnapshot WaylandClipboard::snapshot() {
    // wl-paste exits non-zero when nothing has been copied.
    auto types = subprocess::capture({"wl-paste", "--list-types"});
    if (!types) return {};

    auto type = preferred_type(*types);
    if (!type) return {};

    auto data = subprocess::capture({"wl-paste", "--no-newline", "--type", *type});
    if (!data) {
        std::println(stderr, "clipboard: reading {} failed: {}", *type, data.error());
        return {};
    }
    if (data->empty()) return {};

    if (*type == kImageType) {
        return ClipboardSnapshot::from_image(std::vector<uint8_t>(data->begin(), data->end()));
    }
    return ClipboardSnapshot::from_text(std::move(*data));
}

std::expected<void, std::string> WaylandClipboard::write_text(const std::string& text) {
    return subprocess::run({"wl-copy"}, text);
}
