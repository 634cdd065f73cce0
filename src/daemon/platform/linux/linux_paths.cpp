#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/voxkey";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/voxkey";
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return xdg;
    return "/tmp";
}

std::string ipc_endpoint() {
    return runtime_dir() + "/voxkey.sock";
}

} // namespace platform
