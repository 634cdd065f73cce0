#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

// fork/exec helpers for the Wayland command-line tools (wl-copy, wl-paste, wtype).
namespace subprocess {

// Runs argv[0] from PATH, feeding `input` on stdin. Fails on non-zero exit.
std::expected<void, std::string> run(const std::vector<std::string>& argv,
                                     std::string_view input = {});

// Runs argv[0] and returns everything it wrote to stdout. Fails on non-zero exit.
std::expected<std::string, std::string> capture(const std::vector<std::string>& argv);

} // namespace subprocess
