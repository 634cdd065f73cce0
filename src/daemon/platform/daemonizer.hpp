#pragma once

#include <string>

namespace platform {

// Detaches from the terminal. stderr goes to `log_path` (appended) when one is
// given, otherwise to /dev/null. Returns only in the detached child.
void daemonize(const std::string& log_path = {});

} // namespace platform
