#pragma once

#include "platform/presenter.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON messages between voxkey and voxkeyd.
namespace ipc {

nlohmann::json ok(const std::string& message);
nlohmann::json error(const std::string& message);

// {"event":"status", ...} frames pushed to watch clients use the same body.
nlohmann::json status_json(const StatusView& view);

} // namespace ipc
