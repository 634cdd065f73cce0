#pragma once

#include "session_context.hpp"

#include <expected>
#include <string>

class ClipboardGateway {
public:
    virtual ~ClipboardGateway() = default;
    virtual ClipboardSnapshot snapshot() = 0;
    virtual std::expected<void, std::string> write_text(const std::string& text) = 0;
};
