#pragma once

#include "session_context.hpp"

#include <optional>
#include <span>
#include <string>

// System prompts and composite user messages for each pipeline mode.
namespace prompts {

extern const char* const kDefaultCleanup;

// Cleanup pass for Transcribe mode. `custom` replaces the Standard instruction when
// non-empty. `terms` are domain words that may have been misheard.
std::string cleanup(FormattingStyle style, const std::string& custom,
                    std::span<const std::string> terms);

std::string ask();
std::string respond();
std::string code(CodeLanguage lang);
std::string process_text();
std::string process_image();

std::string respond_message(const std::optional<std::string>& original,
                            const std::string& instruction);
std::string code_message(const std::string& request);
std::string process_message(const std::string& content, const std::string& command);

} // namespace prompts
