#pragma once

#include "platform/focus_gateway.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Mode { Transcribe, Ask, Respond, Code, Process };
enum class FormattingStyle { Standard, Structured, Condensed };
enum class CodeLanguage { Auto, Python, Bash };
enum class OutputRouting { AutoPaste, ShowInChat };

struct ClipboardSnapshot {
    enum class Kind { Empty, Text, Image };

    Kind kind = Kind::Empty;
    std::string text;
    std::vector<uint8_t> image; // PNG bytes

    static ClipboardSnapshot from_text(std::string text);
    static ClipboardSnapshot from_image(std::vector<uint8_t> png);

    bool empty() const { return kind == Kind::Empty; }
    bool is_text() const { return kind == Kind::Text; }
    bool is_image() const { return kind == Kind::Image; }
};

struct ChatTurn {
    std::string role; // "user" or "assistant"
    std::string content;

    bool operator==(const ChatTurn&) const = default;
};

inline constexpr std::string_view kAutoLanguage = "auto";

// Selections the user may change while recording. Frozen when recording stops.
struct SessionOptions {
    Mode mode = Mode::Transcribe;
    std::string language{kAutoLanguage}; // "auto" or ISO-639-1 code
    FormattingStyle formatting = FormattingStyle::Standard;
    CodeLanguage code_language = CodeLanguage::Auto;
    bool use_clipboard = true;
    OutputRouting routing = OutputRouting::AutoPaste;
    bool terminology = true;

    // Language passed to the transcription service, empty for auto-detect.
    std::optional<std::string> language_hint() const;
};

struct SessionContext {
    SessionOptions options;
    ClipboardSnapshot clipboard;
    std::vector<ChatTurn> history;
    std::optional<AppHandle> previous_app;
};

// Modes that read the clipboard snapshot.
bool uses_clipboard(Mode mode);

// Identifiers used by the config file and the IPC protocol.
std::string_view mode_name(Mode mode);
std::string_view formatting_name(FormattingStyle style);
std::string_view code_language_name(CodeLanguage lang);
std::string_view routing_name(OutputRouting routing);
std::string_view clipboard_kind_name(ClipboardSnapshot::Kind kind);

std::optional<Mode> parse_mode(std::string_view name);
std::optional<FormattingStyle> parse_formatting(std::string_view name);
std::optional<CodeLanguage> parse_code_language(std::string_view name);
std::optional<OutputRouting> parse_routing(std::string_view name);
bool is_valid_language(std::string_view code);
