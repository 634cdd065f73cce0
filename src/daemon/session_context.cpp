#include "session_context.hpp"

#include <algorithm>
#include <cctype>

ClipboardSnapshot ClipboardSnapshot::from_text(std::string text) {
    ClipboardSnapshot snap;
    snap.kind = Kind::Text;
    snap.text = std::move(text);
    return snap;
}

ClipboardSnapshot ClipboardSnapshot::from_image(std::vector<uint8_t> png) {
    ClipboardSnapshot snap;
    snap.kind = Kind::Image;
    snap.image = std::move(png);
    return snap;
}

std::optional<std::string> SessionOptions::language_hint() const {
    if (language.empty() || language == kAutoLanguage) return std::nullopt;
    return language;
}

bool uses_clipboard(Mode mode) {
    return mode == Mode::Respond || mode == Mode::Process;
}

std::string_view mode_name(Mode mode) {
    switch (mode) {
        case Mode::Transcribe: return "transcribe";
        case Mode::Ask: return "ask";
        case Mode::Respond: return "respond";
        case Mode::Code: return "code";
        case Mode::Process: return "process";
    }
    return "transcribe";
}

std::string_view formatting_name(FormattingStyle style) {
    switch (style) {
        case FormattingStyle::Standard: return "standard";
        case FormattingStyle::Structured: return "structured";
        case FormattingStyle::Condensed: return "condensed";
    }
    return "standard";
}

std::string_view code_language_name(CodeLanguage lang) {
    switch (lang) {
        case CodeLanguage::Auto: return "auto";
        case CodeLanguage::Python: return "python";
        case CodeLanguage::Bash: return "bash";
    }
    return "auto";
}

std::string_view routing_name(OutputRouting routing) {
    return routing == OutputRouting::AutoPaste ? "paste" : "chat";
}

std::string_view clipboard_kind_name(ClipboardSnapshot::Kind kind) {
    switch (kind) {
        case ClipboardSnapshot::Kind::Empty: return "empty";
        case ClipboardSnapshot::Kind::Text: return "text";
        case ClipboardSnapshot::Kind::Image: return "image";
    }
    return "empty";
}

std::optional<Mode> parse_mode(std::string_view name) {
    for (auto m : {Mode::Transcribe, Mode::Ask, Mode::Respond, Mode::Code, Mode::Process}) {
        if (mode_name(m) == name) return m;
    }
    return std::nullopt;
}

std::optional<FormattingStyle> parse_formatting(std::string_view name) {
    for (auto s : {FormattingStyle::Standard, FormattingStyle::Structured, FormattingStyle::Condensed}) {
        if (formatting_name(s) == name) return s;
    }
    return std::nullopt;
}

std::optional<CodeLanguage> parse_code_language(std::string_view name) {
    for (auto l : {CodeLanguage::Auto, CodeLanguage::Python, CodeLanguage::Bash}) {
        if (code_language_name(l) == name) return l;
    }
    return std::nullopt;
}

std::optional<OutputRouting> parse_routing(std::string_view name) {
    if (name == "paste") return OutputRouting::AutoPaste;
    if (name == "chat") return OutputRouting::ShowInChat;
    return std::nullopt;
}

bool is_valid_language(std::string_view code) {
    if (code == kAutoLanguage) return true;
    return code.size() == 2 &&
           std::ranges::all_of(code, [](char c) { return std::islower(static_cast<unsigned char>(c)); });
}
