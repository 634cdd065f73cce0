#include <catch2/catch_test_macros.hpp>

#include "keymap.hpp"
#include "labels.hpp"

using json = nlohmann::json;

namespace {

KeyContext recording(const char* mode, bool has_terminology = false) {
    return {.state = "recording", .mode = mode, .has_terminology = has_terminology};
}

// Mapped command, or null when the key does nothing.
json cmd(std::string_view key, const KeyContext& ctx) {
    return command_for_key(key, ctx).value_or(json());
}

} // namespace

TEST_CASE("Key map", "[keymap]") {

    SECTION("ContextFromStatus") {
        auto ctx = KeyContext::from_status(
            {{"status", "ok"}, {"state", "recording"}, {"mode", "code"}, {"has_terminology", true}});
        REQUIRE(ctx.state == "recording");
        REQUIRE(ctx.mode == "code");
        REQUIRE(ctx.has_terminology);
    }

    SECTION("RecordingCancel") {
        auto ctx = recording("transcribe");
        REQUIRE(cmd("esc", ctx) == json{{"cmd", "cancel"}});
        REQUIRE(cmd("Escape", ctx) == json{{"cmd", "cancel"}});
        REQUIRE(cmd("Q", ctx) == json{{"cmd", "cancel"}});
    }

    SECTION("LanguageAndModeKeys") {
        auto ctx = recording("transcribe");
        REQUIRE(cmd("0", ctx) == json{{"cmd", "set"}, {"language", "auto"}});
        REQUIRE(cmd("2", ctx) == json{{"cmd", "set"}, {"language", "ru"}});
        REQUIRE(cmd("a", ctx) == json{{"cmd", "set"}, {"mode", "ask"}});
        REQUIRE(cmd("P", ctx) == json{{"cmd", "set"}, {"mode", "process"}});
        REQUIRE(cmd("v", ctx) == json{{"cmd", "toggle_option"}, {"option", "clipboard"}});
        REQUIRE(cmd("o", ctx) == json{{"cmd", "toggle_option"}, {"option", "output"}});
    }

    SECTION("TerminologyKeyNeedsTerms") {
        REQUIRE(cmd("x", recording("transcribe")).is_null());
        REQUIRE(cmd("x", recording("transcribe", true)) ==
                json{{"cmd", "toggle_option"}, {"option", "terminology"}});
    }

    SECTION("FormatKeysOnlyInTranscribe") {
        REQUIRE(cmd("s", recording("transcribe")) ==
                json{{"cmd", "set"}, {"format", "condensed"}});
        REQUIRE(cmd("s", recording("ask")).is_null());
    }

    SECTION("CodeLanguageKeysOnlyInCode") {
        REQUIRE(cmd("y", recording("code")) ==
                json{{"cmd", "set"}, {"code_language", "python"}});
        REQUIRE(cmd("y", recording("transcribe")).is_null());
    }

    SECTION("ShowingResultKeys") {
        KeyContext ctx{.state = "showing_result", .mode = "ask"};
        REQUIRE(cmd("esc", ctx) == json{{"cmd", "dismiss"}});
        REQUIRE(cmd("c", ctx) == json{{"cmd", "dismiss"}, {"copy", true}});
        REQUIRE(cmd("a", ctx).is_null());
    }

    SECTION("IdleIgnoresKeys") {
        KeyContext ctx{.state = "idle"};
        REQUIRE(cmd("esc", ctx).is_null());
        REQUIRE(cmd("esc", KeyContext{.state = "error"}) == json{{"cmd", "dismiss"}});
    }
}

TEST_CASE("Status line", "[keymap]") {

    SECTION("Idle") {
        REQUIRE(status_line({{"state", "idle"}, {"mode", "ask"}}) == "Idle");
    }

    SECTION("RecordingTranscribe") {
        json status = {
            {"state", "recording"}, {"duration", 3.21}, {"mode", "transcribe"},
            {"language", "en"}, {"format", "condensed"}, {"has_terminology", true},
            {"terminology", false}, {"output", "paste"},
        };
        REQUIRE(status_line(status) ==
                "Recording 3.2s | Transcribe | English | Condensed | terms off | paste");
    }

    SECTION("AskWithHistory") {
        json status = {
            {"state", "showing_result"}, {"mode", "ask"}, {"language", "auto"},
            {"history_turns", 2}, {"message", "RAII ties resources to scope."},
        };
        REQUIRE(status_line(status) ==
                "Result | Ask | Auto-detect | 2 turns\nRAII ties resources to scope.");
    }

    SECTION("RespondClipboardOff") {
        json status = {
            {"state", "recording"}, {"mode", "respond"}, {"language", "ru"},
            {"use_clipboard", false}, {"clipboard", "text"}, {"output", "chat"},
        };
        REQUIRE(status_line(status) == "Recording | Respond | Russian | clipboard off | chat");
    }
}
