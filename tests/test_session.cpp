#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "session.hpp"

#include <filesystem>

namespace {

const AppHandle kEditor{.id = 7, .app_id = "code", .title = "main.cpp"};

SessionOptions defaults_with(Mode mode) {
    SessionOptions o;
    o.mode = mode;
    return o;
}

} // namespace

TEST_CASE("Session state machine", "[session]") {
    MockAudioCapture capture;
    Session session(capture);

    SECTION("InitialStateIdle") {
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.recording_duration() == 0.0);
        REQUIRE_FALSE(session.stop_recording().has_value());
    }

    SECTION("StartRecordingAppliesDefaults") {
        auto defaults = defaults_with(Mode::Code);
        defaults.language = "en";
        REQUIRE(session.start_recording(defaults, kEditor));

        REQUIRE(session.state() == SessionState::Recording);
        REQUIRE(capture.is_capturing());
        REQUIRE(session.options().mode == Mode::Code);
        REQUIRE(session.options().language == "en");
        REQUIRE(session.context().previous_app == kEditor);
        REQUIRE(session.context().history.empty());
    }

    SECTION("StartRejectedWhileRecording") {
        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE_FALSE(session.start_recording(defaults_with(Mode::Ask), std::nullopt));
        REQUIRE(session.options().mode == Mode::Transcribe);
        REQUIRE(capture.starts == 1);
    }

    SECTION("CaptureFailureEntersError") {
        capture.fail_start = true;
        REQUIRE_FALSE(session.start_recording({}, kEditor));
        REQUIRE(session.state() == SessionState::Error);
        REQUIRE(session.error()->kind == ErrorKind::CaptureUnavailable);
    }

    SECTION("LiveOptionsOnlyWhileRecording") {
        REQUIRE_FALSE(session.set_mode(Mode::Ask));
        REQUIRE_FALSE(session.set_language("ru"));

        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE(session.set_mode(Mode::Respond));
        REQUIRE(session.set_language("ru"));
        REQUIRE(session.set_formatting(FormattingStyle::Condensed));
        REQUIRE(session.set_code_language(CodeLanguage::Bash));
        REQUIRE(session.set_use_clipboard(false));
        REQUIRE(session.set_routing(OutputRouting::ShowInChat));
        REQUIRE(session.set_terminology(false));
        REQUIRE(session.set_clipboard(ClipboardSnapshot::from_text("original")));

        const auto& o = session.options();
        REQUIRE(o.mode == Mode::Respond);
        REQUIRE(o.language == "ru");
        REQUIRE(o.formatting == FormattingStyle::Condensed);
        REQUIRE(o.code_language == CodeLanguage::Bash);
        REQUIRE_FALSE(o.use_clipboard);
        REQUIRE(o.routing == OutputRouting::ShowInChat);
        REQUIRE_FALSE(o.terminology);
        REQUIRE(session.context().clipboard.text == "original");
    }

    SECTION("StopFreezesOptions") {
        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE(session.set_mode(Mode::Code));

        auto frozen = session.stop_recording();
        REQUIRE(frozen.has_value());
        REQUIRE(session.state() == SessionState::Transcribing);
        REQUIRE(frozen->options.mode == Mode::Code);
        REQUIRE(frozen->generation == session.generation());
        REQUIRE(std::filesystem::exists(frozen->audio.path()));

        // Mutations after the freeze point are refused and do not reach the frozen copy.
        REQUIRE_FALSE(session.set_mode(Mode::Ask));
        REQUIRE(session.options().mode == Mode::Code);
        REQUIRE(frozen->options.mode == Mode::Code);
    }

    SECTION("StopWithoutAudioFails") {
        capture.silent = true;
        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE_FALSE(session.stop_recording().has_value());
        REQUIRE(session.state() == SessionState::Error);
        REQUIRE(session.error()->kind == ErrorKind::EmptyCapture);
    }

    SECTION("AutoPasteDeliveryReturnsToIdle") {
        REQUIRE(session.start_recording({}, kEditor));
        auto frozen = session.stop_recording();
        REQUIRE(session.begin_processing(frozen->generation, "raw words"));
        REQUIRE(session.state() == SessionState::Processing);
        REQUIRE(session.last_transcription() == "raw words");

        auto app = session.finish_delivery(frozen->generation, "Raw words.");
        REQUIRE(app == kEditor);
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.last_result() == "Raw words.");
        REQUIRE(session.context().history.empty());
    }

    SECTION("CommitAppendsHistoryTurn") {
        REQUIRE(session.start_recording(defaults_with(Mode::Ask), kEditor));
        auto frozen = session.stop_recording();
        REQUIRE(session.begin_processing(frozen->generation, "what is RAII"));
        REQUIRE(session.commit_result(frozen->generation, "Scope-bound resource management."));

        REQUIRE(session.state() == SessionState::ShowingResult);
        const auto& history = session.context().history;
        REQUIRE(history.size() == 2);
        REQUIRE(history[0] == ChatTurn{"user", "what is RAII"});
        REQUIRE(history[1] == ChatTurn{"assistant", "Scope-bound resource management."});
    }

    SECTION("ContinuationKeepsHistoryAndApp") {
        REQUIRE(session.start_recording(defaults_with(Mode::Transcribe), kEditor));
        auto first = session.stop_recording();
        session.begin_processing(first->generation, "q1");
        session.commit_result(first->generation, "a1");

        REQUIRE(session.continue_recording());
        REQUIRE(session.state() == SessionState::Recording);
        REQUIRE(session.is_continuation());
        REQUIRE(session.options().mode == Mode::Ask);
        REQUIRE(session.context().previous_app == kEditor);

        auto second = session.stop_recording();
        REQUIRE(second->history.size() == 2);
        REQUIRE(second->generation == first->generation + 1);
    }

    SECTION("ContinueOnlyFromShowingResult") {
        REQUIRE_FALSE(session.continue_recording());
        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE_FALSE(session.continue_recording());
    }

    SECTION("CancelDiscardsRecording") {
        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE(session.set_clipboard(ClipboardSnapshot::from_text("x")));

        auto app = session.cancel();
        REQUIRE(app == kEditor);
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(session.context().clipboard.empty());
        REQUIRE(session.context().history.empty());
    }

    SECTION("CancelIgnoredOutsideRecording") {
        REQUIRE_FALSE(session.cancel().has_value());
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("AbortMakesInFlightResultStale") {
        REQUIRE(session.start_recording({}, kEditor));
        auto frozen = session.stop_recording();
        REQUIRE(session.is_current(frozen->generation));

        REQUIRE(session.abort() == kEditor);
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE_FALSE(session.is_current(frozen->generation));
        REQUIRE_FALSE(session.begin_processing(frozen->generation, "late"));
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("StaleGenerationIgnored") {
        REQUIRE(session.start_recording({}, kEditor));
        auto first = session.stop_recording();
        session.abort();

        REQUIRE(session.start_recording({}, kEditor));
        auto second = session.stop_recording();

        REQUIRE_FALSE(session.begin_processing(first->generation, "old"));
        REQUIRE(session.begin_processing(second->generation, "new"));
        REQUIRE_FALSE(session.commit_result(first->generation, "old result"));
        REQUIRE(session.state() == SessionState::Processing);
    }

    SECTION("FailDuringRecordingStopsCapture") {
        REQUIRE(session.start_recording({}, kEditor));
        session.fail({ErrorKind::ServiceFailure, "boom"});
        REQUIRE(session.state() == SessionState::Error);
        REQUIRE_FALSE(capture.is_capturing());
    }

    SECTION("ErrorExpiresToIdle") {
        session.fail({ErrorKind::NoCredential, "No API key configured"});
        REQUIRE(session.state() == SessionState::Error);
        REQUIRE(session.expire_error());
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE_FALSE(session.error().has_value());
        REQUIRE_FALSE(session.expire_error());
    }

    SECTION("StartAllowedFromError") {
        session.fail({ErrorKind::EmptyCapture, "No audio recorded"});
        REQUIRE(session.start_recording({}, kEditor));
        REQUIRE(session.state() == SessionState::Recording);
        REQUIRE_FALSE(session.error().has_value());
    }

    SECTION("DismissClearsConversation") {
        REQUIRE(session.start_recording(defaults_with(Mode::Ask), kEditor));
        auto frozen = session.stop_recording();
        session.begin_processing(frozen->generation, "q");
        session.commit_result(frozen->generation, "a");

        REQUIRE(session.dismiss() == kEditor);
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.context().history.empty());
        REQUIRE(session.last_result() == "a");
    }
}

TEST_CASE("Recorded audio is removed with the session", "[session]") {
    MockAudioCapture capture;
    Session session(capture);

    REQUIRE(session.start_recording({}, std::nullopt));
    {
        auto frozen = session.stop_recording();
        REQUIRE(frozen.has_value());
        REQUIRE(std::filesystem::exists(capture.last_path));
    }
    REQUIRE_FALSE(std::filesystem::exists(capture.last_path));
}
