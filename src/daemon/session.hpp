#pragma once

#include "platform/audio_capture.hpp"
#include "recorded_audio.hpp"
#include "session_context.hpp"
#include "session_error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SessionState { Idle, Recording, Transcribing, Processing, ShowingResult, Error };

std::string_view state_name(SessionState state);

// Immutable copy of the session taken at the freeze point, handed to the pipeline.
struct FrozenSession {
    uint64_t generation = 0;
    SessionOptions options;
    ClipboardSnapshot clipboard;
    std::vector<ChatTurn> history;
    RecordedAudio audio;
};

// Single-writer state machine for one recording/processing cycle.
// All methods are called from the main thread.
class Session {
public:
    explicit Session(AudioCapture& capture);

    // Idle/Error -> Recording. Resets the context to `defaults`.
    // Returns false when the state does not allow a start, or when capture fails
    // (the session is then in Error).
    bool start_recording(const SessionOptions& defaults, std::optional<AppHandle> previous_app);

    // ShowingResult -> Recording in Ask mode. History and the originally captured
    // application are kept.
    bool continue_recording();

    // Live selections. Rejected (false) unless Recording.
    bool set_mode(Mode mode);
    bool set_language(std::string code);
    bool set_formatting(FormattingStyle style);
    bool set_code_language(CodeLanguage lang);
    bool set_use_clipboard(bool on);
    bool set_routing(OutputRouting routing);
    bool set_terminology(bool on);
    bool set_clipboard(ClipboardSnapshot snapshot);

    // Freeze point: Recording -> Transcribing. Returns nothing if not recording, or if
    // no audio was captured (the session is then in Error).
    std::optional<FrozenSession> stop_recording();

    // True while the pipeline started by `generation` is the one in flight.
    bool is_current(uint64_t generation) const;

    // Transcribing -> Processing.
    bool begin_processing(uint64_t generation, std::string transcription);

    // Processing -> ShowingResult; appends the (user, assistant) turn.
    bool commit_result(uint64_t generation, std::string result);

    // Processing -> Idle for auto-paste delivery. Returns the application to refocus.
    std::optional<AppHandle> finish_delivery(uint64_t generation, std::string result);

    // Any state -> Error.
    void fail(SessionError error);

    // Recording -> Idle; captured audio is discarded.
    std::optional<AppHandle> cancel();

    // Transcribing/Processing -> Idle; the in-flight result will be ignored.
    std::optional<AppHandle> abort();

    // ShowingResult/Error -> Idle.
    std::optional<AppHandle> dismiss();

    // Error -> Idle.
    bool expire_error();

    SessionState state() const { return state_; }
    const SessionContext& context() const { return ctx_; }
    const SessionOptions& options() const { return ctx_.options; }
    const std::optional<SessionError>& error() const { return error_; }
    uint64_t generation() const { return generation_; }
    bool is_continuation() const { return continuation_; }
    double recording_duration() const;

    const std::string& last_transcription() const { return last_transcription_; }
    const std::string& last_result() const { return last_result_; }

private:
    bool can_mutate(std::string_view what) const;
    std::optional<AppHandle> reset_to_idle();

    AudioCapture& capture_;
    SessionState state_ = SessionState::Idle;
    SessionContext ctx_;
    std::optional<SessionError> error_;
    uint64_t generation_ = 0;
    bool continuation_ = false;
    std::chrono::steady_clock::time_point record_start_;

    std::string pending_transcription_;
    std::string last_transcription_;
    std::string last_result_;
};
