#include "session.hpp"

#include <print>

std::string_view state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Processing: return "processing";
        case SessionState::ShowingResult: return "showing_result";
        case SessionState::Error: return "error";
    }
    return "idle";
}

Session::Session(AudioCapture& capture)
    : capture_(capture) {}

bool Session::start_recording(const SessionOptions& defaults,
                              std::optional<AppHandle> previous_app) {
    if (state_ != SessionState::Idle && state_ != SessionState::Error) {
        std::println(stderr, "session: cannot start, state is {}", state_name(state_));
        return false;
    }

    ctx_ = SessionContext{};
    ctx_.options = defaults;
    ctx_.previous_app = std::move(previous_app);
    error_.reset();
    continuation_ = false;

    if (auto res = capture_.start(); !res) {
        fail(std::move(res.error()));
        return false;
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return true;
}

bool Session::continue_recording() {
    if (state_ != SessionState::ShowingResult) {
        std::println(stderr, "session: cannot continue, state is {}", state_name(state_));
        return false;
    }

    ctx_.options.mode = Mode::Ask;
    continuation_ = true;

    if (auto res = capture_.start(); !res) {
        fail(std::move(res.error()));
        return false;
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return true;
}

bool Session::can_mutate(std::string_view what) const {
    if (state_ == SessionState::Recording) return true;
    std::println(stderr, "session: ignoring {} change, state is {}", what, state_name(state_));
    return false;
}

bool Session::set_mode(Mode mode) {
    if (!can_mutate("mode")) return false;
    ctx_.options.mode = mode;
    return true;
}

bool Session::set_language(std::string code) {
    if (!can_mutate("language")) return false;
    ctx_.options.language = std::move(code);
    return true;
}

bool Session::set_formatting(FormattingStyle style) {
    if (!can_mutate("formatting")) return false;
    ctx_.options.formatting = style;
    return true;
}

bool Session::set_code_language(CodeLanguage lang) {
    if (!can_mutate("code language")) return false;
    ctx_.options.code_language = lang;
    return true;
}

bool Session::set_use_clipboard(bool on) {
    if (!can_mutate("clipboard")) return false;
    ctx_.options.use_clipboard = on;
    return true;
}

bool Session::set_routing(OutputRouting routing) {
    if (!can_mutate("output")) return false;
    ctx_.options.routing = routing;
    return true;
}

bool Session::set_terminology(bool on) {
    if (!can_mutate("terminology")) return false;
    ctx_.options.terminology = on;
    return true;
}

bool Session::set_clipboard(ClipboardSnapshot snapshot) {
    if (!can_mutate("clipboard snapshot")) return false;
    ctx_.clipboard = std::move(snapshot);
    return true;
}

std::optional<FrozenSession> Session::stop_recording() {
    if (state_ != SessionState::Recording) {
        return std::nullopt;
    }

    auto audio = capture_.stop();
    if (!audio || audio->empty()) {
        fail(SessionError{ErrorKind::EmptyCapture, "No audio recorded"});
        return std::nullopt;
    }

    ++generation_;
    state_ = SessionState::Transcribing;

    return FrozenSession{
        .generation = generation_,
        .options = ctx_.options,
        .clipboard = ctx_.clipboard,
        .history = ctx_.history,
        .audio = std::move(*audio),
    };
}

bool Session::is_current(uint64_t generation) const {
    return generation == generation_ &&
           (state_ == SessionState::Transcribing || state_ == SessionState::Processing);
}

bool Session::begin_processing(uint64_t generation, std::string transcription) {
    if (!is_current(generation) || state_ != SessionState::Transcribing) return false;
    last_transcription_ = transcription;
    pending_transcription_ = std::move(transcription);
    state_ = SessionState::Processing;
    return true;
}

bool Session::commit_result(uint64_t generation, std::string result) {
    if (!is_current(generation) || state_ != SessionState::Processing) return false;

    ctx_.history.push_back({"user", std::move(pending_transcription_)});
    ctx_.history.push_back({"assistant", result});
    pending_transcription_.clear();

    last_result_ = std::move(result);
    state_ = SessionState::ShowingResult;
    return true;
}

std::optional<AppHandle> Session::finish_delivery(uint64_t generation, std::string result) {
    if (!is_current(generation) || state_ != SessionState::Processing) return std::nullopt;
    last_result_ = std::move(result);
    return reset_to_idle();
}

void Session::fail(SessionError error) {
    if (state_ == SessionState::Recording && capture_.is_capturing()) {
        capture_.stop();
    }
    error_ = std::move(error);
    pending_transcription_.clear();
    state_ = SessionState::Error;
}

std::optional<AppHandle> Session::cancel() {
    if (state_ != SessionState::Recording) return std::nullopt;
    capture_.stop();
    return reset_to_idle();
}

std::optional<AppHandle> Session::abort() {
    if (state_ != SessionState::Transcribing && state_ != SessionState::Processing) {
        return std::nullopt;
    }
    return reset_to_idle();
}

std::optional<AppHandle> Session::dismiss() {
    if (state_ != SessionState::ShowingResult && state_ != SessionState::Error) {
        return std::nullopt;
    }
    return reset_to_idle();
}

bool Session::expire_error() {
    if (state_ != SessionState::Error) return false;
    reset_to_idle();
    return true;
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

std::optional<AppHandle> Session::reset_to_idle() {
    auto app = std::move(ctx_.previous_app);
    ctx_ = SessionContext{};
    error_.reset();
    pending_transcription_.clear();
    continuation_ = false;
    state_ = SessionState::Idle;
    return app;
}
