#include "daemon_core.hpp"

#include "ipc_protocol.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

constexpr auto kLevelInterval = std::chrono::milliseconds(100);

PipelineSettings pipeline_settings(const Config& cfg) {
    return PipelineSettings{
        .post_processing = cfg.processing.post_processing,
        .cleanup_prompt = cfg.processing.cleanup_prompt,
        .terminology = cfg.processing.terminology,
        .chat_model = cfg.backend.chat_model,
        .search_model = cfg.backend.search_model,
        .web_search = cfg.processing.web_search,
    };
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, Services services,
                       NotifyCallback notify, NowFunction now)
    : config_(std::move(config)), verbose_(verbose),
      audio_(services.audio), transcriber_(services.transcriber),
      clipboard_(services.clipboard), focus_(services.focus),
      credentials_(services.credentials), presenter_(services.presenter),
      ipc_(services.ipc),
      notify_(std::move(notify)), now_(std::move(now)),
      dispatcher_(services.completion, pipeline_settings(config_)),
      session_(audio_),
      prefs_(config_.session) {}

DaemonCore::~DaemonCore() = default;

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "dismiss") return handle_dismiss(cmd);
    if (cmd_str == "set") return handle_set(cmd);
    if (cmd_str == "toggle_option") return handle_toggle_option(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "last") return handle_last(cmd);
    return ipc::error("unknown command");
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& cmd) {
    if (pending_paste_) {
        return ipc::error("previous result is still being delivered");
    }

    auto state = session_.state();
    if (state == SessionState::Recording || state == SessionState::Transcribing ||
        state == SessionState::Processing) {
        return ipc::error("already recording or processing");
    }

    // A bad value leaves the session, and any pending error clear, untouched.
    std::optional<Mode> mode;
    std::optional<OutputRouting> output;
    try {
        if (cmd.contains("mode")) {
            mode = parse_mode(cmd["mode"].get<std::string>());
            if (!mode) return ipc::error("unknown mode");
        }
        if (cmd.contains("output")) {
            output = parse_routing(cmd["output"].get<std::string>());
            if (!output) return ipc::error("unknown output");
        }
    } catch (const nlohmann::json::exception& e) {
        return ipc::error(std::string("invalid option value: ") + e.what());
    }

    if (!credentials_.has_credential()) {
        enter_error({ErrorKind::NoCredential, "No API key configured"});
        return ipc::error("No API key configured");
    }

    error_deadline_.reset();

    if (state == SessionState::ShowingResult) {
        if (!session_.continue_recording()) {
            enter_error(session_.error().value_or(SessionError{}));
            return ipc::error(session_.error() ? session_.error()->message : "failed to start recording");
        }
        log(std::format("Recording resumed (ask, {} turns)", session_.context().history.size() / 2));
    } else {
        SessionOptions defaults = prefs_;
        defaults.mode = mode.value_or(config_.session.mode);
        if (output) defaults.routing = *output;

        auto app = focus_.capture_current();
        if (!session_.start_recording(defaults, app)) {
            if (session_.state() == SessionState::Error) {
                enter_error(*session_.error());
                return ipc::error(session_.error()->message);
            }
            return ipc::error("failed to start recording");
        }

        if (uses_clipboard(session_.options().mode)) {
            refresh_clipboard();
        }
        log("Recording started" + (app ? " (" + app->app_id + ")" : std::string()));
    }

    next_level_ = now_() + kLevelInterval;
    presenter_.show(status_view());
    return {{"status", "ok"}, {"message", "recording"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (session_.state() != SessionState::Recording) {
        return ipc::error("not recording");
    }

    next_level_.reset();
    auto frozen = session_.stop_recording();
    if (!frozen) {
        enter_error(session_.error().value_or(SessionError{ErrorKind::EmptyCapture, "No audio recorded"}));
        return ipc::error(session_.error() ? session_.error()->message : "no audio captured");
    }

    if (auto valid = dispatcher_.validate(*frozen); !valid) {
        session_.fail(valid.error());
        enter_error(valid.error());
        return ipc::error(valid.error().message);
    }

    double duration = frozen->audio.duration_s();
    log(std::format("Recording stopped, {:.1f}s audio, mode {}, transcribing...",
                    duration, mode_name(frozen->options.mode)));

    start_pipeline(std::move(*frozen));
    presenter_.show(status_view());

    return {{"status", "transcribing"}, {"duration", duration}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    switch (session_.state()) {
        case SessionState::Recording:
            return handle_stop(cmd);
        case SessionState::Transcribing:
        case SessionState::Processing:
            return ipc::error("busy processing previous recording");
        default:
            return handle_start(cmd);
    }
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& /*cmd*/) {
    std::optional<AppHandle> app;

    switch (session_.state()) {
        case SessionState::Recording:
            next_level_.reset();
            app = session_.cancel();
            log("Recording cancelled");
            break;
        case SessionState::Transcribing:
        case SessionState::Processing:
            app = session_.abort();
            worker_.request_stop();
            respond_waiting(ipc::error("cancelled"));
            log("Processing cancelled");
            break;
        default:
            return ipc::error("nothing to cancel");
    }

    presenter_.hide();
    restore_focus(app);
    return ipc::ok("cancelled");
}

nlohmann::json DaemonCore::handle_dismiss(const nlohmann::json& cmd) {
    auto state = session_.state();
    if (state != SessionState::ShowingResult && state != SessionState::Error) {
        return ipc::error("no result to dismiss");
    }

    if (cmd.value("copy", false) && state == SessionState::ShowingResult) {
        if (auto res = clipboard_.write_text(session_.last_result()); !res) {
            log("Copy to clipboard failed: " + res.error());
        }
    }

    error_deadline_.reset();
    auto app = session_.dismiss();
    presenter_.hide();
    restore_focus(app);
    return ipc::ok("dismissed");
}

nlohmann::json DaemonCore::handle_set(const nlohmann::json& cmd) {
    if (session_.state() != SessionState::Recording) {
        return ipc::error("options can only be changed while recording");
    }

    // Validate everything first so a bad value leaves the session untouched.
    std::optional<Mode> mode;
    std::optional<std::string> language;
    std::optional<FormattingStyle> format;
    std::optional<CodeLanguage> code_language;
    std::optional<OutputRouting> output;

    try {
        if (cmd.contains("mode")) {
            mode = parse_mode(cmd["mode"].get<std::string>());
            if (!mode) return ipc::error("unknown mode");
        }
        if (cmd.contains("language")) {
            language = cmd["language"].get<std::string>();
            if (!is_valid_language(*language)) return ipc::error("invalid language code");
        }
        if (cmd.contains("format")) {
            format = parse_formatting(cmd["format"].get<std::string>());
            if (!format) return ipc::error("unknown format");
        }
        if (cmd.contains("code_language")) {
            code_language = parse_code_language(cmd["code_language"].get<std::string>());
            if (!code_language) return ipc::error("unknown code language");
        }
        if (cmd.contains("output")) {
            output = parse_routing(cmd["output"].get<std::string>());
            if (!output) return ipc::error("unknown output");
        }
        if (cmd.contains("use_clipboard")) cmd["use_clipboard"].get<bool>();
        if (cmd.contains("terminology")) {
            cmd["terminology"].get<bool>();
            if (config_.processing.terminology.empty()) {
                return ipc::error("no terminology configured");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return ipc::error(std::string("invalid option value: ") + e.what());
    }

    if (mode) {
        session_.set_mode(*mode);
        if (uses_clipboard(*mode)) refresh_clipboard();
    }
    if (language && session_.set_language(*language)) prefs_.language = *language;
    if (format && session_.set_formatting(*format)) prefs_.formatting = *format;
    if (code_language && session_.set_code_language(*code_language)) prefs_.code_language = *code_language;
    if (output && session_.set_routing(*output)) prefs_.routing = *output;
    if (cmd.contains("use_clipboard")) {
        bool on = cmd["use_clipboard"].get<bool>();
        if (session_.set_use_clipboard(on)) prefs_.use_clipboard = on;
    }
    if (cmd.contains("terminology")) {
        bool on = cmd["terminology"].get<bool>();
        if (session_.set_terminology(on)) prefs_.terminology = on;
    }

    presenter_.show(status_view());
    return ipc::status_json(status_view());
}

nlohmann::json DaemonCore::handle_toggle_option(const nlohmann::json& cmd) {
    auto option = cmd.value("option", "");
    const auto& o = session_.options();

    if (option == "clipboard") {
        return handle_set({{"use_clipboard", !o.use_clipboard}});
    }
    if (option == "output") {
        auto next = o.routing == OutputRouting::AutoPaste ? OutputRouting::ShowInChat
                                                           : OutputRouting::AutoPaste;
        return handle_set({{"output", routing_name(next)}});
    }
    if (option == "terminology") {
        return handle_set({{"terminology", !o.terminology}});
    }
    return ipc::error("unknown option");
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    return ipc::status_json(status_view());
}

nlohmann::json DaemonCore::handle_last(const nlohmann::json& cmd) {
    const auto& result = session_.last_result();
    if (cmd.value("copy", false) && !result.empty()) {
        if (auto res = clipboard_.write_text(result); !res) {
            return ipc::error("copy failed: " + res.error());
        }
    }
    return {
        {"status", "ok"},
        {"transcription", session_.last_transcription()},
        {"text", result},
    };
}

void DaemonCore::start_pipeline(FrozenSession frozen) {
    {
        std::lock_guard lock(events_mutex_);
        events_.clear();
    }

    worker_ = std::jthread([this, frozen = std::move(frozen)](std::stop_token stop) mutable {
        const auto gen = frozen.generation;

        auto tr = transcriber_.transcribe(frozen.audio, frozen.options.language_hint(), stop);
        if (!tr) {
            post({.kind = WorkerEvent::Kind::Failed, .generation = gen,
                  .error = {ErrorKind::ServiceFailure, tr.error()}});
            return;
        }
        post({.kind = WorkerEvent::Kind::Transcribed, .generation = gen, .text = tr->text,
              .seconds = tr->processing_s});

        if (stop.stop_requested()) return;

        auto result = dispatcher_.run(frozen, tr->text, stop);
        if (!result) {
            post({.kind = WorkerEvent::Kind::Failed, .generation = gen,
                  .error = std::move(result.error())});
            return;
        }
        post({.kind = WorkerEvent::Kind::Completed, .generation = gen,
              .text = std::move(result->text), .delivery = result->delivery});
    });
}

void DaemonCore::post(WorkerEvent event) {
    {
        std::lock_guard lock(events_mutex_);
        events_.push_back(std::move(event));
    }
    notify_();
}

void DaemonCore::on_worker_events() {
    std::vector<WorkerEvent> batch;
    {
        std::lock_guard lock(events_mutex_);
        batch.swap(events_);
    }

    for (auto& ev : batch) {
        if (!session_.is_current(ev.generation)) {
            log(std::format("Ignoring result of abandoned pipeline #{}", ev.generation));
            continue;
        }
        switch (ev.kind) {
            case WorkerEvent::Kind::Transcribed: on_transcribed(ev); break;
            case WorkerEvent::Kind::Completed: on_completed(ev); break;
            case WorkerEvent::Kind::Failed: on_failed(ev); break;
        }
    }
}

void DaemonCore::on_transcribed(const WorkerEvent& ev) {
    if (!session_.begin_processing(ev.generation, ev.text)) return;
    transcribe_s_ = ev.seconds;
    log(std::format("Transcription complete: {} chars in {:.2f}s", ev.text.size(), ev.seconds));
    presenter_.show(status_view());
}

void DaemonCore::on_completed(const WorkerEvent& ev) {
    log(std::format("Processing complete: {} chars", ev.text.size()));
    deliver(ev.generation, ev.text, ev.delivery);
}

void DaemonCore::on_failed(const WorkerEvent& ev) {
    log("Pipeline failed: " + ev.error.message);
    session_.fail(ev.error);
    enter_error(ev.error);
    respond_waiting(ipc::error(ev.error.message));
}

void DaemonCore::deliver(uint64_t generation, std::string text, DeliveryKind kind) {
    bool to_chat = kind == DeliveryKind::AlwaysChat ||
                   session_.options().routing == OutputRouting::ShowInChat;

    nlohmann::json response = {{"status", "ok"}, {"text", text}, {"transcribe_s", transcribe_s_}};

    if (to_chat) {
        if (!session_.commit_result(generation, std::move(text))) return;
        response["delivery"] = "chat";
        presenter_.show(status_view());
        respond_waiting(response);
        return;
    }

    // Order matters: focus must be back on the target before clipboard and paste.
    presenter_.hide();
    auto app = session_.finish_delivery(generation, text);
    restore_focus(app);

    if (text.empty()) {
        log("Empty result, nothing to paste");
    } else {
        pending_paste_ = PendingPaste{
            .text = std::move(text),
            .target = app,
            .due = now_() + std::chrono::milliseconds(config_.delivery.settle_ms),
        };
    }

    response["delivery"] = "paste";
    respond_waiting(response);
}

void DaemonCore::paste_now() {
    auto paste = std::move(*pending_paste_);
    pending_paste_.reset();

    if (auto res = clipboard_.write_text(paste.text); !res) {
        log("Clipboard write failed: " + res.error());
        return;
    }
    if (auto res = focus_.simulate_paste(paste.target); !res) {
        log("Paste failed: " + res.error());
        return;
    }
    log(std::format("Pasted {} chars", paste.text.size()));
}

void DaemonCore::on_timer() {
    auto now = now_();

    if (pending_paste_ && now >= pending_paste_->due) {
        paste_now();
    }

    if (error_deadline_ && now >= *error_deadline_) {
        error_deadline_.reset();
        if (session_.expire_error()) {
            presenter_.hide();
        }
    }

    if (next_level_ && now >= *next_level_) {
        if (session_.state() == SessionState::Recording) {
            presenter_.level(audio_.level());
            next_level_ = now + kLevelInterval;
        } else {
            next_level_.reset();
        }
    }
}

std::optional<std::chrono::milliseconds> DaemonCore::next_timeout() const {
    std::optional<Clock::time_point> earliest;
    auto consider = [&earliest](const std::optional<Clock::time_point>& t) {
        if (t && (!earliest || *t < *earliest)) earliest = t;
    };

    if (pending_paste_) consider(pending_paste_->due);
    consider(error_deadline_);
    consider(next_level_);

    if (!earliest) return std::nullopt;
    auto delta = std::chrono::ceil<std::chrono::milliseconds>(*earliest - now_());
    return std::max(delta, std::chrono::milliseconds(0));
}

void DaemonCore::enter_error(SessionError error) {
    if (session_.state() != SessionState::Error) {
        session_.fail(error);
    }
    log(std::format("Error ({}): {}", error_kind_name(error.kind), error.message));
    error_deadline_ = now_() + std::chrono::milliseconds(config_.delivery.error_clear_ms);
    presenter_.show(status_view());
}

void DaemonCore::refresh_clipboard() {
    session_.set_clipboard(clipboard_.snapshot());
}

void DaemonCore::restore_focus(const std::optional<AppHandle>& app) {
    if (!app) return;
    if (auto res = focus_.reactivate(*app); !res) {
        log("Focus restore failed: " + res.error());
    }
}

void DaemonCore::respond_waiting(const nlohmann::json& response) {
    for (int fd : waiting_clients_) {
        if (!ipc_.send_response(fd, response)) {
            log(std::format("Client {} went away before the result", fd));
        }
    }
    waiting_clients_.clear();
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

StatusView DaemonCore::status_view() const {
    const auto& ctx = session_.context();
    StatusView view{
        .state = session_.state(),
        .options = ctx.options,
        .clipboard = ctx.clipboard.kind,
        .has_terminology = !config_.processing.terminology.empty(),
        .history_turns = ctx.history.size() / 2,
        .recording_s = session_.recording_duration(),
    };
    if (session_.state() == SessionState::Error && session_.error()) {
        view.message = session_.error()->message;
    } else if (session_.state() == SessionState::ShowingResult) {
        view.message = session_.last_result();
    }
    return view;
}

void DaemonCore::shutdown() {
    switch (session_.state()) {
        case SessionState::Recording:
            session_.cancel();
            break;
        case SessionState::Transcribing:
        case SessionState::Processing:
            log("Abandoning in-flight pipeline");
            worker_.request_stop();
            session_.abort();
            respond_waiting(ipc::error("daemon shutting down"));
            break;
        default:
            break;
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    if (pending_paste_) {
        // The target app still needs its settle time after reactivation.
        auto remaining = pending_paste_->due - now_();
        if (remaining > Clock::duration::zero()) {
            log("Waiting for focus to settle before the final paste");
            std::this_thread::sleep_for(remaining);
        }
        paste_now();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxkey] {}", msg);
    }
}
