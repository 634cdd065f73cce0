#pragma once

#include "backend/completion_client.hpp"
#include "backend/transcription_client.hpp"
#include "config.hpp"
#include "pipeline.hpp"
#include "platform/audio_capture.hpp"
#include "platform/clipboard_gateway.hpp"
#include "platform/credential_store.hpp"
#include "platform/focus_gateway.hpp"
#include "platform/ipc_server.hpp"
#include "platform/presenter.hpp"
#include "session.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Owns the one session and sequences capture, transcription, processing and delivery.
// Every public method runs on the event loop thread; only the pipeline worker runs
// elsewhere and reports back through notify().
class DaemonCore {
public:
    using Clock = std::chrono::steady_clock;
    using NotifyCallback = std::function<void()>;
    using NowFunction = std::function<Clock::time_point()>;

    struct Services {
        AudioCapture& audio;
        TranscriptionClient& transcriber;
        CompletionClient& completion;
        ClipboardGateway& clipboard;
        FocusGateway& focus;
        CredentialStore& credentials;
        Presenter& presenter;
        ReplyChannel& ipc;
    };

    DaemonCore(Config config, bool verbose, Services services,
               NotifyCallback notify, NowFunction now = &Clock::now);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Drains results posted by the pipeline worker.
    void on_worker_events();

    // Runs whatever deadline has passed: paste after focus settle, error auto-clear,
    // level metering.
    void on_timer();

    // Time until on_timer() has work to do, or nothing if no deadline is armed.
    std::optional<std::chrono::milliseconds> next_timeout() const;

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    SessionState session_state() const { return session_.state(); }
    const Session& session() const { return session_; }
    const SessionOptions& preferences() const { return prefs_; }
    bool paste_pending() const { return pending_paste_.has_value(); }
    StatusView status_view() const;

    void shutdown();

private:
    struct WorkerEvent {
        enum class Kind { Transcribed, Completed, Failed };
        Kind kind = Kind::Failed;
        uint64_t generation = 0;
        std::string text;
        DeliveryKind delivery = DeliveryKind::RouteByOutputSetting;
        SessionError error;
        double seconds = 0.0; // transcription request time
    };

    struct PendingPaste {
        std::string text;
        std::optional<AppHandle> target; // chord is chosen for this app
        Clock::time_point due;
    };

    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_dismiss(const nlohmann::json& cmd);
    nlohmann::json handle_set(const nlohmann::json& cmd);
    nlohmann::json handle_toggle_option(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_last(const nlohmann::json& cmd);

    void start_pipeline(FrozenSession frozen);
    void post(WorkerEvent event);

    void on_transcribed(const WorkerEvent& ev);
    void on_completed(const WorkerEvent& ev);
    void on_failed(const WorkerEvent& ev);

    void deliver(uint64_t generation, std::string text, DeliveryKind kind);
    void paste_now();
    void enter_error(SessionError error);
    void refresh_clipboard();
    void restore_focus(const std::optional<AppHandle>& app);
    void respond_waiting(const nlohmann::json& response);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    AudioCapture& audio_;
    TranscriptionClient& transcriber_;
    ClipboardGateway& clipboard_;
    FocusGateway& focus_;
    CredentialStore& credentials_;
    Presenter& presenter_;
    ReplyChannel& ipc_;

    NotifyCallback notify_;
    NowFunction now_;

    PipelineDispatcher dispatcher_;
    Session session_;
    SessionOptions prefs_;

    std::optional<PendingPaste> pending_paste_;
    double transcribe_s_ = 0.0;
    std::optional<Clock::time_point> error_deadline_;
    std::optional<Clock::time_point> next_level_;
    std::vector<int> waiting_clients_;

    std::mutex events_mutex_;
    std::vector<WorkerEvent> events_;
    std::jthread worker_;
};
