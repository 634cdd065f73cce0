#pragma once

#include "backend/openai_client.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/file_credential_store.hpp"
#include "platform/linux/ipc_presenter.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/sway_focus.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_clipboard.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void arm_timer();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    UnixSocketServer ipc_server_;
    IpcPresenter presenter_;
    FileCredentialStore credentials_;
    PipeWireCapture audio_capture_;
    OpenAIClient backend_;
    WaylandClipboard clipboard_;
    SwayFocus focus_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
