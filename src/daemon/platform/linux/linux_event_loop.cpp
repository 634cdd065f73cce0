#include "platform/linux/linux_event_loop.hpp"

#include "ipc_protocol.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

std::string key_file_path(const Config& config) {
    if (!config.credentials.key_file.empty()) return config.credentials.key_file;
    auto dir = platform::config_dir();
    return dir.empty() ? std::string() : dir + "/api_key";
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      presenter_(ipc_server_),
      credentials_(config_.credentials.env, key_file_path(config_)),
      audio_capture_(config_.audio.ring_buffer_samples(), config_.audio.sample_rate),
      backend_(config_.backend, credentials_),
      core_(config_, verbose_,
            DaemonCore::Services{
                .audio = audio_capture_,
                .transcriber = backend_,
                .completion = backend_,
                .clipboard = clipboard_,
                .focus = focus_,
                .credentials = credentials_,
                .presenter = presenter_,
                .ipc = ipc_server_,
            },
            // NotifyCallback, called from the pipeline worker
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Window manager (optional)
    if (focus_.connect()) {
        log("Sway IPC connected");
    } else {
        log("Sway IPC not available (focus restore disabled)");
    }

    if (!credentials_.has_credential()) {
        std::println(stderr, "No API key found in ${} or {}; recordings will fail until one is set",
                     config_.credentials.env, key_file_path(config_));
    }

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    // A helper tool exiting early must not kill the daemon mid-write.
    signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Paste settle, error auto-clear and level metering deadlines
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        arm_timer();

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_worker_events();
                }
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    core_.on_timer();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    // Drain every complete line; epoll will not fire again for data already buffered.
    while (true) {
        nlohmann::json cmd;
        auto status = ipc_server_.read_command(fd, cmd);

        if (status == IpcServer::ReadStatus::Pending) return;
        if (status == IpcServer::ReadStatus::Closed) {
            drop_client(fd);
            return;
        }

        nlohmann::json response;
        try {
            std::string cmd_str = cmd.value("cmd", "");

            if (cmd_str == "watch") {
                presenter_.add_watcher(fd);
                auto frame = ipc::status_json(core_.status_view());
                frame["event"] = "status";
                ipc_server_.send_response(fd, frame);
                continue;
            }

            response = core_.handle_command(cmd_str, cmd);
        } catch (const nlohmann::json::exception& e) {
            // A field of the wrong type; the session is untouched.
            response = ipc::error(std::string("invalid command: ") + e.what());
        }

        if (response.value("status", "") == "transcribing") {
            core_.add_waiting_client(fd);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    presenter_.remove_watcher(fd);
    core_.remove_waiting_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::arm_timer() {
    itimerspec spec{};

    if (auto timeout = core_.next_timeout()) {
        auto ms = timeout->count();
        if (ms <= 0) {
            // A zero it_value disarms the timer; fire as soon as possible instead.
            spec.it_value.tv_nsec = 1;
        } else {
            spec.it_value.tv_sec = ms / 1000;
            spec.it_value.tv_nsec = (ms % 1000) * 1000000;
        }
    }

    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxkey] {}", msg);
    }
}
