#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

// Forks; the parent exits and the child carries on.
void detach(const char* step) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: {} fork() failed: {}", step, std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);
}

bool redirect(int target, const char* path, int flags) {
    int fd = ::open(path, flags | O_CLOEXEC, 0600);
    if (fd < 0) return false;
    bool ok = ::dup2(fd, target) >= 0;
    ::close(fd);
    return ok;
}

} // namespace

void daemonize(const std::string& log_path) {
    // Open the log while the launching terminal can still see a failure.
    int log_fd = -1;
    if (!log_path.empty()) {
        log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
        if (log_fd < 0) {
            std::println(stderr, "daemon: cannot open log {}: {}", log_path, std::strerror(errno));
            _exit(1);
        }
    }

    detach("first");
    if (setsid() < 0) _exit(1);
    // The session leader exits so the daemon can never reacquire a controlling terminal.
    detach("second");

    umask(077);
    if (chdir("/") < 0) _exit(1);

    std::fflush(stdout);
    std::fflush(stderr);
    if (!redirect(STDIN_FILENO, "/dev/null", O_RDONLY) || !redirect(STDOUT_FILENO, "/dev/null", O_WRONLY)) {
        _exit(1);
    }
    bool err_ok = log_fd >= 0 ? ::dup2(log_fd, STDERR_FILENO) >= 0
                              : redirect(STDERR_FILENO, "/dev/null", O_WRONLY);
    if (log_fd >= 0) ::close(log_fd);
    if (!err_ok) _exit(1);
}

} // namespace platform
