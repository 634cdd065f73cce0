#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

[[noreturn]] void exec_child(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    ::execvp(args[0], args.data());
    ::_exit(127);
}

std::expected<void, std::string> wait_child(pid_t pid, const std::string& name) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(name + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(name + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return {};
}

void silence_stderr() {
    int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
    }
}

} // namespace

std::expected<void, std::string> run(const std::vector<std::string>& argv, std::string_view input) {
    if (argv.empty()) return std::unexpected("empty command");

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        ::dup2(pipefd[0], STDIN_FILENO);
        exec_child(argv);
    }

    ::close(pipefd[0]);
    size_t total_written = 0;
    while (total_written < input.size()) {
        ssize_t n = ::write(pipefd[1], input.data() + total_written, input.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = errno_message("write()");
            ::close(pipefd[1]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(err);
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(pipefd[1]);

    return wait_child(pid, argv[0]);
}

std::expected<std::string, std::string> capture(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        ::dup2(pipefd[1], STDOUT_FILENO);
        silence_stderr();
        exec_child(argv);
    }

    ::close(pipefd[1]);
    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = errno_message("read()");
            ::close(pipefd[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(err);
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    auto res = wait_child(pid, argv[0]);
    if (!res) return std::unexpected(std::move(res.error()));
    return out;
}

} // namespace subprocess
