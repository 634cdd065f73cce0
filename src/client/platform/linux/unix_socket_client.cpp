#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close();
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;

    std::string msg = cmd.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::expected<nlohmann::json, IpcClient::RecvError> UnixSocketClient::recv(int timeout_ms) {
    if (fd_ < 0) return std::unexpected(RecvError::Closed);

    std::string line;
    while (!take_line(line)) {
        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0 && errno == EINTR) continue;
        if (ready == 0) return std::unexpected(RecvError::Timeout);
        if (ready < 0) return std::unexpected(RecvError::Closed);

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n <= 0) return std::unexpected(RecvError::Closed);
        pending_.append(chunk, static_cast<size_t>(n));
    }

    try {
        return nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(RecvError::Malformed);
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}

bool UnixSocketClient::take_line(std::string& line) {
    auto pos = pending_.find('\n');
    if (pos == std::string::npos) return false;
    line.assign(pending_, 0, pos);
    pending_.erase(0, pos + 1);
    return true;
}
