#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

// Commands are a few hundred bytes; anything this long without a newline is not a client.
constexpr size_t kMaxLineLength = 64 * 1024;

// How long a reply may wait for a full socket buffer to drain.
constexpr int kSendStallMs = 1000;

} // namespace

UnixSocketServer::UnixSocketServer() : owner_(::getuid()) {}

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);

    // A previous daemon that crashed leaves its socket file behind.
    ::unlink(endpoint.c_str());

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) return fail("socket");

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail("bind");
    }
    path_ = endpoint;

    // Results can carry clipboard contents: owner only.
    if (::chmod(endpoint.c_str(), 0600) < 0) return fail("chmod");
    if (::listen(listen_fd_, 8) < 0) return fail("listen");

    return true;
}

bool UnixSocketServer::fail(const char* what) {
    std::println(stderr, "ipc: {}() failed: {}", what, std::strerror(errno));
    stop();
    return false;
}

void UnixSocketServer::stop() {
    for (const auto& [fd, _] : pending_) {
        ::close(fd);
    }
    pending_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;

    ucred peer{};
    socklen_t len = sizeof(peer);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &peer, &len) < 0 || peer.uid != owner_) {
        std::println(stderr, "ipc: rejected connection from uid {}", peer.uid);
        ::close(fd);
        return -1;
    }

    pending_.emplace(fd, std::string());
    return fd;
}

IpcServer::ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto it = pending_.find(client_fd);
    if (it == pending_.end()) return ReadStatus::Closed;
    std::string& buf = it->second;

    // Drain an already buffered line before touching the socket again.
    auto pos = buf.find('\n');
    if (pos == std::string::npos) {
        char chunk[4096];
        ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return ReadStatus::Pending;
        }
        if (n <= 0) return ReadStatus::Closed;

        buf.append(chunk, static_cast<size_t>(n));
        pos = buf.find('\n');
        if (pos == std::string::npos) {
            return buf.size() > kMaxLineLength ? ReadStatus::Closed : ReadStatus::Pending;
        }
    }

    auto parsed = nlohmann::json::parse(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(pos),
                                        nullptr, false);
    buf.erase(0, pos + 1);

    if (parsed.is_discarded() || !parsed.is_object()) {
        std::println(stderr, "ipc: malformed command on fd {}", client_fd);
        return ReadStatus::Closed;
    }
    cmd = std::move(parsed);
    return ReadStatus::Message;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";

    // Long results can exceed the socket buffer; wait briefly for the reader to catch up.
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n >= 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return false;

        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        if (::poll(&pfd, 1, kSendStallMs) <= 0) return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    if (pending_.erase(client_fd) > 0) {
        ::close(client_fd);
    }
}
