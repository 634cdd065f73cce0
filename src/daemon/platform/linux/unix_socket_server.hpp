#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <sys/types.h>
#include <unordered_map>

// Newline-delimited JSON over a non-blocking AF_UNIX stream socket. Only peers
// running as the daemon's own user are accepted.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return listen_fd_; }
    int accept_client() override;
    ReadStatus read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return pending_.size(); }

private:
    bool fail(const char* what);

    int listen_fd_ = -1;
    std::string path_;
    uid_t owner_;
    std::unordered_map<int, std::string> pending_; // fd -> bytes past the last newline
};
