#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    std::expected<nlohmann::json, RecvError> recv(int timeout_ms) override;
    void close() override;

private:
    // Pops the first complete line out of pending_, if there is one.
    bool take_line(std::string& line);

    int fd_ = -1;
    std::string pending_; // bytes received past the last newline
};
