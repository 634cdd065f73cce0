#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// Client end of the daemon socket. Replies and watch events both arrive as one JSON
// object per line.
class IpcClient {
public:
    enum class RecvError { Timeout, Closed, Malformed };

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // A negative timeout waits until a frame arrives or the daemon hangs up.
    virtual std::expected<nlohmann::json, RecvError> recv(int timeout_ms) = 0;
    virtual void close() = 0;

    // One command and its reply.
    std::expected<nlohmann::json, std::string> request(const nlohmann::json& cmd, int timeout_ms) {
        if (!send(cmd)) return std::unexpected("Failed to send command");
        auto reply = recv(timeout_ms);
        if (!reply) return std::unexpected(std::string(describe(reply.error())));
        return std::move(*reply);
    }

    static std::string_view describe(RecvError err) {
        switch (err) {
            case RecvError::Timeout: return "No response from daemon (timeout)";
            case RecvError::Closed: return "Daemon closed the connection";
            case RecvError::Malformed: return "Malformed reply from daemon";
        }
        return "Receive failed";
    }
};
