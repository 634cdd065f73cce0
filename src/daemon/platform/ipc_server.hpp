#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Write side of a client connection. The session core and the presenter only reply.
class ReplyChannel {
public:
    virtual ~ReplyChannel() = default;
    // False when the peer is gone or the frame could not be written whole.
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
};

// Listening socket plus per-client line framing, driven by the event loop.
class IpcServer : public ReplyChannel {
public:
    enum class ReadStatus {
        Message, // `cmd` holds one complete command object
        Pending, // partial line buffered, wait for more
        Closed,  // peer hung up or sent garbage; close the fd
    };

    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    // Returns the new client fd, or -1 if nothing was accepted.
    virtual int accept_client() = 0;
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual void close_client(int client_fd) = 0;
};
