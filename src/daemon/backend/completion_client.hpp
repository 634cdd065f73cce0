#pragma once

#include "session_context.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

struct CompletionRequest {
    std::string system;
    std::string user;
    std::vector<ChatTurn> history;
    std::string model;
    double temperature = 0.7; // not sent with web search
    bool web_search = false;
};

class CompletionClient {
public:
    virtual ~CompletionClient() = default;
    virtual std::expected<std::string, std::string>
        complete(const CompletionRequest& request, std::stop_token stop) = 0;
    virtual std::expected<std::string, std::string>
        complete_with_image(const std::string& system, const std::string& user,
                            std::span<const uint8_t> png, std::stop_token stop) = 0;
};
