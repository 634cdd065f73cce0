#pragma once

#include "backend/completion_client.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

// Request bodies and response parsing for the OpenAI-compatible HTTP API.
// Kept free of any transport so it can be tested without a network.
namespace openai {

std::string base64_encode(std::span<const uint8_t> data);

// POST /chat/completions body for a text completion.
nlohmann::json chat_body(const CompletionRequest& request);

// POST /chat/completions body carrying one PNG as a data URL.
nlohmann::json vision_body(const std::string& model, const std::string& system,
                           const std::string& user, std::span<const uint8_t> png);

// First choice's message content.
std::expected<std::string, std::string> parse_chat_response(long http_status, const std::string& body);

// "text" field of a transcription response, surrounding whitespace trimmed.
std::expected<std::string, std::string> parse_transcription_response(long http_status,
                                                                     const std::string& body);

// `{"error":{"message":...}}` if present, otherwise "HTTP error <status>".
std::string error_message(long http_status, const std::string& body);

} // namespace openai
