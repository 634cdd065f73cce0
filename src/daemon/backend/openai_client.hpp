#pragma once

#include "backend/completion_client.hpp"
#include "backend/transcription_client.hpp"
#include "config.hpp"
#include "platform/credential_store.hpp"

#include <string>

// Transcription and chat completions against an OpenAI-compatible endpoint over libcurl.
// Requests are aborted mid-transfer when the stop token fires.
class OpenAIClient : public TranscriptionClient, public CompletionClient {
public:
    OpenAIClient(Config::Backend backend, const CredentialStore& credentials);
    ~OpenAIClient() override;

    OpenAIClient(const OpenAIClient&) = delete;
    OpenAIClient& operator=(const OpenAIClient&) = delete;

    std::expected<TranscriptResult, std::string>
        transcribe(const RecordedAudio& audio, const std::optional<std::string>& language,
                   std::stop_token stop) override;

    std::expected<std::string, std::string>
        complete(const CompletionRequest& request, std::stop_token stop) override;

    std::expected<std::string, std::string>
        complete_with_image(const std::string& system, const std::string& user,
                            std::span<const uint8_t> png, std::stop_token stop) override;

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    std::expected<HttpResponse, std::string> post_json(const std::string& path, const std::string& body,
                                                       std::stop_token stop);

    Config::Backend backend_;
    const CredentialStore& credentials_;
};
