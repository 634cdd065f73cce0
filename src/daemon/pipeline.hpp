#pragma once

#include "backend/completion_client.hpp"
#include "session.hpp"
#include "session_error.hpp"

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

enum class DeliveryKind { AlwaysChat, RouteByOutputSetting };

struct PipelineResult {
    std::string text;
    DeliveryKind delivery = DeliveryKind::RouteByOutputSetting;
};

struct PipelineSettings {
    bool post_processing = true;
    std::string cleanup_prompt; // empty: built-in Standard prompt
    std::vector<std::string> terminology;
    std::string chat_model = "gpt-4o-mini";
    std::string search_model = "gpt-4o-search-preview";
    bool web_search = false;
};

// Runs the mode-specific completion calls for a frozen session.
// Called from the pipeline worker thread; holds no mutable state.
class PipelineDispatcher {
public:
    PipelineDispatcher(CompletionClient& completion, PipelineSettings settings);

    // Checks that must fail before any network call is made.
    std::expected<void, SessionError> validate(const FrozenSession& session) const;

    std::expected<PipelineResult, SessionError>
        run(const FrozenSession& session, const std::string& transcription,
            std::stop_token stop) const;

    const PipelineSettings& settings() const { return settings_; }

private:
    std::expected<std::string, SessionError>
        transcribe(const FrozenSession& session, const std::string& text, std::stop_token stop) const;
    std::expected<std::string, SessionError>
        ask(const FrozenSession& session, const std::string& text, std::stop_token stop) const;
    std::expected<std::string, SessionError>
        respond(const FrozenSession& session, const std::string& text, std::stop_token stop) const;
    std::expected<std::string, SessionError>
        code(const FrozenSession& session, const std::string& text, std::stop_token stop) const;
    std::expected<std::string, SessionError>
        process(const FrozenSession& session, const std::string& text, std::stop_token stop) const;

    std::expected<std::string, SessionError>
        complete(CompletionRequest request, std::stop_token stop) const;

    CompletionClient& completion_;
    PipelineSettings settings_;
};
