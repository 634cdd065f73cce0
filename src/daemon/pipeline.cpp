#include "pipeline.hpp"
#include "prompts.hpp"

#include <span>

PipelineDispatcher::PipelineDispatcher(CompletionClient& completion, PipelineSettings settings)
    : completion_(completion), settings_(std::move(settings)) {}

std::expected<void, SessionError> PipelineDispatcher::validate(const FrozenSession& session) const {
    if (session.options.mode == Mode::Process && session.clipboard.empty()) {
        return make_error(ErrorKind::EmptyClipboard, "Clipboard is empty, nothing to process");
    }
    return {};
}

std::expected<PipelineResult, SessionError>
PipelineDispatcher::run(const FrozenSession& session, const std::string& transcription,
                        std::stop_token stop) const {
    std::expected<std::string, SessionError> text;

    switch (session.options.mode) {
        case Mode::Transcribe: text = transcribe(session, transcription, stop); break;
        case Mode::Ask: text = ask(session, transcription, stop); break;
        case Mode::Respond: text = respond(session, transcription, stop); break;
        case Mode::Code: text = code(session, transcription, stop); break;
        case Mode::Process: text = process(session, transcription, stop); break;
    }

    if (!text) return std::unexpected(std::move(text.error()));

    return PipelineResult{
        .text = std::move(*text),
        .delivery = session.options.mode == Mode::Ask ? DeliveryKind::AlwaysChat
                                                      : DeliveryKind::RouteByOutputSetting,
    };
}

std::expected<std::string, SessionError>
PipelineDispatcher::transcribe(const FrozenSession& session, const std::string& text,
                               std::stop_token stop) const {
    if (!settings_.post_processing) return text;

    std::span<const std::string> terms;
    if (session.options.terminology) terms = settings_.terminology;

    return complete({
        .system = prompts::cleanup(session.options.formatting, settings_.cleanup_prompt, terms),
        .user = text,
        .history = {},
        .model = settings_.chat_model,
        .temperature = 0.3,
    }, stop);
}

std::expected<std::string, SessionError>
PipelineDispatcher::ask(const FrozenSession& session, const std::string& text,
                        std::stop_token stop) const {
    return complete({
        .system = prompts::ask(),
        .user = text,
        .history = session.history,
        .model = settings_.web_search ? settings_.search_model : settings_.chat_model,
        .web_search = settings_.web_search,
    }, stop);
}

std::expected<std::string, SessionError>
PipelineDispatcher::respond(const FrozenSession& session, const std::string& text,
                            std::stop_token stop) const {
    std::optional<std::string> original;
    if (session.options.use_clipboard && session.clipboard.is_text()) {
        original = session.clipboard.text;
    }

    return complete({
        .system = prompts::respond(),
        .user = prompts::respond_message(original, text),
        .history = {},
        .model = settings_.chat_model,
    }, stop);
}

std::expected<std::string, SessionError>
PipelineDispatcher::code(const FrozenSession& session, const std::string& text,
                         std::stop_token stop) const {
    return complete({
        .system = prompts::code(session.options.code_language),
        .user = prompts::code_message(text),
        .history = {},
        .model = settings_.chat_model,
    }, stop);
}

std::expected<std::string, SessionError>
PipelineDispatcher::process(const FrozenSession& session, const std::string& text,
                            std::stop_token stop) const {
    const auto& clip = session.clipboard;

    if (clip.is_text()) {
        return complete({
            .system = prompts::process_text(),
            .user = prompts::process_message(clip.text, text),
            .history = {},
            .model = settings_.chat_model,
        }, stop);
    }

    if (clip.is_image()) {
        auto res = completion_.complete_with_image(prompts::process_image(), text, clip.image, stop);
        if (!res) return make_error(ErrorKind::ServiceFailure, std::move(res.error()));
        return std::move(*res);
    }

    return make_error(ErrorKind::EmptyClipboard, "Clipboard is empty, nothing to process");
}

std::expected<std::string, SessionError>
PipelineDispatcher::complete(CompletionRequest request, std::stop_token stop) const {
    auto res = completion_.complete(request, stop);
    if (!res) return make_error(ErrorKind::ServiceFailure, std::move(res.error()));
    return std::move(*res);
}
