#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "pipeline.hpp"
#include "prompts.hpp"

#include <string>

namespace {

FrozenSession frozen(Mode mode) {
    FrozenSession s;
    s.generation = 1;
    s.options.mode = mode;
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Pipeline dispatch", "[pipeline]") {
    MockCompletion completion;
    PipelineSettings settings;
    settings.terminology = {"Kubernetes", "gRPC"};
    std::stop_source stop;

    SECTION("TranscribeRunsCleanup") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Transcribe);

        auto res = dispatcher.run(session, "um hello world", stop.get_token());
        REQUIRE(res.has_value());
        REQUIRE(res->text == "processed");
        REQUIRE(res->delivery == DeliveryKind::RouteByOutputSetting);

        REQUIRE(completion.requests.size() == 1);
        const auto& req = completion.requests[0];
        REQUIRE(req.user == "um hello world");
        REQUIRE(req.model == "gpt-4o-mini");
        REQUIRE(req.temperature == 0.3);
        REQUIRE(req.history.empty());
        REQUIRE(contains(req.system, prompts::kDefaultCleanup));
        REQUIRE(contains(req.system, "Kubernetes, gRPC"));
    }

    SECTION("TerminologyToggleOffDropsTerms") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Transcribe);
        session.options.terminology = false;

        REQUIRE(dispatcher.run(session, "text", stop.get_token()).has_value());
        REQUIRE_FALSE(contains(completion.requests[0].system, "Kubernetes"));
    }

    SECTION("FormattingStyleSelectsPrompt") {
        settings.cleanup_prompt = "Custom cleanup.";
        PipelineDispatcher dispatcher(completion, settings);

        auto standard = frozen(Mode::Transcribe);
        auto condensed = frozen(Mode::Transcribe);
        condensed.options.formatting = FormattingStyle::Condensed;

        dispatcher.run(standard, "a", stop.get_token());
        dispatcher.run(condensed, "b", stop.get_token());

        REQUIRE(contains(completion.requests[0].system, "Custom cleanup."));
        REQUIRE_FALSE(contains(completion.requests[1].system, "Custom cleanup."));
        REQUIRE(contains(completion.requests[1].system, "chat message"));
    }

    SECTION("PostProcessingOffPassesTranscriptThrough") {
        settings.post_processing = false;
        PipelineDispatcher dispatcher(completion, settings);

        auto res = dispatcher.run(frozen(Mode::Transcribe), "raw text", stop.get_token());
        REQUIRE(res->text == "raw text");
        REQUIRE(completion.calls() == 0);
    }

    SECTION("AskSendsHistoryAndAlwaysChats") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Ask);
        session.options.routing = OutputRouting::AutoPaste;
        session.history = {{"user", "q1"}, {"assistant", "a1"}};

        auto res = dispatcher.run(session, "q2", stop.get_token());
        REQUIRE(res->delivery == DeliveryKind::AlwaysChat);

        const auto& req = completion.requests[0];
        REQUIRE(req.system == prompts::ask());
        REQUIRE(req.user == "q2");
        REQUIRE(req.history == session.history);
        REQUIRE_FALSE(req.web_search);
    }

    SECTION("AskWebSearchUsesSearchModel") {
        settings.web_search = true;
        PipelineDispatcher dispatcher(completion, settings);

        dispatcher.run(frozen(Mode::Ask), "weather today", stop.get_token());
        REQUIRE(completion.requests[0].web_search);
        REQUIRE(completion.requests[0].model == "gpt-4o-search-preview");
    }

    SECTION("RespondIncludesClipboardText") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Respond);
        session.clipboard = ClipboardSnapshot::from_text("Can we meet Friday?");

        dispatcher.run(session, "say yes politely", stop.get_token());
        const auto& user = completion.requests[0].user;
        REQUIRE(user == "Message to respond to:\nCan we meet Friday?\n\nHow to respond:\nsay yes politely");
    }

    SECTION("RespondWithoutClipboard") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Respond);
        session.clipboard = ClipboardSnapshot::from_text("ignored");
        session.options.use_clipboard = false;

        dispatcher.run(session, "decline", stop.get_token());
        REQUIRE(completion.requests[0].user == "How to respond:\ndecline");
    }

    SECTION("RespondIgnoresImageClipboard") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Respond);
        session.clipboard = ClipboardSnapshot::from_image({0x89, 'P', 'N', 'G'});

        dispatcher.run(session, "thanks", stop.get_token());
        REQUIRE(completion.requests[0].user == "How to respond:\nthanks");
        REQUIRE(completion.image_requests.empty());
    }

    SECTION("CodeUsesLanguageHint") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Code);
        session.options.code_language = CodeLanguage::Python;

        auto res = dispatcher.run(session, "list files", stop.get_token());
        REQUIRE(res->delivery == DeliveryKind::RouteByOutputSetting);
        REQUIRE(completion.requests[0].user == "generate code: list files");
        REQUIRE(completion.requests[0].system == prompts::code(CodeLanguage::Python));
    }

    SECTION("ProcessText") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Process);
        session.clipboard = ClipboardSnapshot::from_text("Bonjour");

        dispatcher.run(session, "translate to English", stop.get_token());
        REQUIRE(completion.requests[0].user == "Content to process:\nBonjour\n\nCommand:\ntranslate to English");
        REQUIRE(completion.image_requests.empty());
    }

    SECTION("ProcessImageUsesVision") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Process);
        session.clipboard = ClipboardSnapshot::from_image({1, 2, 3});

        auto res = dispatcher.run(session, "describe this", stop.get_token());
        REQUIRE(res.has_value());
        REQUIRE(completion.requests.empty());
        REQUIRE(completion.image_requests.size() == 1);
        REQUIRE(completion.image_requests[0].user == "describe this");
        REQUIRE(completion.image_requests[0].png == std::vector<uint8_t>{1, 2, 3});
    }

    SECTION("ProcessEmptyClipboardRejectedBeforeNetwork") {
        PipelineDispatcher dispatcher(completion, settings);
        auto session = frozen(Mode::Process);

        auto valid = dispatcher.validate(session);
        REQUIRE_FALSE(valid.has_value());
        REQUIRE(valid.error().kind == ErrorKind::EmptyClipboard);

        auto res = dispatcher.run(session, "summarize", stop.get_token());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::EmptyClipboard);
        REQUIRE(completion.calls() == 0);
    }

    SECTION("OtherModesPassValidation") {
        PipelineDispatcher dispatcher(completion, settings);
        REQUIRE(dispatcher.validate(frozen(Mode::Respond)).has_value());
        REQUIRE(dispatcher.validate(frozen(Mode::Transcribe)).has_value());
    }

    SECTION("ServiceErrorMapsToServiceFailure") {
        completion.error = "HTTP error 500";
        PipelineDispatcher dispatcher(completion, settings);

        auto res = dispatcher.run(frozen(Mode::Code), "x", stop.get_token());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::ServiceFailure);
        REQUIRE(res.error().message == "HTTP error 500");
    }
}

TEST_CASE("Prompt construction", "[pipeline]") {
    SECTION("CleanupAlwaysKeepsLanguage") {
        auto p = prompts::cleanup(FormattingStyle::Structured, "", {});
        REQUIRE(contains(p, "Never translate"));
        REQUIRE_FALSE(contains(p, "mishears"));
    }

    SECTION("CodePromptPerLanguage") {
        REQUIRE(contains(prompts::code(CodeLanguage::Bash), "Bash"));
        REQUIRE(contains(prompts::code(CodeLanguage::Auto), "most suitable"));
    }
}
