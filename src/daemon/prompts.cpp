#include "prompts.hpp"

namespace prompts {

const char* const kDefaultCleanup =
    "Fix grammar, punctuation, and formatting. Keep the original meaning and style. "
    "Return only the corrected text without explanations.";

namespace {

constexpr const char* kKeepLanguage =
    "Always answer in the same language as the input text. Never translate.";

constexpr const char* kStructured =
    "Turn the dictated text into a well-structured document. Use headings, bullet lists "
    "and numbered steps where the content calls for them, and short paragraphs otherwise. "
    "Fix grammar and punctuation. Do not add information that was not dictated. "
    "Return only the formatted document.";

constexpr const char* kCondensed =
    "Rewrite the dictated text as a short chat message. Remove filler words (um, uh, like, "
    "you know, so, basically) and repetitions, keep it terse and casual, and do not end the "
    "message with a period. Return only the message.";

} // namespace

std::string cleanup(FormattingStyle style, const std::string& custom,
                    std::span<const std::string> terms) {
    std::string prompt;
    switch (style) {
        case FormattingStyle::Standard:
            prompt = custom.empty() ? kDefaultCleanup : custom;
            break;
        case FormattingStyle::Structured:
            prompt = kStructured;
            break;
        case FormattingStyle::Condensed:
            prompt = kCondensed;
            break;
    }

    prompt += "\n";
    prompt += kKeepLanguage;

    if (!terms.empty()) {
        prompt += "\nThe speaker uses these terms, which speech recognition often mishears. "
                  "Replace misheard variants with the exact spelling: ";
        for (size_t i = 0; i < terms.size(); ++i) {
            if (i > 0) prompt += ", ";
            prompt += terms[i];
        }
        prompt += ".";
    }
    return prompt;
}

std::string ask() {
    return "You are a helpful voice assistant. The user speaks to you via voice, and you "
           "answer their questions.\n"
           "Answer concisely and helpfully. Use markdown formatting for better readability "
           "(bold, lists, tables, code blocks, etc.).\n"
           "Match the language of the user's message.";
}

std::string respond() {
    return "You write replies on behalf of the user. You are given the message they received "
           "(if any) and their spoken instructions on how to respond.\n"
           "Do not answer the instructions, do not analyze or comment on the message. "
           "Produce only the reply text, ready to be sent as is, in the language of the "
           "message being answered (or of the instructions if there is no message).";
}

std::string code(CodeLanguage lang) {
    std::string prompt = "You are a code generator. ";
    switch (lang) {
        case CodeLanguage::Auto:
            prompt += "Pick the most suitable programming language for the request. ";
            break;
        case CodeLanguage::Python:
            prompt += "Write Python 3. ";
            break;
        case CodeLanguage::Bash:
            prompt += "Write a Bash command or script. ";
            break;
    }
    prompt += "Output only the code: no explanations, no prose, no markdown code fences. "
              "Comments inside the code are allowed.";
    return prompt;
}

std::string process_text() {
    return "You process content on the user's command. You receive the content and a spoken "
           "command (translate, summarize, rewrite, extract, ...). Apply the command to the "
           "content and return only the result, without explanations.";
}

std::string process_image() {
    return "You process images on the user's command. Follow the spoken instruction about "
           "the attached image and return only the result, without explanations.";
}

std::string respond_message(const std::optional<std::string>& original,
                            const std::string& instruction) {
    std::string msg;
    if (original) {
        msg += "Message to respond to:\n";
        msg += *original;
        msg += "\n\n";
    }
    msg += "How to respond:\n";
    msg += instruction;
    return msg;
}

std::string code_message(const std::string& request) {
    return "generate code: " + request;
}

std::string process_message(const std::string& content, const std::string& command) {
    return "Content to process:\n" + content + "\n\nCommand:\n" + command;
}

} // namespace prompts
