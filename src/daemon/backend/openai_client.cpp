#include "backend/openai_client.hpp"

#include "backend/openai_codec.hpp"

#include <chrono>
#include <curl/curl.h>
#include <fstream>
#include <iterator>
#include <memory>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using MimePtr = std::unique_ptr<curl_mime, MimeDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

void add_text_part(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::string transfer_error(CURLcode res) {
    if (res == CURLE_ABORTED_BY_CALLBACK) return "request cancelled";
    return std::string("curl error: ") + curl_easy_strerror(res);
}

} // namespace

OpenAIClient::OpenAIClient(Config::Backend backend, const CredentialStore& credentials)
    : backend_(std::move(backend)), credentials_(credentials) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAIClient::~OpenAIClient() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, std::string>
OpenAIClient::transcribe(const RecordedAudio& audio, const std::optional<std::string>& language,
                         std::stop_token stop) {
    auto key = credentials_.api_key();
    if (!key) return std::unexpected("no API key configured");

    std::ifstream f(audio.path(), std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot read recording " + audio.path().string());
    }
    std::string wav_data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    auto start = std::chrono::steady_clock::now();

    CurlPtr curl(curl_easy_init());
    if (!curl) return std::unexpected("curl_easy_init failed");

    MimePtr mime(curl_mime_init(curl.get()));

    auto* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "file");
    curl_mime_data(part, wav_data.data(), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    add_text_part(mime.get(), "model", backend_.transcription_model);
    add_text_part(mime.get(), "response_format", "json");
    // Without an explicit language the service auto-detects.
    if (language) {
        add_text_part(mime.get(), "language", *language);
    }

    std::string endpoint = backend_.url + "/audio/transcriptions";
    std::string auth = "Authorization: Bearer " + *key;
    SlistPtr headers(curl_slist_append(nullptr, auth.c_str()));

    std::string response_body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, backend_.timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) return std::unexpected(transfer_error(res));

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    auto end = std::chrono::steady_clock::now();

    auto text = openai::parse_transcription_response(status, response_body);
    if (!text) return std::unexpected(std::move(text.error()));

    return TranscriptResult{
        .text = std::move(*text),
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}

std::expected<std::string, std::string>
OpenAIClient::complete(const CompletionRequest& request, std::stop_token stop) {
    auto resp = post_json("/chat/completions", openai::chat_body(request).dump(), stop);
    if (!resp) return std::unexpected(std::move(resp.error()));
    return openai::parse_chat_response(resp->status, resp->body);
}

std::expected<std::string, std::string>
OpenAIClient::complete_with_image(const std::string& system, const std::string& user,
                                  std::span<const uint8_t> png, std::stop_token stop) {
    auto body = openai::vision_body(backend_.vision_model, system, user, png);
    auto resp = post_json("/chat/completions", body.dump(), stop);
    if (!resp) return std::unexpected(std::move(resp.error()));
    return openai::parse_chat_response(resp->status, resp->body);
}

std::expected<OpenAIClient::HttpResponse, std::string>
OpenAIClient::post_json(const std::string& path, const std::string& body, std::stop_token stop) {
    auto key = credentials_.api_key();
    if (!key) return std::unexpected("no API key configured");

    CurlPtr curl(curl_easy_init());
    if (!curl) return std::unexpected("curl_easy_init failed");

    std::string endpoint = backend_.url + path;
    std::string auth = "Authorization: Bearer " + *key;
    SlistPtr headers(curl_slist_append(nullptr, auth.c_str()));
    headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));

    HttpResponse resp;

    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, backend_.timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) return std::unexpected(transfer_error(res));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
