#pragma once

#include "recorded_audio.hpp"

#include <expected>
#include <optional>
#include <stop_token>
#include <string>

struct TranscriptResult {
    std::string text;
    double processing_s = 0.0; // wall time of the request
};

class TranscriptionClient {
public:
    virtual ~TranscriptionClient() = default;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const RecordedAudio& audio, const std::optional<std::string>& language,
                   std::stop_token stop) = 0;
};
