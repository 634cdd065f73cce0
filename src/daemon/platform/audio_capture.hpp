#pragma once

#include "recorded_audio.hpp"
#include "session_error.hpp"

#include <expected>
#include <optional>

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    // CaptureUnavailable when the device cannot be opened.
    virtual std::expected<void, SessionError> start() = 0;
    // Returns the recording, or nothing if no audio was captured.
    virtual std::optional<RecordedAudio> stop() = 0;
    virtual bool is_capturing() const = 0;
    // Most recent input level in [0, 1]; 0 when not capturing.
    virtual float level() const = 0;
};
