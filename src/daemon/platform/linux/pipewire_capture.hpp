#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>

struct pw_thread_loop;
struct pw_stream;

// Mono S16 microphone capture on a PipeWire thread loop. The realtime callback only
// pushes into the ring and updates the level; everything else runs on the caller.
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(size_t capacity_samples, uint32_t sample_rate = 16000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, SessionError> start() override;
    std::optional<RecordedAudio> stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    float level() const override;

private:
    struct Hooks; // pw_stream_events, defined next to the callbacks

    std::expected<void, SessionError> open_stream();
    void teardown();

    SampleRing ring_;
    uint32_t sample_rate_;
    std::atomic<bool> capturing_{false};
    std::atomic<bool> stream_failed_{false};
    std::atomic<float> level_{0.0f};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;
};
