#include "platform/linux/pipewire_capture.hpp"

#include "wav_encoder.hpp"

#include <pipewire/pipewire.h>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

struct PipeWireCapture::Hooks {
    static void process(void* userdata) {
        auto* self = static_cast<PipeWireCapture*>(userdata);

        auto* buf = pw_stream_dequeue_buffer(self->stream_);
        if (!buf) return;

        const spa_data& d = buf->buffer->datas[0];
        if (d.data && self->capturing_.load(std::memory_order_relaxed)) {
            auto* base = static_cast<const uint8_t*>(d.data) + d.chunk->offset;
            std::span<const int16_t> samples(reinterpret_cast<const int16_t*>(base),
                                             d.chunk->size / sizeof(int16_t));
            self->ring_.push(samples);
            self->level_.store(wav::rms_level(samples), std::memory_order_relaxed);
        }

        pw_stream_queue_buffer(self->stream_, buf);
    }

    static void state_changed(void* userdata, pw_stream_state old, pw_stream_state state,
                              const char* error) {
        if (state != PW_STREAM_STATE_ERROR) return;
        static_cast<PipeWireCapture*>(userdata)->stream_failed_.store(true, std::memory_order_relaxed);
        std::println(stderr, "audio: stream {} -> error: {}", pw_stream_state_as_string(old),
                     error ? error : "unknown");
    }

    static constexpr pw_stream_events events = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = state_changed,
        .process = process,
    };
};

PipeWireCapture::PipeWireCapture(size_t capacity_samples, uint32_t sample_rate)
    : ring_(capacity_samples), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    teardown();
    pw_deinit();
}

std::expected<void, SessionError> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    ring_.reset();
    level_.store(0.0f, std::memory_order_relaxed);
    stream_failed_.store(false, std::memory_order_relaxed);

    if (auto opened = open_stream(); !opened) {
        teardown();
        return opened;
    }

    // The loop thread starts delivering buffers immediately.
    capturing_.store(true, std::memory_order_release);
    if (int ret = pw_thread_loop_start(loop_); ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        capturing_.store(false, std::memory_order_release);
        teardown();
        return make_error(ErrorKind::CaptureUnavailable, "Audio thread failed to start");
    }

    return {};
}

std::expected<void, SessionError> PipeWireCapture::open_stream() {
    loop_ = pw_thread_loop_new("voxkey", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return make_error(ErrorKind::CaptureUnavailable, "Audio system unavailable");
    }

    auto* props = pw_properties_new(PW_KEY_MEDIA_TYPE, "Audio",
                                    PW_KEY_MEDIA_CATEGORY, "Capture",
                                    PW_KEY_MEDIA_ROLE, "Communication",
                                    PW_KEY_NODE_NAME, "voxkey",
                                    PW_KEY_APP_NAME, "voxkey",
                                    nullptr);

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), "voxkey-capture", props,
                                   &Hooks::events, this);
    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        return make_error(ErrorKind::CaptureUnavailable, "Could not open microphone stream");
    }

    uint8_t pod[1024];
    spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod, sizeof(pod));
    auto format = SPA_AUDIO_INFO_RAW_INIT(.format = SPA_AUDIO_FORMAT_S16_LE,
                                          .rate = sample_rate_,
                                          .channels = 1);
    const spa_pod* params[] = {
        spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &format),
    };

    auto flags = static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS |
                                              PW_STREAM_FLAG_RT_PROCESS);
    if (int ret = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY, flags, params, 1);
        ret < 0) {
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
        return make_error(ErrorKind::CaptureUnavailable,
                          std::string("Microphone unavailable: ") + spa_strerror(ret));
    }

    return {};
}

std::optional<RecordedAudio> PipeWireCapture::stop() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return std::nullopt;

    teardown();
    level_.store(0.0f, std::memory_order_relaxed);

    if (stream_failed_.load(std::memory_order_relaxed)) {
        std::println(stderr, "audio: stream failed during recording, keeping what arrived");
    }
    if (auto dropped = ring_.dropped(); dropped > 0) {
        std::println(stderr, "audio: buffer full, {} samples dropped", dropped);
    }

    auto samples = ring_.drain();
    if (samples.empty()) return std::nullopt;

    auto audio = RecordedAudio::write_temp(samples, sample_rate_);
    if (!audio) {
        std::println(stderr, "audio: {}", audio.error());
        return std::nullopt;
    }
    return std::move(*audio);
}

float PipeWireCapture::level() const {
    return capturing_.load(std::memory_order_relaxed) ? level_.load(std::memory_order_relaxed) : 0.0f;
}

void PipeWireCapture::teardown() {
    // The loop thread must be stopped before the stream it drives goes away.
    if (loop_) pw_thread_loop_stop(loop_);
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}
