#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

// A WAV file in the temp directory owned by one session. The file is removed when the
// object is destroyed, whichever way the session ends.
class RecordedAudio {
public:
    RecordedAudio() = default;
    RecordedAudio(std::filesystem::path path, double duration_s);
    ~RecordedAudio();

    RecordedAudio(RecordedAudio&& other) noexcept;
    RecordedAudio& operator=(RecordedAudio&& other) noexcept;
    RecordedAudio(const RecordedAudio&) = delete;
    RecordedAudio& operator=(const RecordedAudio&) = delete;

    // Encodes samples into a fresh temp file.
    static std::expected<RecordedAudio, std::string>
        write_temp(std::span<const int16_t> samples, uint32_t sample_rate);

    const std::filesystem::path& path() const { return path_; }
    double duration_s() const { return duration_s_; }
    bool empty() const { return path_.empty(); }

private:
    void release();

    std::filesystem::path path_;
    double duration_s_ = 0.0;
};
