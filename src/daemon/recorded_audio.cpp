#include "recorded_audio.hpp"
#include "wav_encoder.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

RecordedAudio::RecordedAudio(fs::path path, double duration_s)
    : path_(std::move(path)), duration_s_(duration_s) {}

RecordedAudio::~RecordedAudio() {
    release();
}

RecordedAudio::RecordedAudio(RecordedAudio&& other) noexcept
    : path_(std::move(other.path_)), duration_s_(other.duration_s_) {
    other.path_.clear();
}

RecordedAudio& RecordedAudio::operator=(RecordedAudio&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        duration_s_ = other.duration_s_;
        other.path_.clear();
    }
    return *this;
}

std::expected<RecordedAudio, std::string>
RecordedAudio::write_temp(std::span<const int16_t> samples, uint32_t sample_rate) {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) return std::unexpected("temp dir: " + ec.message());

    std::string tmpl = (dir / "voxkey_recording_XXXXXX.wav").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), 4);
    if (fd < 0) {
        return std::unexpected(std::string("mkstemps() failed: ") + std::strerror(errno));
    }

    RecordedAudio audio(fs::path(buf.data()),
                        static_cast<double>(samples.size()) / sample_rate);

    auto wav_data = wav::encode(samples, sample_rate);
    size_t written = 0;
    while (written < wav_data.size()) {
        ssize_t n = ::write(fd, wav_data.data() + written, wav_data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return std::unexpected(std::string("write() failed: ") + std::strerror(err));
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);

    return audio;
}

void RecordedAudio::release() {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "audio: failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}
