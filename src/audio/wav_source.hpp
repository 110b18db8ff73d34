#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV file played back as a live stream: decoded to mono PCM16, resampled to
// the session rate, then handed out in fixed-duration frames.
class WavSource {
public:
    // Supports PCM16 and float32, any channel count. False (with error) otherwise.
    bool open(const std::string& path, int target_rate, std::string& error);

    // Next frame of frame_ms milliseconds (shorter at the end). Empty when done.
    std::vector<int16_t> next_frame(int frame_ms);

    bool done() const { return cursor_ >= samples_.size(); }
    void rewind() { cursor_ = 0; }

    int sample_rate() const { return sample_rate_; }
    int source_rate() const { return source_rate_; }
    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const;
    const std::vector<int16_t>& samples() const { return samples_; }

private:
    std::vector<int16_t> samples_;  // mono, at sample_rate_
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    int source_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
};

// Write mono PCM16 as a canonical 44-byte-header WAV file.
bool write_wav(const std::string& path, const std::vector<int16_t>& samples, int sample_rate);

} // namespace audio
