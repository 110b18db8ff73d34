#include "audio/wav_source.hpp"
#include "audio/pcm.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace audio {

namespace {

#pragma pack(push, 1)
struct ChunkHeader {
    char id[4];
    uint32_t size;
};

struct FmtChunk {
    uint16_t audioFormat; // 1=PCM, 3=float, 0xFFFE=extensible
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};
#pragma pack(pop)

template <typename T>
void put(std::ofstream& f, T v) {
    f.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

} // namespace

bool WavSource::open(const std::string& path, int target_rate, std::string& error) {
    samples_.clear();
    cursor_ = 0;
    sample_rate_ = source_rate_ = channels_ = bits_per_sample_ = 0;

    std::ifstream f(path, std::ios::binary);
    if (!f) { error = "cannot open " + path; return false; }

    char riff[12];
    if (!f.read(riff, sizeof(riff)) || std::strncmp(riff, "RIFF", 4) != 0 || std::strncmp(riff + 8, "WAVE", 4) != 0) {
        error = "not a RIFF/WAVE file: " + path;
        return false;
    }

    // Walk chunks: fmt must come before data, everything else is skipped.
    FmtChunk fmt{};
    bool have_fmt = false;
    std::vector<char> data;
    ChunkHeader ch{};
    while (f.read(reinterpret_cast<char*>(&ch), sizeof(ch))) {
        if (std::strncmp(ch.id, "fmt ", 4) == 0) {
            if (ch.size < sizeof(FmtChunk) || !f.read(reinterpret_cast<char*>(&fmt), sizeof(fmt))) {
                error = "truncated fmt chunk";
                return false;
            }
            f.seekg(ch.size - sizeof(FmtChunk) + (ch.size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::strncmp(ch.id, "data", 4) == 0) {
            data.resize(ch.size);
            f.read(data.data(), static_cast<std::streamsize>(data.size()));
            data.resize(static_cast<size_t>(f.gcount()));  // tolerate a short final chunk
            break;
        } else {
            f.seekg(ch.size + (ch.size & 1), std::ios::cur);
        }
    }
    if (!have_fmt) { error = "missing fmt chunk"; return false; }
    if (fmt.numChannels == 0 || fmt.sampleRate == 0) { error = "invalid fmt chunk"; return false; }

    channels_ = fmt.numChannels;
    bits_per_sample_ = fmt.bitsPerSample;
    source_rate_ = static_cast<int>(fmt.sampleRate);

    const bool pcm16 = (fmt.audioFormat == 1 || fmt.audioFormat == 0xFFFE) && fmt.bitsPerSample == 16;
    const bool f32 = (fmt.audioFormat == 3 || fmt.audioFormat == 0xFFFE) && fmt.bitsPerSample == 32;
    if (!pcm16 && !f32) {
        error = "unsupported WAV encoding (format " + std::to_string(fmt.audioFormat) + ", " +
                std::to_string(fmt.bitsPerSample) + " bit)";
        return false;
    }

    const size_t bytes_per_sample = fmt.bitsPerSample / 8;
    const size_t frames = data.size() / (bytes_per_sample * channels_);
    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        // downmix to mono by averaging channels
        float sum = 0.0f;
        for (int c = 0; c < channels_; ++c) {
            const char* p = data.data() + (i * channels_ + c) * bytes_per_sample;
            if (pcm16) {
                int16_t v;
                std::memcpy(&v, p, sizeof(v));
                sum += static_cast<float>(v) / 32768.0f;
            } else {
                float v;
                std::memcpy(&v, p, sizeof(v));
                sum += v;
            }
        }
        const float v = std::clamp(sum / static_cast<float>(channels_), -1.0f, 1.0f);
        mono[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
    }

    sample_rate_ = target_rate > 0 ? target_rate : source_rate_;
    samples_ = resample_linear(mono.data(), mono.size(), source_rate_, sample_rate_);
    return true;
}

std::vector<int16_t> WavSource::next_frame(int frame_ms) {
    std::vector<int16_t> out;
    if (sample_rate_ <= 0 || done()) return out;
    const size_t per_frame = std::max<size_t>(1, static_cast<size_t>(sample_rate_) * std::max(1, frame_ms) / 1000);
    const size_t n = std::min(per_frame, samples_.size() - cursor_);
    out.assign(samples_.begin() + cursor_, samples_.begin() + cursor_ + n);
    cursor_ += n;
    return out;
}

double WavSource::duration_seconds() const {
    return sample_rate_ > 0 ? static_cast<double>(samples_.size()) / sample_rate_ : 0.0;
}

bool write_wav(const std::string& path, const std::vector<int16_t>& samples, int sample_rate) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    f.write("RIFF", 4);
    put<uint32_t>(f, 36 + data_bytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put<uint32_t>(f, 16);
    put<uint16_t>(f, 1);
    put<uint16_t>(f, 1);
    put<uint32_t>(f, static_cast<uint32_t>(sample_rate));
    put<uint32_t>(f, static_cast<uint32_t>(sample_rate) * 2);
    put<uint16_t>(f, 2);
    put<uint16_t>(f, 16);
    f.write("data", 4);
    put<uint32_t>(f, data_bytes);
    std::string bytes;
    encode_pcm16le(samples.data(), samples.size(), bytes);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(f);
}

} // namespace audio
