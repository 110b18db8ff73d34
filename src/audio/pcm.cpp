#include "audio/pcm.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

std::vector<int16_t> decode_pcm16le(const uint8_t* data, size_t size) {
    std::vector<int16_t> out;
    if (!data) return out;
    const size_t n = size / 2;
    out.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const uint16_t lo = data[2 * i];
        const uint16_t hi = data[2 * i + 1];
        out[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return out;
}

void encode_pcm16le(const int16_t* samples, size_t count, std::string& out) {
    out.reserve(out.size() + count * 2);
    for (size_t i = 0; i < count; ++i) {
        const uint16_t v = static_cast<uint16_t>(samples[i]);
        out.push_back(static_cast<char>(v & 0xff));
        out.push_back(static_cast<char>((v >> 8) & 0xff));
    }
}

std::vector<float> to_float(const int16_t* samples, size_t count) {
    std::vector<float> out;
    out.reserve(count);
    constexpr float scale = 1.0f / 32768.0f;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(static_cast<float>(samples[i]) * scale);
    }
    return out;
}

FrameFeatures compute_features(const float* samples, size_t count) {
    FrameFeatures f;
    if (!samples || count == 0) return f;
    double sum2 = 0.0;
    float peak = 0.0f;
    size_t crossings = 0;
    for (size_t i = 0; i < count; ++i) {
        const float v = samples[i];
        sum2 += static_cast<double>(v) * v;
        peak = std::max(peak, std::fabs(v));
        if (i > 0 && ((v >= 0.0f) != (samples[i - 1] >= 0.0f))) {
            ++crossings;
        }
    }
    f.rms = static_cast<float>(std::sqrt(sum2 / static_cast<double>(count)));
    f.peak = peak;
    f.zcr = static_cast<float>(crossings) / static_cast<float>(count);
    return f;
}

FrameFeatures compute_features(const int16_t* samples, size_t count) {
    const auto pcm = to_float(samples, count);
    return compute_features(pcm.data(), pcm.size());
}

std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz) {
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0 || in_samples == 0) {
        return std::vector<int16_t>(in, in + in_samples);
    }
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in_samples * ratio));
    std::vector<int16_t> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in_samples - 1);
        size_t i1 = std::min(i0 + 1, in_samples - 1);
        double frac = src_pos - static_cast<double>(i0);
        double v = (1.0 - frac) * static_cast<double>(in[i0]) + frac * static_cast<double>(in[i1]);
        int vi = static_cast<int>(std::lrint(v));
        vi = std::clamp(vi, -32768, 32767);
        out[i] = static_cast<int16_t>(vi);
    }
    return out;
}

} // namespace audio
