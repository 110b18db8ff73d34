#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// Level features of a block of audio, computed on samples normalized to [-1, 1].
struct FrameFeatures {
    float rms = 0.0f;   // root mean square energy
    float peak = 0.0f;  // max |x|
    float zcr = 0.0f;   // sign changes per sample
};

// Decode little-endian PCM16. A trailing odd byte is ignored.
std::vector<int16_t> decode_pcm16le(const uint8_t* data, size_t size);

// Append samples as little-endian PCM16 bytes.
void encode_pcm16le(const int16_t* samples, size_t count, std::string& out);

// Convert int16 PCM to float [-1,1]
std::vector<float> to_float(const int16_t* samples, size_t count);

FrameFeatures compute_features(const float* samples, size_t count);
FrameFeatures compute_features(const int16_t* samples, size_t count);

// Linear interpolation resampler.
std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz);

} // namespace audio
