#pragma once
#include "audio/pcm.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace audio {

// Where the stream comes from. Loopback/system capture is typically 10-20 dB
// quieter than a microphone and needs proportionally lower level thresholds.
enum class SourceType { Microphone, SystemAudio };

const char* to_string(SourceType type);
bool parse_source_type(const std::string& name, SourceType& out);

struct VadThresholds {
    float rms = 0.01f;
    float peak = 0.02f;
    float zcr = 0.1f;
    float assist_ratio = 0.5f;  // rms fraction that still counts as voice when zcr and peak agree
};

struct VadConfig {
    VadThresholds microphone;                  ///< Base thresholds (microphone)
    float system_audio_scale = 0.1f;           ///< rms/peak scale for SourceType::SystemAudio
    float system_audio_zcr = 0.05f;
    float system_audio_assist_ratio = 0.3f;
    double min_silence_duration_s = 0.5;       ///< Silence needed before VOICE_ENDED

    VadThresholds thresholds_for(SourceType source) const;
};

enum class VadEvent { None, VoiceStarted, VoiceEnded };

const char* to_string(VadEvent event);

// Event-driven voice activity detector.
//
// IDLE -> ACTIVE on the first voiced frame (VoiceStarted, once per utterance),
// ACTIVE -> IDLE once accumulated silence reaches min_silence_duration_s
// (VoiceEnded, once). Silence keeps accumulating while idle so has_silence()
// answers without a fresh transition.
class VoiceActivityDetector {
public:
    VoiceActivityDetector(const VadConfig& config, SourceType source, int sample_rate);

    VadEvent detect(const int16_t* samples, size_t count);

    // Level classification with the same rule, no state change.
    bool is_voiced(const FrameFeatures& f) const;
    bool is_voiced(const int16_t* samples, size_t count) const;

    bool has_silence() const { return silence_samples_ >= min_silence_samples_; }
    bool voice_active() const { return voice_started_; }
    double silence_duration() const { return static_cast<double>(silence_samples_) / sample_rate_; }
    const VadThresholds& thresholds() const { return thresholds_; }
    SourceType source() const { return source_; }

    void reset();

private:
    VadConfig config_;
    VadThresholds thresholds_;
    SourceType source_;
    int sample_rate_;

    size_t min_silence_samples_;

    bool voice_started_ = false;
    size_t silence_samples_ = 0;  // accumulated, in samples to avoid drift
};

} // namespace audio
