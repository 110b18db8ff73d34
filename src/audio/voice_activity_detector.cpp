#include "audio/voice_activity_detector.hpp"
#include "core/logging.hpp"
#include <cmath>
#include <sstream>

namespace audio {

const char* to_string(SourceType type) {
    switch (type) {
    case SourceType::Microphone: return "microphone";
    case SourceType::SystemAudio: return "system";
    }
    return "unknown";
}

bool parse_source_type(const std::string& name, SourceType& out) {
    if (name == "mic" || name == "microphone") {
        out = SourceType::Microphone;
        return true;
    }
    if (name == "system" || name == "system_audio" || name == "loopback") {
        out = SourceType::SystemAudio;
        return true;
    }
    return false;
}

const char* to_string(VadEvent event) {
    switch (event) {
    case VadEvent::None: return "NONE";
    case VadEvent::VoiceStarted: return "VOICE_STARTED";
    case VadEvent::VoiceEnded: return "VOICE_ENDED";
    }
    return "UNKNOWN";
}

VadThresholds VadConfig::thresholds_for(SourceType source) const {
    VadThresholds t = microphone;
    if (source == SourceType::SystemAudio) {
        t.rms *= system_audio_scale;
        t.peak *= system_audio_scale;
        t.zcr = system_audio_zcr;
        t.assist_ratio = system_audio_assist_ratio;
    }
    return t;
}

VoiceActivityDetector::VoiceActivityDetector(const VadConfig& config, SourceType source, int sample_rate)
    : config_(config)
    , thresholds_(config.thresholds_for(source))
    , source_(source)
    , sample_rate_(sample_rate > 0 ? sample_rate : 16000)
    , min_silence_samples_(static_cast<size_t>(std::llround(config.min_silence_duration_s * sample_rate_))) {
    std::ostringstream os;
    os << "VAD initialized: source=" << to_string(source_) << ", rms>" << thresholds_.rms
       << ", peak>" << thresholds_.peak << ", zcr>" << thresholds_.zcr
       << ", min_silence=" << config_.min_silence_duration_s << "s";
    core::log_debug(os.str());
}

bool VoiceActivityDetector::is_voiced(const FrameFeatures& f) const {
    if (f.rms > thresholds_.rms) return true;
    return f.rms > thresholds_.rms * thresholds_.assist_ratio
        && f.zcr > thresholds_.zcr
        && f.peak > thresholds_.peak;
}

bool VoiceActivityDetector::is_voiced(const int16_t* samples, size_t count) const {
    if (!samples || count == 0) return false;
    return is_voiced(compute_features(samples, count));
}

VadEvent VoiceActivityDetector::detect(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return VadEvent::None;

    if (is_voiced(samples, count)) {
        silence_samples_ = 0;
        if (!voice_started_) {
            voice_started_ = true;
            return VadEvent::VoiceStarted;
        }
        return VadEvent::None;
    }

    silence_samples_ += count;
    if (voice_started_ && has_silence()) {
        voice_started_ = false;
        return VadEvent::VoiceEnded;
    }
    return VadEvent::None;
}

void VoiceActivityDetector::reset() {
    voice_started_ = false;
    silence_samples_ = 0;
}

} // namespace audio
