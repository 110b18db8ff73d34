#pragma once
#include "asr/garbage_filter.hpp"
#include "audio/voice_activity_detector.hpp"
#include "core/streaming_policy.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace core {

// Per-session tuning. Durations are in seconds.
struct SessionConfig {
    int sample_rate = 16000;
    double chunk_duration_s = 0.6;       ///< audio per inference pass
    double overlap_duration_s = 0.2;     ///< re-fed to the next pass
    double context_duration_s = 2.0;     ///< prepended for accuracy only
    size_t min_samples = 4800;           ///< minimum buffered audio before a pass (0.3 s)
    double max_buffer_duration_s = 10.0; ///< hard bound, oldest audio dropped beyond it
    double overflow_duration_s = 3.0;    ///< force a pass when buffered audio exceeds this
    double min_inference_timeout_s = 1.0;
    double max_inference_timeout_s = 2.0;
    double stuck_factor = 2.0;           ///< in-flight pass older than factor*chunk is superseded

    StreamingPolicy::Options policy;
    audio::VadConfig vad;
    audio::SourceType source = audio::SourceType::Microphone;
    asr::GarbageFilter::Options garbage;

    double keepalive_interval_s = 20.0;
    double keepalive_timeout_s = 60.0;
    std::string language = "en";
    std::string initial_prompt;          ///< decoder prompt, empty = none

    size_t chunk_samples() const;
    size_t overlap_samples() const;
    size_t overflow_samples() const;
    size_t buffer_capacity() const;   ///< max_buffer_duration * rate + one chunk

    // clamp(2 * duration + 0.3, min, max) for a pass of processed_samples
    std::chrono::milliseconds inference_timeout(size_t processed_samples) const;

    bool validate(std::string& error) const;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 8765;
    std::string path = "/api/voice/stream";
    int io_threads = 2;
    int inference_workers = 2;

    std::string model = "base.en";
    bool use_gpu = false;
    int threads = 0;        ///< whisper threads per inference, 0 = auto
    bool preload = true;    ///< load the model at startup instead of on first connection
    bool verbose = false;

    SessionConfig session;
};

enum class ParseResult { Ok, Help, Error };

// Fill config from command line flags. On Error, error names the bad flag.
ParseResult parse_args(int argc, char** argv, ServerConfig& config, std::string& error);

std::string usage(const char* argv0);

std::string describe(const ServerConfig& config);

} // namespace core
