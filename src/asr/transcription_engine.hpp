#pragma once
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace asr {

struct EngineSegment {
    std::string text;
    double start_s = 0.0;  // relative to the start of the audio passed in
    double end_s = 0.0;
};

struct DecodeOptions {
    std::string language = "en";
    bool low_energy_source = false;  // system/loopback capture: more permissive no-speech gate
    bool voice_ended = false;        // last chunk of an utterance
    std::string initial_prompt;      // vocabulary hint, empty = none
    const std::atomic<bool>* cancel = nullptr;  // set when the caller gave up waiting
};

// What came back from one time-bounded engine call.
struct InferenceOutcome {
    enum class Status { Ok, TimedOut, Failed };
    Status status = Status::Ok;
    std::vector<EngineSegment> segments;
    std::string error;
};

const char* to_string(InferenceOutcome::Status status);

// Raised when an engine cannot be created or a call fails irrecoverably.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Speech-to-text engine shared by all sessions. transcribe() may block for an
// unbounded time, so callers always run it with an external timeout.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    // pcm: mono float samples in [-1, 1] at the engine's sample rate.
    virtual std::vector<EngineSegment> transcribe(const std::vector<float>& pcm,
                                                  const DecodeOptions& options) = 0;

    virtual std::string name() const = 0;
};

} // namespace asr
