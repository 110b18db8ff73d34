#pragma once
// Shared helpers for the test executables: synthetic audio, a scripted
// engine and a manually advanced clock.
#include "asr/transcription_engine.hpp"
#include "audio/pcm.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace test {

constexpr double kPi = 3.14159265358979323846;

inline std::vector<int16_t> tone(double seconds, int rate = 16000, double freq = 440.0, double amplitude = 0.3) {
    const size_t n = static_cast<size_t>(std::llround(seconds * rate));
    std::vector<int16_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        const double v = amplitude * std::sin(2.0 * kPi * freq * static_cast<double>(i) / rate);
        out[i] = static_cast<int16_t>(std::lrint(v * 32767.0));
    }
    return out;
}

inline std::vector<int16_t> silence(double seconds, int rate = 16000) {
    return std::vector<int16_t>(static_cast<size_t>(std::llround(seconds * rate)), 0);
}

inline std::string to_bytes(const std::vector<int16_t>& samples) {
    std::string out;
    audio::encode_pcm16le(samples.data(), samples.size(), out);
    return out;
}

inline const uint8_t* data_of(const std::string& bytes) {
    return reinterpret_cast<const uint8_t*>(bytes.data());
}

struct ManualClock {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point() + std::chrono::hours(1);
    void advance(std::chrono::milliseconds d) { now += d; }
};

// Returns the same text for every call, optionally after a delay (cut short
// when the caller cancels) or by throwing.
class ScriptedEngine : public asr::TranscriptionEngine {
public:
    explicit ScriptedEngine(std::string text, std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                            bool fail = false)
        : text_(std::move(text)), delay_(delay), fail_(fail) {}

    std::vector<asr::EngineSegment> transcribe(const std::vector<float>& pcm,
                                               const asr::DecodeOptions& options) override {
        ++calls;
        const auto until = std::chrono::steady_clock::now() + delay_;
        while (std::chrono::steady_clock::now() < until) {
            if (options.cancel && options.cancel->load()) {
                cancelled = true;
                throw asr::EngineError("aborted");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (fail_) throw asr::EngineError("scripted failure");
        asr::EngineSegment seg;
        seg.text = text_;
        seg.start_s = 0.0;
        seg.end_s = static_cast<double>(pcm.size()) / 16000.0;
        return {seg};
    }

    std::string name() const override { return "scripted"; }

    std::atomic<int> calls{0};
    std::atomic<bool> cancelled{false};

private:
    std::string text_;
    std::chrono::milliseconds delay_;
    bool fail_;
};

} // namespace test
