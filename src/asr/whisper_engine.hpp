#pragma once
#include "asr/transcription_engine.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

namespace asr {

struct WhisperOptions {
    std::string model = "base.en";  // name (resolved under models/) or path
    bool use_gpu = false;
    int threads = 0;                // per inference, 0 = auto
    int states = 1;                 // concurrent decodes, match the worker pool size
    bool verbose = false;           // forward whisper/ggml info logs
};

// Resolve a model name to a file on disk, trying the usual GGUF/GGML names.
// Paths with an extension are returned unchanged.
std::string resolve_model_path(const std::string& model_name);

// whisper.cpp engine. One context (weights) shared by a small pool of decode
// states, so several sessions can decode concurrently without reloading.
class WhisperEngine : public TranscriptionEngine {
public:
    explicit WhisperEngine(const WhisperOptions& opts);  // throws EngineError
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::vector<EngineSegment> transcribe(const std::vector<float>& pcm,
                                          const DecodeOptions& options) override;
    std::string name() const override { return "whisper:" + model_path_; }

private:
    whisper_state* acquire_state();
    void release_state(whisper_state* state);

    WhisperOptions opts_;
    std::string model_path_;
    whisper_context* ctx_ = nullptr;

    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<whisper_state*> states_;  // all allocated
    std::vector<whisper_state*> idle_;
};

} // namespace asr
