#pragma once
#include "asr/transcription_engine.hpp"
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace asr {

// Creates the shared engine exactly once, in the background, and hands the
// same instance to every session. A failed load is remembered: every later
// caller sees the same error instead of retrying.
class EngineProvider {
public:
    using Factory = std::function<std::shared_ptr<TranscriptionEngine>()>;
    using ReadyCallback = std::function<void(std::shared_ptr<TranscriptionEngine>, std::exception_ptr)>;

    explicit EngineProvider(Factory factory);
    ~EngineProvider();

    EngineProvider(const EngineProvider&) = delete;
    EngineProvider& operator=(const EngineProvider&) = delete;

    // Start loading on a background thread. Idempotent.
    void preload();

    // Blocks until loaded. Throws the load error if loading failed.
    std::shared_ptr<TranscriptionEngine> get();

    // Non-blocking: true once a load has finished (successfully or not).
    bool ready() const;

    // Runs cb once the engine is available (or failed), immediately when it
    // already is. cb runs on the loader thread otherwise, so keep it short.
    void when_ready(ReadyCallback cb);

private:
    void load();

    Factory factory_;
    std::once_flag once_;
    std::shared_future<std::shared_ptr<TranscriptionEngine>> future_;
    std::future<void> loader_;

    mutable std::mutex mutex_;
    bool done_ = false;
    std::shared_ptr<TranscriptionEngine> engine_;
    std::exception_ptr error_;
    std::vector<ReadyCallback> waiters_;
};

} // namespace asr
