#include "asr/engine_provider.hpp"
#include "core/logging.hpp"
#include <chrono>
#include <utility>

namespace asr {

EngineProvider::EngineProvider(Factory factory)
    : factory_(std::move(factory)) {}

EngineProvider::~EngineProvider() {
    if (loader_.valid()) loader_.wait();
}

void EngineProvider::preload() {
    std::call_once(once_, [this] {
        std::promise<std::shared_ptr<TranscriptionEngine>> promise;
        future_ = promise.get_future().share();
        loader_ = std::async(std::launch::async, [this, p = std::move(promise)]() mutable {
            const auto t0 = std::chrono::steady_clock::now();
            core::log_info("[engine] loading...");
            try {
                auto engine = factory_();
                if (!engine) throw EngineError("engine factory returned null");
                const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - t0).count();
                core::log_info("[engine] " + engine->name() + " ready in " + std::to_string(ms) + " ms");
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    engine_ = engine;
                    done_ = true;
                }
                p.set_value(engine);
            } catch (const std::exception& e) {
                core::log_error(std::string("[engine] load failed: ") + e.what());
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    error_ = std::current_exception();
                    done_ = true;
                }
                p.set_exception(std::current_exception());
            }
            std::vector<ReadyCallback> waiters;
            std::shared_ptr<TranscriptionEngine> engine;
            std::exception_ptr error;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                waiters.swap(waiters_);
                engine = engine_;
                error = error_;
            }
            for (auto& cb : waiters) cb(engine, error);
        });
    });
}

std::shared_ptr<TranscriptionEngine> EngineProvider::get() {
    preload();
    return future_.get();
}

bool EngineProvider::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

void EngineProvider::when_ready(ReadyCallback cb) {
    preload();
    std::shared_ptr<TranscriptionEngine> engine;
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!done_) {
            waiters_.push_back(std::move(cb));
            return;
        }
        engine = engine_;
        error = error_;
    }
    cb(engine, error);
}

} // namespace asr
