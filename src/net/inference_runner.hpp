#pragma once
#include "asr/transcription_engine.hpp"
#include "core/session_controller.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <functional>
#include <memory>

namespace net {

// Runs engine calls on a bounded worker pool, away from the network threads,
// and races each call against a timer on the caller's executor. Whichever
// finishes first decides the outcome; on timeout the engine is asked to abort
// and its late answer is dropped.
class InferenceRunner {
public:
    using Handler = std::function<void(asr::InferenceOutcome)>;

    explicit InferenceRunner(size_t workers);
    ~InferenceRunner();

    InferenceRunner(const InferenceRunner&) = delete;
    InferenceRunner& operator=(const InferenceRunner&) = delete;

    // handler is always invoked exactly once, on ex, unless the runner is
    // stopped or ex's context stops running first.
    void async_run(std::shared_ptr<asr::TranscriptionEngine> engine,
                   std::shared_ptr<const core::InferenceRequest> request,
                   boost::asio::any_io_executor ex,
                   Handler handler);

    size_t workers() const { return workers_; }

    void stop();

private:
    size_t workers_;
    boost::asio::thread_pool pool_;
};

} // namespace net
