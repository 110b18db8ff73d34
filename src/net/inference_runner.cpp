#include "net/inference_runner.hpp"
#include "core/logging.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <utility>

namespace net {

namespace {

struct CallState {
    CallState(boost::asio::any_io_executor executor, InferenceRunner::Handler h)
        : ex(executor), timer(executor), handler(std::move(h)) {}

    boost::asio::any_io_executor ex;
    boost::asio::steady_timer timer;   // only touched on ex
    InferenceRunner::Handler handler;
    std::atomic<bool> done{false};     // first of (result, timeout) wins
    std::atomic<bool> cancel{false};   // seen by the engine's abort hook
};

} // namespace

InferenceRunner::InferenceRunner(size_t workers)
    : workers_(std::max<size_t>(1, workers)), pool_(workers_) {
    core::log_info("[inference] worker pool started, workers=" + std::to_string(workers_));
}

InferenceRunner::~InferenceRunner() {
    stop();
}

void InferenceRunner::stop() {
    pool_.stop();
    pool_.join();
}

void InferenceRunner::async_run(std::shared_ptr<asr::TranscriptionEngine> engine,
                                std::shared_ptr<const core::InferenceRequest> request,
                                boost::asio::any_io_executor ex,
                                Handler handler) {
    auto st = std::make_shared<CallState>(ex, std::move(handler));

    st->timer.expires_after(request->timeout);
    st->timer.async_wait([st](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (st->done.exchange(true)) return;
        st->cancel.store(true);
        asr::InferenceOutcome outcome;
        outcome.status = asr::InferenceOutcome::Status::TimedOut;
        st->handler(std::move(outcome));
    });

    boost::asio::post(pool_, [st, engine = std::move(engine), request = std::move(request)] {
        asr::InferenceOutcome outcome;
        const auto t0 = std::chrono::steady_clock::now();
        try {
            asr::DecodeOptions options = request->options;
            options.cancel = &st->cancel;
            outcome.segments = engine->transcribe(request->audio, options);
            outcome.status = asr::InferenceOutcome::Status::Ok;
        } catch (const std::exception& e) {
            outcome.status = asr::InferenceOutcome::Status::Failed;
            outcome.error = e.what();
        } catch (...) {
            outcome.status = asr::InferenceOutcome::Status::Failed;
            outcome.error = "unknown exception from engine";
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        if (st->done.exchange(true)) {
            core::log_debug("[inference] pass " + std::to_string(request->id) + " finished after timeout (" +
                            std::to_string(ms) + " ms), result dropped");
            return;
        }
        core::log_debug("[inference] pass " + std::to_string(request->id) + " " +
                        asr::to_string(outcome.status) + " in " + std::to_string(ms) + " ms");
        boost::asio::post(st->ex, [st, outcome = std::move(outcome)]() mutable {
            st->timer.cancel();
            st->handler(std::move(outcome));
        });
    });
}

} // namespace net
