#pragma once

#include "asr/context_window.hpp"
#include "asr/garbage_filter.hpp"
#include "asr/transcription_engine.hpp"
#include "audio/pcm_ring_buffer.hpp"
#include "audio/voice_activity_detector.hpp"
#include "core/config.hpp"
#include "core/keepalive.hpp"
#include "core/streaming_policy.hpp"
#include "core/timestamp_tracker.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Time range of one recognized segment, session-relative seconds
 */
struct ResultSegment {
    double start = 0.0;
    double end = 0.0;
};

/**
 * @brief A transcript emitted to the client
 */
struct TranscriptionResult {
    std::string text;
    bool is_final = false;
    double start_time = 0.0;            ///< Session-relative seconds
    double end_time = 0.0;              ///< Always >= start_time
    std::vector<ResultSegment> segments;
};

/**
 * @brief One unit of work for the transcription engine
 *
 * Produced by SessionController::try_process() / begin_flush(), executed off
 * the session (with timeout), and handed back through complete().
 */
struct InferenceRequest {
    uint64_t id = 0;
    std::vector<float> audio;           ///< context ++ chunk, normalized
    size_t chunk_samples = 0;           ///< samples of this pass (without context)
    double context_duration_s = 0.0;    ///< leading part of audio that is context
    double start_time = 0.0;
    double end_time = 0.0;
    double utterance_start = 0.0;
    bool voice_ended = false;
    bool silence_observed = false;
    bool flush = false;
    std::chrono::milliseconds timeout{1000};
    asr::DecodeOptions options;
};

enum class SessionState { Idle, Processing, Closed };

enum class CloseReason {
    EndOfStream,
    ClientDisconnect,
    ChannelStall,
    EngineUnavailable,
    TransportError,
    ServerShutdown
};

const char* to_string(SessionState state);
const char* to_string(CloseReason reason);

/**
 * @brief Counters reported when a session closes
 */
struct SessionStats {
    uint64_t frames = 0;
    uint64_t malformed_frames = 0;
    uint64_t passes = 0;               ///< Passes started (including skipped)
    uint64_t skipped_silent = 0;
    uint64_t superseded = 0;
    uint64_t timeouts = 0;
    uint64_t failures = 0;
    uint64_t garbage = 0;
    uint64_t discarded_late = 0;       ///< Results dropped to keep start times ordered
    uint64_t results = 0;
    uint64_t finals = 0;
    uint64_t dropped_samples = 0;      ///< Lost to buffer overflow
    uint64_t flushed_residual = 0;     ///< Samples dropped at EOS (below min)
};

/**
 * @brief Per-connection streaming state machine
 *
 * Owns the buffer, VAD, context window, commit policy and timestamp base of
 * one session. It never blocks and never talks to the engine itself: it
 * hands out InferenceRequest objects and consumes their outcomes, so the
 * transport decides where and how long inference runs.
 *
 * Not thread-safe. All calls for one session must be serialized (the
 * transport runs them on the session strand).
 *
 * States: Idle -> Processing -> Idle ..., terminal Closed.
 */
class SessionController {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit SessionController(const SessionConfig& config, NowFn now = nullptr);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Append one binary frame of PCM16LE audio and run VAD on it
     */
    void on_audio(const uint8_t* data, size_t size);

    /**
     * @brief Start a processing pass if one is due
     * @return Request to run, or nullopt if nothing to do (not enough audio,
     *         no trigger, pass in flight, or new audio was silent)
     */
    std::optional<InferenceRequest> try_process();

    /**
     * @brief Deliver the outcome of a request
     *
     * Results (if any) are queued for pop_result(). Outcomes arriving after
     * close() are ignored.
     */
    void complete(const InferenceRequest& request, const asr::InferenceOutcome& outcome);

    /**
     * @brief End of stream: next final pass over the residual buffered audio
     *
     * The residual is drained one chunk per call; the last pass also takes a
     * tail shorter than min_samples. Call again after each pass completes.
     * @return Next flush pass, or nullopt once the residual is exhausted
     *         (a first residual below min_samples is dropped)
     */
    std::optional<InferenceRequest> begin_flush();

    /**
     * @brief Terminal transition. Releases buffered audio and logs stats.
     */
    void close(CloseReason reason);

    std::optional<TranscriptionResult> pop_result();
    bool has_results() const { return !outbox_.empty(); }

    // Keepalive
    KeepaliveMonitor::Action on_keepalive_tick();
    void on_pong();

    SessionState state() const { return state_; }
    bool closed() const { return state_ == SessionState::Closed; }
    bool in_flight() const { return in_flight_id_ != 0; }
    size_t buffered_samples() const { return buffer_.size(); }
    size_t buffer_capacity() const { return buffer_.capacity(); }
    uint64_t total_processed_samples() const { return tracker_.total_processed_samples(); }
    const SessionStats& stats() const { return stats_; }
    const SessionConfig& config() const { return config_; }
    const audio::VoiceActivityDetector& vad() const { return vad_; }

private:
    enum class PassKind { Normal, Flush };

    std::optional<InferenceRequest> start_pass(PassKind kind, bool voice_ended, bool silence_observed);
    bool emit(TranscriptionResult result);  // false when it would break start-time order
    void promote_pending_partial();
    void finish_utterance();
    std::vector<ResultSegment> map_segments(const InferenceRequest& request,
                                            const std::vector<asr::EngineSegment>& segments) const;

    SessionConfig config_;
    NowFn now_;

    audio::PcmRingBuffer buffer_;
    audio::VoiceActivityDetector vad_;
    asr::ContextWindow context_;
    asr::GarbageFilter garbage_;
    StreamingPolicy policy_;
    TimestampTracker tracker_;
    KeepaliveMonitor keepalive_;

    SessionState state_ = SessionState::Idle;
    Clock::time_point session_start_;
    Clock::time_point last_process_time_;

    uint64_t next_id_ = 1;
    uint64_t in_flight_id_ = 0;        ///< 0 = none
    Clock::time_point in_flight_since_;

    size_t retained_ = 0;              ///< head samples already processed (overlap)
    bool voice_started_pending_ = false;
    bool voice_ended_pending_ = false;
    bool flushing_ = false;

    bool utterance_open_ = false;
    double utterance_start_ = 0.0;
    std::optional<TranscriptionResult> pending_partial_;

    double last_emitted_start_ = -1.0;
    std::deque<TranscriptionResult> outbox_;
    SessionStats stats_;
};

} // namespace core
