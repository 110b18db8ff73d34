// Copyright (c) 2025 VAM Desktop Live Whisper
// SessionController - per-connection streaming transcription state machine
//
// Processing model:
// =================
//
// Transport (session strand):
//   - on_audio() for every binary frame: buffer + VAD, never blocks
//   - try_process() right after; returns a pass when one is due:
//       * enough audio (>= min_samples) AND
//       * a VAD transition (voice started/ended), the silence level,
//         chunk_duration elapsed, or the buffer past the overflow threshold
//   - only a VOICE_ENDED pass is marked voice_ended; the silence level
//     reaches the commit policy as silence_observed
//   - the pass is run on the inference pool with a timeout, its outcome
//     comes back through complete()
//
// Each pass:
//   - takes up to one chunk from the head of the buffer
//   - advances buffer and timestamp base right away (processed - overlap),
//     whatever the inference outcome is, so memory stays bounded
//   - skips inference when the NEW audio (not the retained overlap) is silent
//   - prepends the context window before handing audio to the engine
//
// At end of stream the residual is flushed one chunk per pass, all final.
//
// Only one pass is in flight at a time. A pending trigger waits, unless the
// buffer overflows or the running pass looks stuck; then a new pass starts
// and the old one's result is kept only if it does not break start-time order.

#include "core/session_controller.hpp"
#include "audio/pcm.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace core {

namespace {

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

std::string join_segments(const std::vector<asr::EngineSegment>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        const size_t a = seg.text.find_first_not_of(" \t\r\n");
        if (a == std::string::npos) continue;
        const size_t b = seg.text.find_last_not_of(" \t\r\n");
        if (!out.empty()) out += ' ';
        out.append(seg.text, a, b - a + 1);
    }
    return out;
}

std::string preview(const std::string& text) {
    return text.size() > 50 ? text.substr(0, 50) + "..." : text;
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::Processing: return "processing";
    case SessionState::Closed: return "closed";
    }
    return "unknown";
}

const char* to_string(CloseReason reason) {
    switch (reason) {
    case CloseReason::EndOfStream: return "end of stream";
    case CloseReason::ClientDisconnect: return "client disconnect";
    case CloseReason::ChannelStall: return "channel stall";
    case CloseReason::EngineUnavailable: return "engine unavailable";
    case CloseReason::TransportError: return "transport error";
    case CloseReason::ServerShutdown: return "server shutdown";
    }
    return "unknown";
}

SessionController::SessionController(const SessionConfig& config, NowFn now)
    : config_(config)
    , now_(now ? std::move(now) : NowFn([] { return Clock::now(); }))
    , buffer_(config.buffer_capacity())
    , vad_(config.vad, config.source, config.sample_rate)
    , context_(config.context_duration_s, config.sample_rate)
    , garbage_(config.garbage)
    , policy_(config.policy)
    , tracker_(config.sample_rate)
    , keepalive_(to_ms(config.keepalive_interval_s), to_ms(config.keepalive_timeout_s), now_()) {
    session_start_ = now_();
    last_process_time_ = session_start_;
    std::ostringstream os;
    os << "[session] created: rate=" << config_.sample_rate
       << " chunk=" << config_.chunk_samples() << " overlap=" << config_.overlap_samples()
       << " min=" << config_.min_samples << " capacity=" << buffer_.capacity()
       << " source=" << audio::to_string(config_.source);
    log_debug(os.str());
}

SessionController::~SessionController() = default;

void SessionController::on_audio(const uint8_t* data, size_t size) {
    if (closed()) return;
    ++stats_.frames;

    const auto added = buffer_.add(data, size);
    if (added.truncated_byte) ++stats_.malformed_frames;
    if (added.samples_dropped > 0) {
        // Keep the timestamp base aligned with the (new) head of the buffer.
        tracker_.skip(added.samples_dropped);
        retained_ = retained_ > added.samples_dropped ? retained_ - added.samples_dropped : 0;
        stats_.dropped_samples += added.samples_dropped;
        log_warn("[session] buffer full, dropped " + std::to_string(added.samples_dropped) +
                 " oldest samples");
    }
    if (added.samples_added == 0) return;

    const auto fresh = buffer_.latest(added.samples_added);
    switch (vad_.detect(fresh.data(), fresh.size())) {
    case audio::VadEvent::VoiceStarted:
        voice_started_pending_ = true;
        log_debug("[vad] VOICE_STARTED at " + std::to_string(tracker_.end_time(buffer_.size())) + "s");
        break;
    case audio::VadEvent::VoiceEnded:
        voice_ended_pending_ = true;
        log_debug("[vad] VOICE_ENDED at " + std::to_string(tracker_.end_time(buffer_.size())) + "s");
        break;
    case audio::VadEvent::None:
        break;
    }
}

std::optional<InferenceRequest> SessionController::try_process() {
    if (closed()) return std::nullopt;

    const size_t buffered = buffer_.size();
    if (buffered < config_.min_samples) return std::nullopt;

    const auto now = now_();
    const std::chrono::duration<double> elapsed = now - last_process_time_;
    const bool overflow = buffered > config_.overflow_samples();
    const bool silence = vad_.has_silence();
    const bool transition = voice_started_pending_ || voice_ended_pending_;
    const bool time_due = elapsed.count() >= config_.chunk_duration_s;

    if (!(transition || silence || time_due || overflow)) return std::nullopt;

    const bool superseding = in_flight();
    if (superseding) {
        const std::chrono::duration<double> running = now - in_flight_since_;
        const bool stuck = running.count() > config_.stuck_factor * config_.chunk_duration_s;
        if (!overflow && !stuck) {
            return std::nullopt;  // deferred, trigger stays pending
        }
        std::ostringstream os;
        os << std::fixed << std::setprecision(2)
           << "[session] " << (overflow ? "buffer overflow" : "pass looks stuck")
           << ", superseding pass " << in_flight_id_ << " (running " << running.count() << "s, buffered "
           << static_cast<double>(buffered) / config_.sample_rate << "s)";
        log_warn(os.str());
    } else if (overflow) {
        log_warn("[session] buffer overflow protection: " + std::to_string(buffered) + " samples buffered");
    }

    const char* reason = voice_ended_pending_ ? "voice ended"
                       : voice_started_pending_ ? "voice started"
                       : overflow ? "overflow"
                       : silence ? "silence"
                       : "time";
    const bool voice_ended = voice_ended_pending_;
    voice_started_pending_ = false;
    voice_ended_pending_ = false;

    log_debug(std::string("[session] pass due: ") + reason + ", buffered=" + std::to_string(buffered));
    auto request = start_pass(PassKind::Normal, voice_ended, silence || voice_ended);
    if (request && superseding) ++stats_.superseded;
    return request;
}

std::optional<InferenceRequest> SessionController::begin_flush() {
    if (closed()) return std::nullopt;
    voice_started_pending_ = false;
    voice_ended_pending_ = false;

    if (!flushing_) {
        flushing_ = true;
        const size_t buffered = buffer_.size();
        if (buffered < config_.min_samples) {
            if (buffered > 0) {
                log_debug("[session] EOS: dropping " + std::to_string(buffered) +
                          " residual samples (below minimum " + std::to_string(config_.min_samples) + ")");
            }
            stats_.flushed_residual += buffered;
            tracker_.skip(buffered);
            buffer_.clear();
            retained_ = 0;
        } else {
            log_debug("[session] EOS: flushing " + std::to_string(buffered) + " residual samples");
        }
    }

    // One chunk per call; silent chunks are skipped without a request.
    while (!buffer_.empty()) {
        if (auto request = start_pass(PassKind::Flush, true, true)) return request;
    }
    promote_pending_partial();
    finish_utterance();
    return std::nullopt;
}

std::optional<InferenceRequest> SessionController::start_pass(PassKind kind, bool voice_ended,
                                                              bool silence_observed) {
    const bool flush = kind == PassKind::Flush;
    const auto now = now_();

    const size_t buffered = buffer_.size();
    // A flush pass takes the whole rest once it is shorter than chunk + min,
    // so no tail below min_samples is left behind.
    const size_t chunk = config_.chunk_samples();
    const size_t target = flush && buffered < chunk + config_.min_samples ? buffered
                                                                          : std::min(chunk, buffered);
    const auto samples = buffer_.extract(target);
    const size_t processed = samples.size();
    const size_t already_seen = std::min(retained_, processed);

    const double start = tracker_.start_time();
    const double end = tracker_.end_time(processed);

    // Advance before inference: the outcome never decides how much is consumed.
    const size_t keep = flush ? 0 : std::min(config_.overlap_samples(), processed);
    buffer_.consume(processed, keep);
    tracker_.advance(processed, keep);
    retained_ = keep;
    last_process_time_ = now;
    ++stats_.passes;

    if (!vad_.is_voiced(samples.data() + already_seen, processed - already_seen)) {
        ++stats_.skipped_silent;
        std::ostringstream os;
        os << std::fixed << std::setprecision(2)
           << "[session] skip silent audio " << start << "s - " << end << "s";
        log_debug(os.str());
        if (voice_ended || silence_observed || flush) {
            promote_pending_partial();
            finish_utterance();
        }
        return std::nullopt;
    }

    if (!utterance_open_) {
        utterance_open_ = true;
        utterance_start_ = start;
    }

    InferenceRequest req;
    req.id = next_id_++;
    req.audio = context_.combine(audio::to_float(samples.data(), processed));
    req.chunk_samples = processed;
    req.context_duration_s = static_cast<double>(context_.last_prefix_samples()) / config_.sample_rate;
    req.start_time = start;
    req.end_time = end;
    req.utterance_start = utterance_start_;
    req.voice_ended = voice_ended || flush;
    req.silence_observed = silence_observed || flush;
    req.flush = flush;
    req.timeout = config_.inference_timeout(processed);
    req.options.language = config_.language;
    req.options.initial_prompt = config_.initial_prompt;
    req.options.low_energy_source = config_.source == audio::SourceType::SystemAudio;
    req.options.voice_ended = req.voice_ended;

    in_flight_id_ = req.id;
    in_flight_since_ = now;
    state_ = SessionState::Processing;

    std::ostringstream os;
    os << std::fixed << std::setprecision(2)
       << "[session] pass " << req.id << (flush ? " (flush)" : "") << ": " << start << "s - " << end
       << "s, context=" << req.context_duration_s << "s, timeout=" << req.timeout.count() << "ms";
    log_debug(os.str());
    return req;
}

void SessionController::complete(const InferenceRequest& request, const asr::InferenceOutcome& outcome) {
    if (closed()) {
        log_debug("[session] pass " + std::to_string(request.id) + " finished after close, discarded");
        return;
    }
    if (request.id == in_flight_id_) {
        in_flight_id_ = 0;
        state_ = SessionState::Idle;
    }

    auto no_result = [&] {
        if (request.voice_ended) {
            promote_pending_partial();
            finish_utterance();
        }
    };

    if (outcome.status == asr::InferenceOutcome::Status::TimedOut) {
        ++stats_.timeouts;
        std::ostringstream os;
        os << std::fixed << std::setprecision(2)
           << "[session] inference timeout (>" << request.timeout.count() << "ms) for "
           << request.start_time << "s - " << request.end_time << "s, no result this cycle";
        log_warn(os.str());
        no_result();
        return;
    }
    if (outcome.status == asr::InferenceOutcome::Status::Failed) {
        ++stats_.failures;
        log_error("[session] inference failed for pass " + std::to_string(request.id) + ": " + outcome.error);
        no_result();
        return;
    }

    const std::string text = join_segments(outcome.segments);
    if (text.empty()) {
        no_result();
        return;
    }
    if (garbage_.is_garbage(text)) {
        ++stats_.garbage;
        log_warn("[session] repeated-token output dropped: " + preview(text));
        no_result();
        return;
    }

    const double duration = request.end_time - request.utterance_start;
    const auto decision = policy_.decide(duration, request.silence_observed, asr::utf8_length(text),
                                         request.voice_ended);
    if (!decision.should_commit) {
        log_debug("[session] not committed (text too short): " + preview(text));
        no_result();
        return;
    }

    TranscriptionResult result;
    result.text = text;
    result.is_final = decision.is_final || request.flush;
    result.start_time = std::max(0.0, request.start_time);
    result.end_time = std::max(result.start_time, request.end_time);
    result.segments = map_segments(request, outcome.segments);

    if (result.is_final) {
        emit(std::move(result));
        finish_utterance();
        return;
    }
    if (emit(result)) {
        pending_partial_ = std::move(result);
        if (!utterance_open_) {
            utterance_open_ = true;
            utterance_start_ = request.utterance_start;
        }
    }
}

std::vector<ResultSegment> SessionController::map_segments(
    const InferenceRequest& request, const std::vector<asr::EngineSegment>& segments) const {
    std::vector<ResultSegment> out;
    for (const auto& seg : segments) {
        // Entirely inside the context prefix: belongs to earlier audio.
        if (seg.end_s <= request.context_duration_s && request.context_duration_s > 0.0) continue;
        ResultSegment r;
        r.start = request.start_time + std::max(0.0, seg.start_s - request.context_duration_s);
        r.end = request.start_time + std::max(0.0, seg.end_s - request.context_duration_s);
        r.start = std::min(std::max(r.start, request.start_time), request.end_time);
        r.end = std::min(std::max(r.end, r.start), request.end_time);
        out.push_back(r);
    }
    return out;
}

bool SessionController::emit(TranscriptionResult result) {
    if (result.start_time < last_emitted_start_) {
        ++stats_.discarded_late;
        log_debug("[session] out-of-order result discarded: " + preview(result.text));
        return false;
    }
    last_emitted_start_ = result.start_time;
    ++stats_.results;
    if (result.is_final) ++stats_.finals;

    std::ostringstream os;
    os << std::fixed << std::setprecision(2)
       << "[session] " << (result.is_final ? "final" : "partial") << " [" << result.start_time << "s - "
       << result.end_time << "s] " << preview(result.text);
    log_info(os.str());
    outbox_.push_back(std::move(result));
    return true;
}

void SessionController::promote_pending_partial() {
    if (!pending_partial_) return;
    TranscriptionResult r = std::move(*pending_partial_);
    pending_partial_.reset();
    r.is_final = true;
    emit(std::move(r));
}

void SessionController::finish_utterance() {
    utterance_open_ = false;
    pending_partial_.reset();
}

std::optional<TranscriptionResult> SessionController::pop_result() {
    if (outbox_.empty()) return std::nullopt;
    TranscriptionResult r = std::move(outbox_.front());
    outbox_.pop_front();
    return r;
}

KeepaliveMonitor::Action SessionController::on_keepalive_tick() {
    if (closed()) return KeepaliveMonitor::Action::None;
    const auto action = keepalive_.tick(now_());
    if (action == KeepaliveMonitor::Action::Expire) {
        const std::chrono::duration<double> silent = now_() - keepalive_.last_pong();
        std::ostringstream os;
        os << std::fixed << std::setprecision(1) << "[session] no pong for " << silent.count()
           << "s, treating connection as dead";
        log_warn(os.str());
    }
    return action;
}

void SessionController::on_pong() {
    keepalive_.on_pong(now_());
}

void SessionController::close(CloseReason reason) {
    if (closed()) return;
    state_ = SessionState::Closed;
    in_flight_id_ = 0;
    buffer_.clear();
    context_.clear();
    pending_partial_.reset();
    utterance_open_ = false;

    const std::chrono::duration<double> lifetime = now_() - session_start_;
    std::ostringstream os;
    os << std::fixed << std::setprecision(2)
       << "[session] closed (" << to_string(reason) << ") after " << lifetime.count() << "s"
       << ": frames=" << stats_.frames << " passes=" << stats_.passes
       << " results=" << stats_.results << " finals=" << stats_.finals
       << " skipped=" << stats_.skipped_silent << " timeouts=" << stats_.timeouts
       << " failures=" << stats_.failures << " garbage=" << stats_.garbage
       << " superseded=" << stats_.superseded << " dropped_samples=" << stats_.dropped_samples
       << " malformed=" << stats_.malformed_frames
       << " audio=" << static_cast<double>(tracker_.total_processed_samples()) / config_.sample_rate << "s";
    log_info(os.str());
}

} // namespace core
