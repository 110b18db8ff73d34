#include "core/streaming_policy.hpp"

namespace core {

StreamingDecision StreamingPolicy::decide(double duration_s, bool has_silence, size_t text_length,
                                          bool voice_ended) const {
    const bool enough_text = text_length >= opts_.min_text_length;

    if (voice_ended && text_length > 0) {
        return {true, true};
    }
    if (has_silence && enough_text && duration_s >= opts_.min_chunk_duration_s) {
        return {true, true};
    }
    if (duration_s < opts_.short_utterance_s && text_length > 0 && has_silence) {
        return {true, true};
    }
    if (duration_s >= opts_.min_chunk_duration_s && enough_text) {
        return {true, duration_s >= opts_.max_chunk_duration_s};
    }
    return {false, false};
}

} // namespace core
