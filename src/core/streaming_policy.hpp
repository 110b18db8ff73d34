#pragma once
#include <cstddef>

namespace core {

struct StreamingDecision {
    bool should_commit = false;
    bool is_final = false;
};

/**
 * @brief Decides whether a transcription pass is emitted and whether it closes the utterance
 *
 * Rules in priority order:
 *   1. voice ended and any text             -> final
 *   2. silence, enough text, >= min chunk   -> final
 *   3. short utterance, any text, silence   -> final
 *   4. >= min chunk and enough text         -> partial (final once >= max chunk)
 *   5. otherwise                            -> no commit
 */
class StreamingPolicy {
public:
    struct Options {
        size_t min_text_length = 2;           ///< code points
        double min_chunk_duration_s = 0.3;
        double max_chunk_duration_s = 2.0;    ///< force a final result after this long
        double short_utterance_s = 1.0;
    };

    StreamingPolicy() = default;
    explicit StreamingPolicy(const Options& opts) : opts_(opts) {}

    /// @param duration_s Duration of the open utterance including this pass
    StreamingDecision decide(double duration_s, bool has_silence, size_t text_length,
                             bool voice_ended) const;

    const Options& options() const { return opts_; }

private:
    Options opts_;
};

} // namespace core
