#include <cassert>
#include "core/streaming_policy.hpp"

int main() {
    core::StreamingPolicy policy;  // min text 2, min chunk 0.3, max chunk 2.0, short 1.0

    // 1. voice ended: any text commits as final, even a single character
    auto d = policy.decide(0.1, false, 1, true);
    assert(d.should_commit && d.is_final);
    d = policy.decide(0.1, false, 0, true);
    assert(!d.should_commit);

    // 2. silence with enough text and a long enough chunk
    d = policy.decide(0.3, true, 2, false);
    assert(d.should_commit && d.is_final);

    // 3. short utterance followed by silence, one character is enough
    d = policy.decide(0.2, true, 3, false);
    assert(d.should_commit && d.is_final);
    d = policy.decide(0.5, true, 1, false);  // "好"
    assert(d.should_commit && d.is_final);
    d = policy.decide(0.5, true, 0, false);
    assert(!d.should_commit);

    // 4. ongoing speech: partial, final once the utterance is long enough
    d = policy.decide(0.6, false, 5, false);
    assert(d.should_commit && !d.is_final);
    d = policy.decide(1.99, false, 5, false);
    assert(d.should_commit && !d.is_final);
    d = policy.decide(2.0, false, 5, false);
    assert(d.should_commit && d.is_final);

    // 5. not enough text, or too short without silence
    d = policy.decide(1.0, false, 1, false);
    assert(!d.should_commit && !d.is_final);
    d = policy.decide(0.2, false, 10, false);
    assert(!d.should_commit);
    d = policy.decide(1.5, true, 1, false);  // past the short-utterance window
    assert(!d.should_commit);

    core::StreamingPolicy::Options opts;
    opts.min_text_length = 4;
    opts.max_chunk_duration_s = 1.0;
    core::StreamingPolicy strict(opts);
    assert(!strict.decide(0.5, false, 3, false).should_commit);
    d = strict.decide(1.2, false, 4, false);
    assert(d.should_commit && d.is_final);
    return 0;
}
