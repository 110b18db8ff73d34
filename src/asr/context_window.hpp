#pragma once
#include <cstddef>
#include <vector>

namespace asr {

// Trailing audio of previous chunks, prepended to each new chunk before
// inference so words are not cut at chunk boundaries. Context only helps
// recognition; emitted time ranges are computed from the new chunk alone.
class ContextWindow {
public:
    ContextWindow(double context_duration_s, int sample_rate);

    // Returns context ++ chunk, then keeps the tail of chunk (bounded to the window).
    std::vector<float> combine(const std::vector<float>& chunk);

    // Samples of context that the last combine() prepended.
    size_t last_prefix_samples() const { return last_prefix_; }
    size_t size() const { return context_.size(); }
    size_t max_samples() const { return max_samples_; }

    void clear();

private:
    size_t max_samples_;
    std::vector<float> context_;
    size_t last_prefix_ = 0;
};

} // namespace asr
