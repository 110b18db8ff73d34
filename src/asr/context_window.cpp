#include "asr/context_window.hpp"
#include <algorithm>
#include <cmath>

namespace asr {

ContextWindow::ContextWindow(double context_duration_s, int sample_rate)
    : max_samples_(static_cast<size_t>(std::llround(std::max(0.0, context_duration_s) * sample_rate))) {
    context_.reserve(max_samples_);
}

std::vector<float> ContextWindow::combine(const std::vector<float>& chunk) {
    std::vector<float> combined;
    combined.reserve(context_.size() + chunk.size());
    combined.insert(combined.end(), context_.begin(), context_.end());
    combined.insert(combined.end(), chunk.begin(), chunk.end());
    last_prefix_ = context_.size();

    const size_t keep = std::min(chunk.size(), max_samples_);
    context_.assign(chunk.end() - static_cast<std::ptrdiff_t>(keep), chunk.end());
    return combined;
}

void ContextWindow::clear() {
    context_.clear();
    last_prefix_ = 0;
}

} // namespace asr
