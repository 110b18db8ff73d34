#pragma once
#include <cstddef>
#include <cstdint>

namespace core {

// Maps sample offsets to session-relative seconds. The base only moves forward:
// by processed - retained after each pass, and by samples lost to overflow.
class TimestampTracker {
public:
    explicit TimestampTracker(int sample_rate) : sample_rate_(sample_rate) {}

    double start_time() const { return static_cast<double>(total_) / sample_rate_; }
    double end_time(size_t processed_samples) const {
        return static_cast<double>(total_ + processed_samples) / sample_rate_;
    }

    // Returns the number of samples the base moved.
    size_t advance(size_t processed_samples, size_t retained_overlap);
    void skip(size_t dropped_samples) { total_ += dropped_samples; }

    uint64_t total_processed_samples() const { return total_; }
    int sample_rate() const { return sample_rate_; }

private:
    int sample_rate_;
    uint64_t total_ = 0;
};

} // namespace core
