#include "core/timestamp_tracker.hpp"

namespace core {

size_t TimestampTracker::advance(size_t processed_samples, size_t retained_overlap) {
    const size_t step = processed_samples > retained_overlap ? processed_samples - retained_overlap : 0;
    total_ += step;
    return step;
}

} // namespace core
