#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

// Bounded FIFO of int16 mono samples owned by a single session.
// When full, push() overwrites the oldest samples and reports how many were lost.
class PcmRingBuffer {
public:
    struct AddResult {
        size_t samples_added = 0;
        size_t samples_dropped = 0;  // oldest samples overwritten to make room
        bool truncated_byte = false; // odd-sized frame, trailing byte discarded
    };

    explicit PcmRingBuffer(size_t capacity)
        : buffer_(capacity), capacity_(capacity) {}

    size_t capacity() const { return capacity_; }
    size_t size() const { return head_ - tail_; }
    bool empty() const { return head_ == tail_; }

    // Append raw little-endian PCM16 bytes.
    AddResult add(const uint8_t* data, size_t size);

    // Push samples, returns the number of oldest samples dropped.
    size_t push(const int16_t* data, size_t n);

    // Copy up to target_samples from the head without removing them.
    std::vector<int16_t> extract(size_t target_samples) const;

    // Copy of the newest n samples (n clipped to size()).
    std::vector<int16_t> latest(size_t n) const;

    // Remove processed_samples - overlap_samples from the head so the last
    // overlap_samples of the processed range stay buffered. Returns removed count.
    size_t consume(size_t processed_samples, size_t overlap_samples);

    void clear() { head_ = tail_ = 0; }

private:
    std::vector<int16_t> buffer_;
    const size_t capacity_;
    size_t head_ = 0;  // total samples ever written
    size_t tail_ = 0;  // total samples ever removed
};

} // namespace audio
