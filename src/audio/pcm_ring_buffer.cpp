#include "audio/pcm_ring_buffer.hpp"
#include "audio/pcm.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <string>

namespace audio {

PcmRingBuffer::AddResult PcmRingBuffer::add(const uint8_t* data, size_t size) {
    AddResult result;
    if (!data || size == 0) return result;
    if (size % 2 != 0) {
        core::log_warn("PCM frame not aligned, truncating last byte: " + std::to_string(size) +
                       " -> " + std::to_string(size - 1));
        result.truncated_byte = true;
        --size;
    }
    const auto samples = decode_pcm16le(data, size);
    result.samples_added = samples.size();
    result.samples_dropped = push(samples.data(), samples.size());
    return result;
}

size_t PcmRingBuffer::push(const int16_t* data, size_t n) {
    if (capacity_ == 0 || n == 0) return n;
    size_t dropped = 0;
    // Only the newest capacity_ samples of an oversized write can survive.
    if (n > capacity_) {
        dropped += n - capacity_;
        data += n - capacity_;
        n = capacity_;
    }
    const size_t free_space = capacity_ - size();
    if (n > free_space) {
        const size_t overwrite = n - free_space;
        tail_ += overwrite;
        dropped += overwrite;
    }
    for (size_t i = 0; i < n; ++i) {
        buffer_[(head_ + i) % capacity_] = data[i];
    }
    head_ += n;
    return dropped;
}

std::vector<int16_t> PcmRingBuffer::extract(size_t target_samples) const {
    const size_t n = std::min(target_samples, size());
    std::vector<int16_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = buffer_[(tail_ + i) % capacity_];
    }
    return out;
}

std::vector<int16_t> PcmRingBuffer::latest(size_t n) const {
    n = std::min(n, size());
    std::vector<int16_t> out(n);
    const size_t start = head_ - n;
    for (size_t i = 0; i < n; ++i) {
        out[i] = buffer_[(start + i) % capacity_];
    }
    return out;
}

size_t PcmRingBuffer::consume(size_t processed_samples, size_t overlap_samples) {
    const size_t remove = processed_samples > overlap_samples ? processed_samples - overlap_samples : 0;
    const size_t n = std::min(remove, size());
    tail_ += n;
    return n;
}

} // namespace audio
