#include <cassert>
#include <cstdint>
#include <vector>
#include "audio/pcm.hpp"
#include "audio/pcm_ring_buffer.hpp"

int main() {
    audio::PcmRingBuffer rb(8);
    std::vector<int16_t> in{1,2,3,4,5};
    size_t dropped = rb.push(in.data(), in.size());
    assert(dropped == 0);
    assert(rb.size() == 5);

    // extract does not remove
    auto head = rb.extract(3);
    assert((head == std::vector<int16_t>{1,2,3}));
    assert(rb.size() == 5);
    assert(rb.extract(100).size() == 5);

    // consume keeps the overlap tail of the processed range
    size_t removed = rb.consume(3, 1);
    assert(removed == 2);
    assert((rb.extract(3) == std::vector<int16_t>{3,4,5}));

    // overflow drops the oldest samples
    std::vector<int16_t> more{6,7,8,9,10,11,12};
    dropped = rb.push(more.data(), more.size());
    assert(dropped == 2);
    assert(rb.size() == rb.capacity());
    auto all = rb.extract(8);
    assert(all.front() == 5 && all.back() == 12);
    assert((rb.latest(2) == std::vector<int16_t>{11,12}));

    // a single write larger than the buffer keeps its newest samples
    std::vector<int16_t> big(20);
    for (size_t i = 0; i < big.size(); ++i) big[i] = static_cast<int16_t>(100 + i);
    dropped = rb.push(big.data(), big.size());
    assert(dropped == 8 + 12);
    assert(rb.extract(1).front() == 112);

    // consume never goes past what is buffered
    assert(rb.consume(50, 0) == 8);
    assert(rb.empty());

    // raw little-endian bytes, odd trailing byte dropped
    audio::PcmRingBuffer bytes_rb(16);
    const uint8_t raw[] = {0x01, 0x00, 0xFF, 0x7F, 0xFF, 0xFF, 0x05};
    auto res = bytes_rb.add(raw, sizeof(raw));
    assert(res.truncated_byte);
    assert(res.samples_added == 3);
    assert(res.samples_dropped == 0);
    assert((bytes_rb.extract(3) == std::vector<int16_t>{1, 32767, -1}));

    auto empty = bytes_rb.add(raw, 0);
    assert(empty.samples_added == 0 && !empty.truncated_byte);

    // codec helpers
    std::string enc;
    const int16_t s[] = {-32768, 0, 258};
    audio::encode_pcm16le(s, 3, enc);
    assert(enc.size() == 6);
    assert(static_cast<uint8_t>(enc[4]) == 0x02 && static_cast<uint8_t>(enc[5]) == 0x01);
    auto f = audio::to_float(s, 3);
    assert(f[0] == -1.0f && f[1] == 0.0f);

    auto up = audio::resample_linear(s, 3, 8000, 16000);
    assert(up.size() == 6);
    assert(up[0] == -32768);
    return 0;
}
