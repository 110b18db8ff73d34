#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include "audio/wav_source.hpp"
#include "../support/test_support.hpp"

int main() {
    const std::string path = "wav_source_test.wav";
    const auto tone = test::tone(0.5, 16000);
    assert(audio::write_wav(path, tone, 16000));

    audio::WavSource src;
    std::string error;
    assert(src.open(path, 16000, error));
    assert(src.source_rate() == 16000);
    assert(src.channels() == 1);
    assert(src.bits_per_sample() == 16);
    assert(src.samples().size() == tone.size());
    for (size_t i = 0; i < tone.size(); ++i) {
        assert(std::abs(src.samples()[i] - tone[i]) <= 1);
    }

    // 0.5 s in 100 ms frames
    size_t frames = 0, total = 0;
    while (!src.done()) {
        const auto f = src.next_frame(100);
        assert(f.size() == 1600);
        total += f.size();
        ++frames;
    }
    assert(frames == 5 && total == tone.size());
    assert(src.next_frame(100).empty());
    src.rewind();
    assert(!src.done());

    // resampled on open
    audio::WavSource half;
    assert(half.open(path, 8000, error));
    assert(half.sample_rate() == 8000);
    assert(half.samples().size() == 4000);
    assert(half.duration_seconds() > 0.49 && half.duration_seconds() < 0.51);

    // not a WAV file
    {
        std::ofstream junk(path, std::ios::binary);
        junk << "definitely not riff data";
    }
    audio::WavSource bad;
    assert(!bad.open(path, 16000, error));
    assert(!error.empty());
    assert(!bad.open("does_not_exist.wav", 16000, error));

    std::remove(path.c_str());
    return 0;
}
