#pragma once
#include <cstddef>
#include <string>

namespace asr {

// Rejects typical decoder hallucinations on noise: long runs of one character
// ("aaaaaa", "!!!!") or the same token repeated over and over.
class GarbageFilter {
public:
    struct Options {
        size_t max_char_run = 3;   // a run longer than this is garbage
        size_t max_token_run = 3;  // same for whitespace-separated tokens
    };

    GarbageFilter() = default;
    explicit GarbageFilter(const Options& opts) : opts_(opts) {}

    bool is_garbage(const std::string& text) const;

private:
    Options opts_;
};

// Number of UTF-8 code points. Invalid lead bytes count as one each.
size_t utf8_length(const std::string& text);

} // namespace asr
