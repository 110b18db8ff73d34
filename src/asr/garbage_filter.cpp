#include "asr/garbage_filter.hpp"
#include <cstdint>
#include <sstream>
#include <vector>

namespace asr {

namespace {

// Split into code points; each element holds the raw bytes of one character.
std::vector<std::string> split_code_points(const std::string& text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<uint8_t>(text[i]);
        size_t len = 1;
        if      ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) len = text.size() - i;
        out.emplace_back(text, i, len);
        i += len;
    }
    return out;
}

bool is_space(const std::string& c) {
    return c == " " || c == "\t" || c == "\n" || c == "\r";
}

// Longest run of equal items; items matching skip() never count.
template <typename T, typename Skip>
size_t longest_run(const std::vector<T>& items, Skip skip) {
    size_t best = 0, run = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        if (skip(items[i])) { run = 0; continue; }
        run = (run > 0 && items[i] == items[i - 1]) ? run + 1 : 1;
        if (run > best) best = run;
    }
    return best;
}

} // namespace

size_t utf8_length(const std::string& text) {
    size_t n = 0;
    for (char c : text) {
        if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool GarbageFilter::is_garbage(const std::string& text) const {
    const auto chars = split_code_points(text);
    std::vector<std::string> visible;
    for (const auto& c : chars) {
        if (!is_space(c)) visible.push_back(c);
    }
    // short repeats such as "..." or laughter are real output
    if (visible.size() <= 3) return false;

    bool all_same = true;
    for (const auto& c : visible) {
        if (c != visible.front()) { all_same = false; break; }
    }
    if (all_same) return true;

    if (longest_run(chars, is_space) > opts_.max_char_run) return true;

    std::istringstream ss(text);
    std::vector<std::string> tokens;
    std::string tok;
    while (ss >> tok) tokens.push_back(tok);
    return longest_run(tokens, [](const std::string&) { return false; }) > opts_.max_token_run;
}

} // namespace asr
