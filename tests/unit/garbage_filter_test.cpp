#include <cassert>
#include "asr/garbage_filter.hpp"

int main() {
    asr::GarbageFilter f;

    assert(!f.is_garbage("hello world"));
    assert(!f.is_garbage("ab"));
    assert(!f.is_garbage(""));
    assert(!f.is_garbage("   "));
    assert(!f.is_garbage("heeello"));       // run of 3 is fine
    assert(!f.is_garbage("a    b c"));      // whitespace runs do not count
    assert(!f.is_garbage("the the the"));   // 3 repeated tokens is fine
    assert(!f.is_garbage("你好世界"));
    assert(!f.is_garbage("aaa"));           // three identical characters are too few to judge
    assert(!f.is_garbage("哈哈哈"));
    assert(!f.is_garbage("..."));

    assert(f.is_garbage("aaaa"));           // a single repeated character
    assert(f.is_garbage("哈哈哈哈"));
    assert(f.is_garbage("heeeello"));       // run of 4
    assert(f.is_garbage("!!!!"));
    assert(f.is_garbage("so so so so"));    // 4 identical tokens
    assert(f.is_garbage("认认认认认"));       // multi-byte characters
    assert(f.is_garbage("快 快 快 快"));

    asr::GarbageFilter::Options loose;
    loose.max_char_run = 5;
    loose.max_token_run = 5;
    asr::GarbageFilter lf(loose);
    assert(!lf.is_garbage("heeeello"));
    assert(lf.is_garbage("heeeeeello"));

    assert(asr::utf8_length("hello") == 5);
    assert(asr::utf8_length("你好") == 2);
    assert(asr::utf8_length("") == 0);
    return 0;
}
