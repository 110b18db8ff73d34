#include <cassert>
#include <vector>
#include "asr/context_window.hpp"

int main() {
    // 1 s at 4 Hz: at most 4 samples of context
    asr::ContextWindow ctx(1.0, 4);
    assert(ctx.max_samples() == 4);

    auto a = ctx.combine({1, 2, 3});
    assert((a == std::vector<float>{1, 2, 3}));
    assert(ctx.last_prefix_samples() == 0);
    assert(ctx.size() == 3);

    auto b = ctx.combine({4, 5, 6, 7, 8});
    assert((b == std::vector<float>{1, 2, 3, 4, 5, 6, 7, 8}));
    assert(ctx.last_prefix_samples() == 3);
    assert(ctx.size() == 4);

    // context is the tail of the previous chunk only
    auto c = ctx.combine({9});
    assert((c == std::vector<float>{5, 6, 7, 8, 9}));
    assert(ctx.last_prefix_samples() == 4);
    assert(ctx.size() == 1);

    ctx.clear();
    auto d = ctx.combine({10, 11});
    assert((d == std::vector<float>{10, 11}));
    assert(ctx.last_prefix_samples() == 0);

    // zero-length window never prepends anything
    asr::ContextWindow none(0.0, 16000);
    none.combine({1, 2});
    assert(none.combine({3}).size() == 1);
    return 0;
}
