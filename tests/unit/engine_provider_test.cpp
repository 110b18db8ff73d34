#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "asr/engine_provider.hpp"
#include "../support/test_support.hpp"

int main() {
    // Many concurrent callers, one load.
    {
        std::atomic<int> created{0};
        asr::EngineProvider provider([&created]() -> std::shared_ptr<asr::TranscriptionEngine> {
            ++created;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return std::make_shared<test::ScriptedEngine>("hi");
        });
        assert(!provider.ready());

        std::vector<std::shared_ptr<asr::TranscriptionEngine>> got(8);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < got.size(); ++i) {
            threads.emplace_back([&provider, &got, i] { got[i] = provider.get(); });
        }
        for (auto& t : threads) t.join();
        assert(created.load() == 1);
        assert(provider.ready());
        for (const auto& e : got) assert(e && e == got[0]);
        assert(got[0]->name() == "scripted");
    }

    // when_ready before and after the load finishes.
    {
        asr::EngineProvider provider([]() -> std::shared_ptr<asr::TranscriptionEngine> {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            return std::make_shared<test::ScriptedEngine>("hi");
        });
        std::atomic<int> early{0};
        provider.when_ready([&early](std::shared_ptr<asr::TranscriptionEngine> e, std::exception_ptr err) {
            if (e && !err) ++early;
        });
        auto engine = provider.get();
        assert(engine);
        // the waiter runs on the loader thread right after the load
        for (int i = 0; i < 100 && early.load() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(early.load() == 1);

        bool late = false;
        provider.when_ready([&late, &engine](std::shared_ptr<asr::TranscriptionEngine> e, std::exception_ptr err) {
            late = e == engine && !err;
        });
        assert(late);  // already loaded: called inline
    }

    // A failed load is sticky.
    {
        std::atomic<int> attempts{0};
        asr::EngineProvider provider([&attempts]() -> std::shared_ptr<asr::TranscriptionEngine> {
            ++attempts;
            throw asr::EngineError("model file missing");
        });
        provider.preload();
        for (int round = 0; round < 2; ++round) {
            bool threw = false;
            try {
                provider.get();
            } catch (const asr::EngineError& e) {
                threw = std::string(e.what()) == "model file missing";
            }
            assert(threw);
        }
        bool saw_error = false;
        provider.when_ready([&saw_error](std::shared_ptr<asr::TranscriptionEngine> e, std::exception_ptr err) {
            saw_error = !e && err;
        });
        assert(saw_error);
        assert(attempts.load() == 1);
    }

    // A factory returning null counts as a failure.
    {
        asr::EngineProvider provider([]() -> std::shared_ptr<asr::TranscriptionEngine> { return nullptr; });
        bool threw = false;
        try {
            provider.get();
        } catch (const asr::EngineError&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
