#include <cassert>
#include <string>
#include <vector>
#include "core/config.hpp"

namespace {

core::ParseResult parse(std::vector<std::string> args, core::ServerConfig& cfg, std::string& error) {
    std::vector<char*> argv;
    static char prog[] = "live_transcribe_server";
    argv.push_back(prog);
    for (auto& a : args) argv.push_back(&a[0]);
    return core::parse_args(static_cast<int>(argv.size()), argv.data(), cfg, error);
}

} // namespace

int main() {
    {
        core::SessionConfig s;
        std::string error;
        assert(s.validate(error));
        assert(s.sample_rate == 16000);
        assert(s.chunk_samples() == 9600);
        assert(s.overlap_samples() == 3200);
        assert(s.overflow_samples() == 48000);
        assert(s.buffer_capacity() == 169600);
        assert(s.min_samples == 4800);

        // clamp(2 * duration + 0.3, 1, 2)
        assert(s.inference_timeout(1600).count() == 1000);
        assert(s.inference_timeout(9600).count() == 1500);
        assert(s.inference_timeout(32000).count() == 2000);
    }
    {
        core::SessionConfig s;
        std::string error;
        s.overlap_duration_s = 0.6;
        assert(!s.validate(error));
        assert(!error.empty());

        s = core::SessionConfig();
        s.keepalive_timeout_s = 10.0;
        assert(!s.validate(error));

        s = core::SessionConfig();
        s.max_buffer_duration_s = 2.0;
        assert(!s.validate(error));
    }
    {
        core::ServerConfig cfg;
        std::string error;
        auto r = parse({"--port", "9001", "--source", "system", "--chunk", "1.0", "--overlap", "0.25",
                        "--language", "de", "--workers", "4", "--no-preload", "-v",
                        "--initial-prompt", "Acme, Zyxel"},
                       cfg, error);
        assert(r == core::ParseResult::Ok);
        assert(cfg.port == 9001);
        assert(cfg.session.source == audio::SourceType::SystemAudio);
        assert(cfg.session.chunk_samples() == 16000);
        assert(cfg.session.overlap_samples() == 4000);
        assert(cfg.session.language == "de");
        assert(cfg.session.initial_prompt == "Acme, Zyxel");
        assert(core::SessionConfig().initial_prompt.empty());
        assert(cfg.inference_workers == 4);
        assert(!cfg.preload);
        assert(cfg.verbose);
        assert(core::describe(cfg).find("9001") != std::string::npos);
    }
    {
        core::ServerConfig cfg;
        std::string error;
        assert(parse({"--help"}, cfg, error) == core::ParseResult::Help);
        assert(parse({"--bogus", "1"}, cfg, error) == core::ParseResult::Error);
        assert(parse({"--port"}, cfg, error) == core::ParseResult::Error);
        assert(parse({"--port", "abc"}, cfg, error) == core::ParseResult::Error);
        assert(parse({"--source", "radio"}, cfg, error) == core::ParseResult::Error);

        core::ServerConfig bad;
        assert(parse({"--chunk", "0.2", "--overlap", "0.3"}, bad, error) == core::ParseResult::Error);
        assert(error.find("overlap") != std::string::npos);
    }
    assert(core::usage("srv").find("--keepalive-timeout") != std::string::npos);
    assert(core::usage("srv").find("--initial-prompt") != std::string::npos);
    return 0;
}
