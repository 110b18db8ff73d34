#include "core/config.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace core {

namespace {

size_t seconds_to_samples(double seconds, int rate) {
    if (seconds <= 0.0) return 0;
    return static_cast<size_t>(std::llround(seconds * rate));
}

bool parse_double(const char* s, double& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_int(const char* s, long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return false;
    out = v;
    return true;
}

} // namespace

size_t SessionConfig::chunk_samples() const { return seconds_to_samples(chunk_duration_s, sample_rate); }
size_t SessionConfig::overlap_samples() const { return seconds_to_samples(overlap_duration_s, sample_rate); }
size_t SessionConfig::overflow_samples() const { return seconds_to_samples(overflow_duration_s, sample_rate); }

size_t SessionConfig::buffer_capacity() const {
    return seconds_to_samples(max_buffer_duration_s, sample_rate) + chunk_samples();
}

std::chrono::milliseconds SessionConfig::inference_timeout(size_t processed_samples) const {
    const double duration = static_cast<double>(processed_samples) / sample_rate;
    const double t = std::min(max_inference_timeout_s, std::max(min_inference_timeout_s, duration * 2.0 + 0.3));
    return std::chrono::milliseconds(static_cast<long long>(std::llround(t * 1000.0)));
}

bool SessionConfig::validate(std::string& error) const {
    if (sample_rate <= 0) { error = "sample rate must be positive"; return false; }
    if (chunk_duration_s <= 0.0) { error = "chunk duration must be positive"; return false; }
    if (overlap_duration_s < 0.0 || overlap_duration_s >= chunk_duration_s) {
        error = "overlap must be in [0, chunk duration)";
        return false;
    }
    if (context_duration_s < 0.0) { error = "context duration must not be negative"; return false; }
    if (min_samples == 0 || min_samples <= overlap_samples()) {
        error = "min samples must exceed the overlap";
        return false;
    }
    if (max_buffer_duration_s < overflow_duration_s) {
        error = "max buffer duration must be >= overflow duration";
        return false;
    }
    if (seconds_to_samples(overflow_duration_s, sample_rate) < min_samples) {
        error = "overflow threshold must be >= min samples";
        return false;
    }
    if (min_inference_timeout_s <= 0.0 || max_inference_timeout_s < min_inference_timeout_s) {
        error = "invalid inference timeout range";
        return false;
    }
    if (keepalive_interval_s <= 0.0 || keepalive_timeout_s < keepalive_interval_s) {
        error = "keepalive timeout must be >= interval";
        return false;
    }
    if (vad.min_silence_duration_s < 0.0) { error = "min silence must not be negative"; return false; }
    return true;
}

std::string usage(const char* argv0) {
    std::ostringstream os;
    os << "Usage: " << (argv0 ? argv0 : "live_transcribe_server") << " [options]\n"
       << "  --host <addr>               listen address (default 0.0.0.0)\n"
       << "  --port <n>                  listen port (default 8765)\n"
       << "  --io-threads <n>            network threads (default 2)\n"
       << "  --workers <n>               concurrent inferences (default 2)\n"
       << "  --model <name|path>         whisper model (default base.en)\n"
       << "  --threads <n>               whisper threads per inference (0 = auto)\n"
       << "  --gpu                       use GPU if whisper was built with it\n"
       << "  --no-preload                load the model on first connection\n"
       << "  --language <code>           decode language (default en)\n"
       << "  --initial-prompt <text>     decoder prompt for names and terms (default none)\n"
       << "  --source <mic|system>       default audio source type\n"
       << "  --sample-rate <hz>          PCM sample rate (default 16000)\n"
       << "  --chunk <s>                 chunk duration (default 0.6)\n"
       << "  --overlap <s>               overlap duration (default 0.2)\n"
       << "  --context <s>               context window (default 2.0)\n"
       << "  --min-samples <n>           minimum samples per pass (default 4800)\n"
       << "  --max-buffer <s>            buffer bound (default 10)\n"
       << "  --overflow <s>              forced pass threshold (default 3)\n"
       << "  --max-chunk <s>             utterance length forcing a final result (default 2.0)\n"
       << "  --vad-rms <x>               microphone RMS threshold (default 0.01)\n"
       << "  --vad-peak <x>              microphone peak threshold (default 0.02)\n"
       << "  --vad-zcr <x>               microphone zero-crossing threshold (default 0.1)\n"
       << "  --system-scale <x>          level threshold scale for system audio (default 0.1)\n"
       << "  --min-silence <s>           silence ending an utterance (default 0.5)\n"
       << "  --keepalive-interval <s>    ping interval (default 20)\n"
       << "  --keepalive-timeout <s>     pong timeout (default 60)\n"
       << "  -v, --verbose               debug logging\n"
       << "  -h, --help                  show this help\n";
    return os.str();
}

ParseResult parse_args(int argc, char** argv, ServerConfig& config, std::string& error) {
    SessionConfig& s = config.session;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") return ParseResult::Help;
        if (a == "-v" || a == "--verbose") { config.verbose = true; continue; }
        if (a == "--gpu") { config.use_gpu = true; continue; }
        if (a == "--no-preload") { config.preload = false; continue; }

        if (i + 1 >= argc) {
            error = "unknown option or missing value: " + a;
            return ParseResult::Error;
        }
        const char* v = argv[++i];
        double d = 0.0;
        long n = 0;
        bool ok = true;
        if (a == "--host") { config.host = v; }
        else if (a == "--model") { config.model = v; }
        else if (a == "--language") { s.language = v; }
        else if (a == "--initial-prompt") { s.initial_prompt = v; }
        else if (a == "--source") { ok = audio::parse_source_type(v, s.source); }
        else if (a == "--port") { ok = parse_int(v, n) && n > 0 && n < 65536; if (ok) config.port = static_cast<unsigned short>(n); }
        else if (a == "--io-threads") { ok = parse_int(v, n) && n > 0; if (ok) config.io_threads = static_cast<int>(n); }
        else if (a == "--workers") { ok = parse_int(v, n) && n > 0; if (ok) config.inference_workers = static_cast<int>(n); }
        else if (a == "--threads") { ok = parse_int(v, n) && n >= 0; if (ok) config.threads = static_cast<int>(n); }
        else if (a == "--sample-rate") { ok = parse_int(v, n) && n > 0; if (ok) s.sample_rate = static_cast<int>(n); }
        else if (a == "--min-samples") { ok = parse_int(v, n) && n > 0; if (ok) s.min_samples = static_cast<size_t>(n); }
        else if (a == "--chunk") { ok = parse_double(v, d); s.chunk_duration_s = d; }
        else if (a == "--overlap") { ok = parse_double(v, d); s.overlap_duration_s = d; }
        else if (a == "--context") { ok = parse_double(v, d); s.context_duration_s = d; }
        else if (a == "--max-buffer") { ok = parse_double(v, d); s.max_buffer_duration_s = d; }
        else if (a == "--overflow") { ok = parse_double(v, d); s.overflow_duration_s = d; }
        else if (a == "--max-chunk") { ok = parse_double(v, d); s.policy.max_chunk_duration_s = d; }
        else if (a == "--vad-rms") { ok = parse_double(v, d); s.vad.microphone.rms = static_cast<float>(d); }
        else if (a == "--vad-peak") { ok = parse_double(v, d); s.vad.microphone.peak = static_cast<float>(d); }
        else if (a == "--vad-zcr") { ok = parse_double(v, d); s.vad.microphone.zcr = static_cast<float>(d); }
        else if (a == "--system-scale") { ok = parse_double(v, d); s.vad.system_audio_scale = static_cast<float>(d); }
        else if (a == "--min-silence") { ok = parse_double(v, d); s.vad.min_silence_duration_s = d; }
        else if (a == "--keepalive-interval") { ok = parse_double(v, d); s.keepalive_interval_s = d; }
        else if (a == "--keepalive-timeout") { ok = parse_double(v, d); s.keepalive_timeout_s = d; }
        else {
            error = "unknown option: " + a;
            return ParseResult::Error;
        }
        if (!ok) {
            error = "invalid value for " + a + ": " + v;
            return ParseResult::Error;
        }
    }
    if (!s.validate(error)) return ParseResult::Error;
    return ParseResult::Ok;
}

std::string describe(const ServerConfig& config) {
    const SessionConfig& s = config.session;
    std::ostringstream os;
    os << "listen=" << config.host << ":" << config.port
       << " io_threads=" << config.io_threads
       << " workers=" << config.inference_workers
       << " model=" << config.model
       << " rate=" << s.sample_rate
       << " chunk=" << s.chunk_duration_s << "s"
       << " overlap=" << s.overlap_duration_s << "s"
       << " context=" << s.context_duration_s << "s"
       << " source=" << audio::to_string(s.source)
       << " language=" << s.language;
    return os.str();
}

} // namespace core
