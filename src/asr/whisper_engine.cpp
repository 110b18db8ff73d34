#include "asr/whisper_engine.hpp"
#include "core/logging.hpp"
#include "whisper.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <string>
#include <thread>

namespace asr {

namespace {

std::atomic<bool> g_whisper_verbose{false};

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    if (!text) return;
    std::string msg(text);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
    if (msg.empty()) return;
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
        core::log_error("[whisper] " + msg);
        break;
    case GGML_LOG_LEVEL_WARN:
        core::log_warn("[whisper] " + msg);
        break;
    default:
        if (g_whisper_verbose.load()) core::log_debug("[whisper] " + msg);
        break;
    }
}

bool abort_cb(void* user_data) {
    const auto* flag = static_cast<const std::atomic<bool>*>(user_data);
    return flag && flag->load();
}

void trim(std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { x.clear(); return; }
    x = x.substr(a, b - a + 1);
}

// [BLANK_AUDIO], [ Silence ], (music) and the like
bool is_non_speech_marker(const std::string& s) {
    if (s.size() < 2) return false;
    return (s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')');
}

} // namespace

std::string resolve_model_path(const std::string& model_name) {
    std::string path = model_name;
    auto exists = [](const std::string& p){ return std::filesystem::exists(std::filesystem::u8path(p)); };
    const bool has_ext = (path.find(".gguf") != std::string::npos) || (path.find(".bin") != std::string::npos);
    if (has_ext) return path;

    const std::string candidates[] = {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
    for (const auto& c : candidates) {
        if (exists(c)) return c;
    }
    return candidates[0]; // fallback, load will report it
}

WhisperEngine::WhisperEngine(const WhisperOptions& opts)
    : opts_(opts), model_path_(resolve_model_path(opts.model)) {
    g_whisper_verbose.store(opts_.verbose);
    // Set logging before creating the context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = opts_.use_gpu;
    core::log_info("[whisper] init from: " + model_path_);
    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        throw EngineError("whisper init failed for model: " + model_path_);
    }
    if (opts_.verbose) {
        core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    }

    const int n_states = std::max(1, opts_.states);
    for (int i = 0; i < n_states; ++i) {
        whisper_state* st = whisper_init_state(ctx_);
        if (!st) {
            for (auto* s : states_) whisper_free_state(s);
            states_.clear();
            whisper_free(ctx_);
            ctx_ = nullptr;
            throw EngineError("whisper state allocation failed");
        }
        states_.push_back(st);
    }
    idle_ = states_;
    core::log_info("[whisper] init OK: " + model_path_ + " (states=" + std::to_string(n_states) + ")");
}

WhisperEngine::~WhisperEngine() {
    for (auto* s : states_) whisper_free_state(s);
    if (ctx_) whisper_free(ctx_);
}

whisper_state* WhisperEngine::acquire_state() {
    std::unique_lock<std::mutex> lock(pool_mutex_);
    pool_cv_.wait(lock, [this] { return !idle_.empty(); });
    whisper_state* st = idle_.back();
    idle_.pop_back();
    return st;
}

void WhisperEngine::release_state(whisper_state* state) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_.push_back(state);
    }
    pool_cv_.notify_one();
}

std::vector<EngineSegment> WhisperEngine::transcribe(const std::vector<float>& pcm,
                                                     const DecodeOptions& options) {
    std::vector<EngineSegment> out;
    if (pcm.empty()) return out;

    // Streaming chunk mode: greedy, no cross-chunk text conditioning
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = options.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = (opts_.threads <= 0)
        ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))
        : opts_.threads;
    wparams.no_context       = true;
    wparams.token_timestamps = false;
    wparams.greedy.best_of   = 1;
    wparams.suppress_blank   = true;
    if (!options.initial_prompt.empty()) {
        wparams.initial_prompt = options.initial_prompt.c_str();
    }
    if (options.low_energy_source) {
        // quieter loopback audio: accept lower-confidence speech
        wparams.no_speech_thold = 0.3f;
        wparams.logprob_thold   = -1.5f;
    }
    if (options.cancel) {
        wparams.abort_callback = abort_cb;
        wparams.abort_callback_user_data = const_cast<std::atomic<bool>*>(options.cancel);
    }

    whisper_state* st = acquire_state();
    const int ret = whisper_full_with_state(ctx_, st, wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (ret != 0) {
        release_state(st);
        if (options.cancel && options.cancel->load()) {
            throw EngineError("whisper decode aborted");
        }
        throw EngineError("whisper_full failed, ret=" + std::to_string(ret));
    }

    const int n = whisper_full_n_segments_from_state(st);
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(st, i);
        if (!txt) continue;
        std::string s(txt);
        trim(s);
        if (s.empty() || is_non_speech_marker(s)) continue;
        EngineSegment seg;
        seg.text = s;
        // whisper timestamps are in 10 ms units
        seg.start_s = whisper_full_get_segment_t0_from_state(st, i) * 0.01;
        seg.end_s = whisper_full_get_segment_t1_from_state(st, i) * 0.01;
        out.push_back(std::move(seg));
    }
    release_state(st);
    if (opts_.verbose) core::log_debug("[whisper] segments=" + std::to_string(out.size()));
    return out;
}

} // namespace asr
