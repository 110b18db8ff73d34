#pragma once
#include "audio/voice_activity_detector.hpp"
#include "core/session_controller.hpp"
#include <optional>
#include <string>

namespace net {

// Client -> server text frames.
enum class ControlMessage { EndOfStream, Pong, Ping, Unknown };

// Accepts the plain forms ("EOS", "pong", "ping") and JSON objects with a
// "type" field ({"type":"EOS"}, {"type":"pong"}).
ControlMessage parse_control(const std::string& text);

const char* to_string(ControlMessage message);

// {"text":..., "isFinal":..., "startTime":..., "endTime":..., "segments":[{"start":..,"end":..}]}
// segments is omitted when empty.
std::string encode_result(const core::TranscriptionResult& result);

// {"error":..., "details":...}, details omitted when empty.
std::string encode_error(const std::string& error, const std::string& details = std::string());

// Per-connection overrides from the upgrade request target, e.g.
// "/api/voice/stream?source=system&language=de".
struct SessionOptions {
    std::string path;
    std::optional<audio::SourceType> source;
    std::optional<std::string> language;
};

// Returns false (with error set) for unknown source types or bad language codes.
bool parse_session_options(const std::string& target, SessionOptions& out, std::string& error);

// Apply the overrides on top of the server defaults.
core::SessionConfig apply_options(const core::SessionConfig& defaults, const SessionOptions& options);

} // namespace net
