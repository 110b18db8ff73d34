#include "net/protocol.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace net {

namespace {

std::string trimmed(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ControlMessage from_keyword(const std::string& word) {
    const std::string w = lower(word);
    if (w == "eos" || w == "end" || w == "end_of_stream") return ControlMessage::EndOfStream;
    if (w == "pong") return ControlMessage::Pong;
    if (w == "ping") return ControlMessage::Ping;
    return ControlMessage::Unknown;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

bool valid_language(const std::string& code) {
    if (code.size() < 2 || code.size() > 8) return false;
    return std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isalpha(c) || c == '-'; });
}

} // namespace

ControlMessage parse_control(const std::string& text) {
    const std::string t = trimmed(text);
    if (t.empty()) return ControlMessage::Unknown;
    if (t.front() != '{') return from_keyword(t);

    const auto j = nlohmann::json::parse(t, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return ControlMessage::Unknown;
    const auto it = j.find("type");
    if (it == j.end() || !it->is_string()) return ControlMessage::Unknown;
    return from_keyword(it->get<std::string>());
}

const char* to_string(ControlMessage message) {
    switch (message) {
    case ControlMessage::EndOfStream: return "EOS";
    case ControlMessage::Pong: return "pong";
    case ControlMessage::Ping: return "ping";
    case ControlMessage::Unknown: return "unknown";
    }
    return "unknown";
}

std::string encode_result(const core::TranscriptionResult& result) {
    nlohmann::json j;
    j["text"] = result.text;
    j["isFinal"] = result.is_final;
    j["startTime"] = result.start_time;
    j["endTime"] = result.end_time;
    if (!result.segments.empty()) {
        nlohmann::json segs = nlohmann::json::array();
        for (const auto& s : result.segments) {
            segs.push_back({{"start", s.start}, {"end", s.end}});
        }
        j["segments"] = std::move(segs);
    }
    // Decoder output is not guaranteed to be valid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode_error(const std::string& error, const std::string& details) {
    nlohmann::json j;
    j["error"] = error;
    if (!details.empty()) j["details"] = details;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool parse_session_options(const std::string& target, SessionOptions& out, std::string& error) {
    const size_t q = target.find('?');
    out.path = target.substr(0, q);
    if (q == std::string::npos) return true;

    const std::string query = target.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        pos = amp + 1;
        if (pair.empty()) continue;

        const size_t eq = pair.find('=');
        const std::string key = url_decode(pair.substr(0, eq));
        const std::string value = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));

        if (key == "source") {
            audio::SourceType source;
            if (!audio::parse_source_type(lower(value), source)) {
                error = "unknown source type: " + value;
                return false;
            }
            out.source = source;
        } else if (key == "language" || key == "lang") {
            if (!valid_language(value)) {
                error = "invalid language: " + value;
                return false;
            }
            out.language = lower(value);
        }
        // other parameters are ignored
    }
    return true;
}

core::SessionConfig apply_options(const core::SessionConfig& defaults, const SessionOptions& options) {
    core::SessionConfig config = defaults;
    if (options.source) config.source = *options.source;
    if (options.language) config.language = *options.language;
    return config;
}

} // namespace net
