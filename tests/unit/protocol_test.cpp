#include <cassert>
#include <nlohmann/json.hpp>
#include "net/protocol.hpp"

using net::ControlMessage;

int main() {
    // control frames
    assert(net::parse_control("EOS") == ControlMessage::EndOfStream);
    assert(net::parse_control(" eos\n") == ControlMessage::EndOfStream);
    assert(net::parse_control("{\"type\":\"EOS\"}") == ControlMessage::EndOfStream);
    assert(net::parse_control("{\"type\":\"end_of_stream\"}") == ControlMessage::EndOfStream);
    assert(net::parse_control("pong") == ControlMessage::Pong);
    assert(net::parse_control("{\"type\":\"pong\"}") == ControlMessage::Pong);
    assert(net::parse_control("ping") == ControlMessage::Ping);
    assert(net::parse_control("") == ControlMessage::Unknown);
    assert(net::parse_control("hello") == ControlMessage::Unknown);
    assert(net::parse_control("{not json") == ControlMessage::Unknown);
    assert(net::parse_control("{\"type\":5}") == ControlMessage::Unknown);

    // result frame
    {
        core::TranscriptionResult r;
        r.text = "hello world";
        r.is_final = true;
        r.start_time = 1.5;
        r.end_time = 2.25;
        r.segments.push_back({1.5, 2.0});
        const auto j = nlohmann::json::parse(net::encode_result(r));
        assert(j["text"] == "hello world");
        assert(j["isFinal"] == true);
        assert(j["startTime"].get<double>() == 1.5);
        assert(j["endTime"].get<double>() == 2.25);
        assert(j["segments"].size() == 1);
        assert(j["segments"][0]["end"].get<double>() == 2.0);

        r.segments.clear();
        r.is_final = false;
        const auto k = nlohmann::json::parse(net::encode_result(r));
        assert(k["isFinal"] == false);
        assert(!k.contains("segments"));

        // invalid UTF-8 from the decoder still produces a valid frame
        r.text = std::string("caf\xc3", 4);
        const auto bad = nlohmann::json::parse(net::encode_result(r));
        assert(bad["text"].is_string());
    }

    // error frame
    {
        const auto j = nlohmann::json::parse(net::encode_error("Transcription engine unavailable", "no model"));
        assert(j["error"] == "Transcription engine unavailable");
        assert(j["details"] == "no model");
        assert(!nlohmann::json::parse(net::encode_error("oops")).contains("details"));
    }

    // session options
    {
        net::SessionOptions o;
        std::string error;
        assert(net::parse_session_options("/api/voice/stream", o, error));
        assert(o.path == "/api/voice/stream");
        assert(!o.source && !o.language);

        net::SessionOptions p;
        assert(net::parse_session_options("/api/voice/stream?source=System&lang=DE&x=1", p, error));
        assert(p.path == "/api/voice/stream");
        assert(p.source && *p.source == audio::SourceType::SystemAudio);
        assert(p.language && *p.language == "de");

        net::SessionOptions q;
        assert(net::parse_session_options("/s?source=loopback&language=pt%2Dbr", q, error));
        assert(*q.source == audio::SourceType::SystemAudio);
        assert(*q.language == "pt-br");

        net::SessionOptions bad;
        assert(!net::parse_session_options("/s?source=radio", bad, error));
        assert(error.find("radio") != std::string::npos);
        assert(!net::parse_session_options("/s?language=e1", bad, error));

        core::SessionConfig defaults;
        const auto applied = net::apply_options(defaults, p);
        assert(applied.source == audio::SourceType::SystemAudio);
        assert(applied.language == "de");
        assert(applied.chunk_samples() == defaults.chunk_samples());
        assert(net::apply_options(defaults, o).source == audio::SourceType::Microphone);
    }
    return 0;
}
