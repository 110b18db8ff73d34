// Stream a WAV file to a live_transcribe_server in real time and print the transcripts.
//
//   stream_file <file.wav> [--host 127.0.0.1] [--port 8765] [--path /api/voice/stream]
//               [--source mic|system] [--language en] [--frame-ms 100] [--speed 1.0]
//               [--rate 16000] [-v]
//
// --speed 0 sends as fast as possible.

#include "audio/pcm.hpp"
#include "audio/wav_source.hpp"
#include "core/logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <deque>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

struct Options {
    std::string wav;
    std::string host = "127.0.0.1";
    std::string port = "8765";
    std::string path = "/api/voice/stream";
    std::string source = "mic";
    std::string language = "en";
    int frame_ms = 100;
    double speed = 1.0;
    int rate = 16000;
    bool verbose = false;
};

class StreamClient : public std::enable_shared_from_this<StreamClient> {
public:
    StreamClient(boost::asio::io_context& ioc, audio::WavSource& source, const Options& opts)
        : ws_(ioc), timer_(ioc), source_(source), opts_(opts) {}

    bool connect(std::string& error) {
        try {
            tcp::resolver resolver(ws_.get_executor());
            auto results = resolver.resolve(opts_.host, opts_.port);
            beast::get_lowest_layer(ws_).connect(results);
            std::string target = opts_.path + "?source=" + opts_.source + "&language=" + opts_.language;
            ws_.handshake(opts_.host + ":" + opts_.port, target);
        } catch (const beast::system_error& e) {
            error = e.code().message();
            return false;
        }
        return true;
    }

    void start() {
        start_ = std::chrono::steady_clock::now();
        do_read();
        send_next_frame();
    }

    int results() const { return results_; }
    int finals() const { return finals_; }
    bool server_error() const { return server_error_; }

private:
    struct Outgoing {
        std::string data;
        bool binary;
    };

    void send_next_frame() {
        auto frame = source_.next_frame(opts_.frame_ms);
        if (frame.empty()) {
            core::log_info("[client] audio done (" + std::to_string(frames_) + " frames), sending EOS");
            send("EOS", false);
            // Give the server time to flush, then give up.
            timer_.expires_after(std::chrono::seconds(30));
            timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
                if (ec) return;
                core::log_warn("[client] no close from server after EOS, closing");
                beast::get_lowest_layer(self->ws_).close();
            });
            return;
        }
        std::string bytes;
        audio::encode_pcm16le(frame.data(), frame.size(), bytes);
        send(std::move(bytes), true);
        ++frames_;
        sent_samples_ += frame.size();

        if (opts_.speed <= 0.0) {
            boost::asio::post(ws_.get_executor(), [self = shared_from_this()] { self->send_next_frame(); });
            return;
        }
        // Pace against the wall clock so drift does not accumulate.
        const double audio_s = static_cast<double>(sent_samples_) / source_.sample_rate() / opts_.speed;
        timer_.expires_at(start_ + std::chrono::microseconds(static_cast<long long>(audio_s * 1e6)));
        timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
            if (!ec) self->send_next_frame();
        });
    }

    void send(std::string data, bool binary) {
        if (closed_) return;
        queue_.push_back({std::move(data), binary});
        if (queue_.size() > 1) return;
        do_write();
    }

    void do_write() {
        ws_.binary(queue_.front().binary);
        ws_.async_write(boost::asio::buffer(queue_.front().data),
                        [self = shared_from_this()](beast::error_code ec, std::size_t) {
                            if (ec) {
                                core::log_error("[client] write: " + ec.message());
                                self->closed_ = true;
                                self->queue_.clear();
                                return;
                            }
                            self->queue_.pop_front();
                            if (!self->queue_.empty()) self->do_write();
                        });
    }

    void do_read() {
        ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            closed_ = true;
            timer_.cancel();
            if (ec == websocket::error::closed) {
                core::log_info("[client] server closed the session");
            } else {
                core::log_error("[client] read: " + ec.message());
            }
            return;
        }
        const std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        handle_text(text);
        do_read();
    }

    void handle_text(const std::string& text) {
        if (text == "ping") {
            send("pong", false);
            return;
        }
        const auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            core::log_debug("[client] unexpected frame: " + text);
            return;
        }
        if (j.contains("error")) {
            server_error_ = true;
            std::cerr << "[server error] " << j.value("error", std::string()) << ": "
                      << j.value("details", std::string()) << "\n";
            return;
        }
        const bool is_final = j.value("isFinal", false);
        ++results_;
        if (is_final) ++finals_;
        std::ostringstream os;
        os << std::fixed << std::setprecision(2) << (is_final ? "[final]   " : "[partial] ")
           << j.value("startTime", 0.0) << "s - " << j.value("endTime", 0.0) << "s  "
           << j.value("text", std::string());
        std::cout << os.str() << std::endl;
    }

    websocket::stream<beast::tcp_stream> ws_;
    boost::asio::steady_timer timer_;
    beast::flat_buffer buffer_;
    std::deque<Outgoing> queue_;
    audio::WavSource& source_;
    Options opts_;

    std::chrono::steady_clock::time_point start_;
    size_t sent_samples_ = 0;
    int frames_ = 0;
    int results_ = 0;
    int finals_ = 0;
    bool closed_ = false;
    bool server_error_ = false;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <file.wav> [--host h] [--port p] [--path /api/voice/stream]\n"
              << "       [--source mic|system] [--language en] [--frame-ms 100] [--speed 1.0] [--rate 16000] [-v]\n";
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
        if (a == "-v" || a == "--verbose") { opts.verbose = true; continue; }
        if (a == "--host" && i + 1 < argc) { opts.host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { opts.port = argv[++i]; continue; }
        if (a == "--path" && i + 1 < argc) { opts.path = argv[++i]; continue; }
        if (a == "--source" && i + 1 < argc) { opts.source = argv[++i]; continue; }
        if (a == "--language" && i + 1 < argc) { opts.language = argv[++i]; continue; }
        if (a == "--frame-ms" && i + 1 < argc) { opts.frame_ms = std::atoi(argv[++i]); continue; }
        if (a == "--speed" && i + 1 < argc) { opts.speed = std::atof(argv[++i]); continue; }
        if (a == "--rate" && i + 1 < argc) { opts.rate = std::atoi(argv[++i]); continue; }
        if (!a.empty() && a[0] != '-' && opts.wav.empty()) { opts.wav = a; continue; }
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage(argv[0]);
        return 2;
    }
    if (opts.wav.empty() || opts.frame_ms <= 0 || opts.rate <= 0) {
        print_usage(argv[0]);
        return 2;
    }
    if (opts.verbose) core::set_log_level(core::LogLevel::Debug);

    audio::WavSource source;
    std::string error;
    if (!source.open(opts.wav, opts.rate, error)) {
        core::log_error("[client] " + error);
        return 1;
    }
    std::ostringstream info;
    info << std::fixed << std::setprecision(2) << "[client] " << opts.wav << ": " << source.duration_seconds()
         << "s, " << source.source_rate() << " Hz x" << source.channels() << " (" << source.bits_per_sample()
         << " bit) -> " << source.sample_rate() << " Hz mono";
    core::log_info(info.str());

    boost::asio::io_context ioc;
    auto client = std::make_shared<StreamClient>(ioc, source, opts);
    if (!client->connect(error)) {
        core::log_error("[client] connect to " + opts.host + ":" + opts.port + " failed: " + error);
        return 1;
    }
    client->start();
    ioc.run();

    core::log_info("[client] results=" + std::to_string(client->results()) +
                   " finals=" + std::to_string(client->finals()));
    return client->server_error() ? 1 : 0;
}
