// End-to-end: real listener on a loopback port, scripted engine, Beast client.
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "asr/engine_provider.hpp"
#include "net/inference_runner.hpp"
#include "net/listener.hpp"
#include "../support/test_support.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

class TestServer {
public:
    explicit TestServer(asr::EngineProvider::Factory factory) {
        context_ = std::make_shared<net::ServerContext>();
        context_->engines = std::make_shared<asr::EngineProvider>(std::move(factory));
        context_->runner = std::make_shared<net::InferenceRunner>(2);
        listener_ = std::make_shared<net::Listener>(
            ioc_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0), context_);
        assert(listener_->ok());
        port_ = listener_->local_endpoint().port();
        listener_->run();
        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~TestServer() {
        listener_->stop();
        ioc_.stop();
        thread_.join();
        context_->runner->stop();
    }

    unsigned short port() const { return port_; }

private:
    boost::asio::io_context ioc_;
    std::shared_ptr<net::ServerContext> context_;
    std::shared_ptr<net::Listener> listener_;
    std::thread thread_;
    unsigned short port_ = 0;
};

using Client = websocket::stream<tcp::socket>;

std::unique_ptr<Client> connect(boost::asio::io_context& ioc, unsigned short port, const std::string& target) {
    auto ws = std::make_unique<Client>(ioc);
    ws->next_layer().connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    ws->handshake("127.0.0.1:" + std::to_string(port), target);
    return ws;
}

// Text frames until the server closes the connection.
std::vector<nlohmann::json> read_until_close(Client& ws) {
    std::vector<nlohmann::json> frames;
    for (;;) {
        beast::flat_buffer buffer;
        beast::error_code ec;
        ws.read(buffer, ec);
        if (ec) {
            assert(ec == websocket::error::closed);
            break;
        }
        const std::string text = beast::buffers_to_string(buffer.data());
        if (text == "ping") {
            ws.text(true);
            ws.write(boost::asio::buffer(std::string("pong")));
            continue;
        }
        frames.push_back(nlohmann::json::parse(text));
    }
    return frames;
}

void test_stream_then_eos() {
    TestServer server([]() -> std::shared_ptr<asr::TranscriptionEngine> {
        return std::make_shared<test::ScriptedEngine>("testing one two");
    });
    boost::asio::io_context ioc;
    auto ws = connect(ioc, server.port(), "/api/voice/stream?source=mic&language=en");

    const auto audio = test::tone(1.0);
    ws->binary(true);
    for (size_t off = 0; off < audio.size(); off += 1600) {
        std::vector<int16_t> frame(audio.begin() + off, audio.begin() + off + 1600);
        const auto bytes = test::to_bytes(frame);
        ws->write(boost::asio::buffer(bytes));
    }
    ws->text(true);
    ws->write(boost::asio::buffer(std::string("EOS")));

    const auto frames = read_until_close(*ws);
    assert(!frames.empty());
    double last_start = -1.0;
    for (const auto& f : frames) {
        assert(f.contains("text") && f.contains("isFinal"));
        assert(f["text"] == "testing one two");
        const double start = f["startTime"].get<double>();
        assert(start >= last_start);
        assert(f["endTime"].get<double>() >= start);
        last_start = start;
    }
    assert(frames.back()["isFinal"] == true);
    assert(frames.back()["endTime"].get<double>() <= 1.0 + 1e-6);
}

void test_engine_unavailable() {
    TestServer server([]() -> std::shared_ptr<asr::TranscriptionEngine> {
        throw asr::EngineError("model not found");
    });
    boost::asio::io_context ioc;
    auto ws = connect(ioc, server.port(), "/api/voice/stream");
    const auto frames = read_until_close(*ws);
    assert(frames.size() == 1);
    assert(frames[0]["error"] == "Transcription engine unavailable");
    assert(frames[0]["details"] == "model not found");
}

void test_bad_session_options() {
    TestServer server([]() -> std::shared_ptr<asr::TranscriptionEngine> {
        return std::make_shared<test::ScriptedEngine>("unused");
    });
    boost::asio::io_context ioc;
    auto ws = connect(ioc, server.port(), "/api/voice/stream?source=radio");
    const auto frames = read_until_close(*ws);
    assert(frames.size() == 1);
    assert(frames[0]["error"] == "Invalid session options");
}

void test_plain_http_rejected() {
    TestServer server([]() -> std::shared_ptr<asr::TranscriptionEngine> {
        return std::make_shared<test::ScriptedEngine>("unused");
    });
    boost::asio::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server.port()));
    http::request<http::empty_body> req(http::verb::get, "/api/voice/stream", 11);
    req.set(http::field::host, "127.0.0.1");
    http::write(socket, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    assert(res.result() == http::status::bad_request);
}

} // namespace

int main() {
    test_stream_then_eos();
    test_engine_unavailable();
    test_bad_session_options();
    test_plain_http_rejected();
    std::cout << "loopback_stream_test: ok" << std::endl;
    return 0;
}
