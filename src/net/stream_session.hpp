#pragma once
#include "asr/engine_provider.hpp"
#include "core/config.hpp"
#include "core/session_controller.hpp"
#include "net/inference_runner.hpp"
#include "net/protocol.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <string>

namespace net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

// Process-wide collaborators shared by every session.
struct ServerContext {
    core::ServerConfig config;
    std::shared_ptr<asr::EngineProvider> engines;
    std::shared_ptr<InferenceRunner> runner;
};

// One client connection. All handlers run on the connection's strand, so the
// SessionController inside is only ever touched from one place at a time.
class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
    StreamSession(tcp::socket socket, std::shared_ptr<ServerContext> context);
    ~StreamSession();

    void run();

private:
    void do_read_request();
    void on_read_request(beast::error_code ec, std::size_t bytes);
    void reject(http::status status, const std::string& body);
    void on_accept(beast::error_code ec);
    void on_engine_ready(std::shared_ptr<asr::TranscriptionEngine> engine, std::exception_ptr error);

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_text(const std::string& text);

    void pump();
    void launch(core::InferenceRequest request);
    void on_inference_done(const std::shared_ptr<const core::InferenceRequest>& request,
                           asr::InferenceOutcome outcome);
    void drain_results();
    void continue_flush();

    void schedule_keepalive();
    void on_keepalive(beast::error_code ec);

    void send(std::string message);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);

    // graceful: flush queued frames, then a normal close handshake.
    // Otherwise the TCP stream is dropped at once.
    void shutdown(core::CloseReason reason, bool graceful);
    void do_close();

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
    std::shared_ptr<ServerContext> context_;
    std::string peer_;

    SessionOptions options_;
    std::string options_error_;
    std::unique_ptr<core::SessionController> controller_;
    std::shared_ptr<asr::TranscriptionEngine> engine_;
    boost::asio::steady_timer keepalive_timer_;

    std::deque<std::string> write_queue_;
    size_t outstanding_ = 0;      // passes handed to the runner, not yet back
    bool eos_ = false;
    bool closing_ = false;
    bool close_after_write_ = false;
    bool ws_open_ = false;
};

} // namespace net
