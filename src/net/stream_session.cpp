#include "net/stream_session.hpp"
#include "core/logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <chrono>

namespace net {

namespace {

std::chrono::milliseconds keepalive_tick(const core::SessionConfig& config) {
    // Several ticks per interval so a missing pong is noticed close to the timeout.
    const double seconds = std::max(0.05, std::min(config.keepalive_interval_s, config.keepalive_timeout_s) / 4.0);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string describe_error(const std::exception_ptr& error) {
    if (!error) return {};
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace

StreamSession::StreamSession(tcp::socket socket, std::shared_ptr<ServerContext> context)
    : ws_(std::move(socket))
    , context_(std::move(context))
    , keepalive_timer_(ws_.get_executor()) {
    beast::error_code ec;
    const auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    peer_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

StreamSession::~StreamSession() {
    core::log_info("[ws] connection released [" + peer_ + "]");
}

void StreamSession::run() {
    // Hop onto the strand before touching any state.
    boost::asio::dispatch(ws_.get_executor(),
                          beast::bind_front_handler(&StreamSession::do_read_request, shared_from_this()));
}

void StreamSession::do_read_request() {
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    http::async_read(ws_.next_layer(), buffer_, req_,
                     beast::bind_front_handler(&StreamSession::on_read_request, shared_from_this()));
}

void StreamSession::on_read_request(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != http::error::end_of_stream) core::log_debug("[ws] read request [" + peer_ + "]: " + ec.message());
        return;
    }
    if (!websocket::is_upgrade(req_)) {
        reject(http::status::bad_request, "WebSocket upgrade required\n");
        return;
    }

    const std::string target(req_.target());
    if (!parse_session_options(target, options_, options_error_)) {
        core::log_warn("[ws] bad session options from " + peer_ + ": " + options_error_);
    }

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "live-transcribe");
    }));
    ws_.read_message_max(1 << 20);
    ws_.async_accept(req_, beast::bind_front_handler(&StreamSession::on_accept, shared_from_this()));
}

void StreamSession::reject(http::status status, const std::string& body) {
    res_ = std::make_shared<http::response<http::string_body>>(status, req_.version());
    res_->set(http::field::server, "live-transcribe");
    res_->set(http::field::content_type, "text/plain");
    res_->keep_alive(false);
    res_->body() = body;
    res_->prepare_payload();
    auto self = shared_from_this();
    http::async_write(ws_.next_layer(), *res_, [self](beast::error_code ec, std::size_t) {
        beast::error_code ignored;
        beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
        if (ec) core::log_debug("[ws] reject write: " + ec.message());
    });
}

void StreamSession::on_accept(beast::error_code ec) {
    if (ec) {
        core::log_warn("[ws] handshake failed [" + peer_ + "]: " + ec.message());
        return;
    }
    ws_open_ = true;
    buffer_.consume(buffer_.size());

    if (!options_error_.empty()) {
        send(encode_error("Invalid session options", options_error_));
        shutdown(core::CloseReason::TransportError, true);
        return;
    }

    const core::SessionConfig config = apply_options(context_->config.session, options_);
    controller_ = std::make_unique<core::SessionController>(config);
    core::log_info("[ws] client connected [" + peer_ + "] path=" + options_.path +
                   " source=" + audio::to_string(config.source) + " language=" + config.language);

    schedule_keepalive();
    do_read();

    // Audio is buffered while a cold engine finishes loading.
    auto self = shared_from_this();
    context_->engines->when_ready([self](std::shared_ptr<asr::TranscriptionEngine> engine, std::exception_ptr error) {
        boost::asio::post(self->ws_.get_executor(), [self, engine, error] {
            self->on_engine_ready(engine, error);
        });
    });
}

void StreamSession::on_engine_ready(std::shared_ptr<asr::TranscriptionEngine> engine, std::exception_ptr error) {
    if (closing_) return;
    if (error || !engine) {
        const std::string details = error ? describe_error(error) : "no engine";
        core::log_error("[ws] transcription engine unavailable for " + peer_ + ": " + details);
        send(encode_error("Transcription engine unavailable", details));
        shutdown(core::CloseReason::EngineUnavailable, true);
        return;
    }
    engine_ = std::move(engine);
    pump();
}

void StreamSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&StreamSession::on_read, shared_from_this()));
}

void StreamSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (closing_) return;
        if (ec == websocket::error::closed) {
            core::log_info("[ws] client closed the connection [" + peer_ + "]");
            shutdown(core::CloseReason::ClientDisconnect, false);
        } else {
            core::log_warn("[ws] read failed [" + peer_ + "]: " + ec.message());
            shutdown(core::CloseReason::TransportError, false);
        }
        return;
    }

    if (!closing_) {
        if (ws_.got_binary()) {
            if (!eos_) {
                const auto data = buffer_.data();
                controller_->on_audio(static_cast<const uint8_t*>(data.data()), data.size());
                pump();
            }
        } else {
            on_text(beast::buffers_to_string(buffer_.data()));
        }
    }
    buffer_.consume(buffer_.size());
    do_read();
}

void StreamSession::on_text(const std::string& text) {
    switch (parse_control(text)) {
    case ControlMessage::EndOfStream:
        if (eos_) return;
        core::log_info("[ws] EOS from " + peer_);
        eos_ = true;
        continue_flush();
        break;
    case ControlMessage::Pong:
        controller_->on_pong();
        break;
    case ControlMessage::Ping:
        controller_->on_pong();
        send("pong");
        break;
    case ControlMessage::Unknown:
        core::log_debug("[ws] ignoring text frame: " + text.substr(0, 64));
        break;
    }
}

void StreamSession::pump() {
    if (closing_ || !engine_) return;
    if (eos_) {
        continue_flush();
        return;
    }
    if (auto request = controller_->try_process()) {
        launch(std::move(*request));
    }
}

void StreamSession::launch(core::InferenceRequest request) {
    auto req = std::make_shared<const core::InferenceRequest>(std::move(request));
    ++outstanding_;
    auto self = shared_from_this();
    context_->runner->async_run(engine_, req, ws_.get_executor(),
                                [self, req](asr::InferenceOutcome outcome) {
                                    self->on_inference_done(req, std::move(outcome));
                                });
}

void StreamSession::on_inference_done(const std::shared_ptr<const core::InferenceRequest>& request,
                                      asr::InferenceOutcome outcome) {
    if (outstanding_ > 0) --outstanding_;
    if (closing_) return;
    controller_->complete(*request, outcome);
    drain_results();
    pump();
}

void StreamSession::drain_results() {
    while (auto result = controller_->pop_result()) {
        send(encode_result(*result));
    }
}

void StreamSession::continue_flush() {
    if (closing_ || !engine_) return;  // resumes from on_engine_ready
    if (outstanding_ > 0) return;      // resumes from on_inference_done
    if (auto request = controller_->begin_flush()) {
        launch(std::move(*request));
        return;
    }
    drain_results();
    shutdown(core::CloseReason::EndOfStream, true);
}

void StreamSession::schedule_keepalive() {
    keepalive_timer_.expires_after(keepalive_tick(controller_->config()));
    keepalive_timer_.async_wait(beast::bind_front_handler(&StreamSession::on_keepalive, shared_from_this()));
}

void StreamSession::on_keepalive(beast::error_code ec) {
    if (ec == boost::asio::error::operation_aborted || closing_) return;
    switch (controller_->on_keepalive_tick()) {
    case core::KeepaliveMonitor::Action::SendPing:
        send("ping");
        break;
    case core::KeepaliveMonitor::Action::Expire:
        shutdown(core::CloseReason::ChannelStall, false);
        return;
    case core::KeepaliveMonitor::Action::None:
        break;
    }
    schedule_keepalive();
}

void StreamSession::send(std::string message) {
    if (!ws_open_) return;
    write_queue_.push_back(std::move(message));
    if (write_queue_.size() > 1) return;  // a write is already running
    do_write();
}

void StreamSession::do_write() {
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()),
                    beast::bind_front_handler(&StreamSession::on_write, shared_from_this()));
}

void StreamSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        core::log_debug("[ws] write failed [" + peer_ + "]: " + ec.message());
        write_queue_.clear();
        ws_open_ = false;
        shutdown(core::CloseReason::TransportError, false);
        return;
    }
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        do_write();
    } else if (close_after_write_) {
        do_close();
    }
}

void StreamSession::shutdown(core::CloseReason reason, bool graceful) {
    if (closing_) return;
    closing_ = true;
    keepalive_timer_.cancel();
    if (controller_) controller_->close(reason);

    if (graceful && ws_open_) {
        close_after_write_ = true;
        if (write_queue_.empty()) do_close();
        return;
    }
    ws_open_ = false;
    beast::get_lowest_layer(ws_).close();
}

void StreamSession::do_close() {
    close_after_write_ = false;
    ws_open_ = false;
    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec) core::log_debug("[ws] close [" + self->peer_ + "]: " + ec.message());
    });
}

} // namespace net
