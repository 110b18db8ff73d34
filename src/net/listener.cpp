#include "net/listener.hpp"
#include "core/logging.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace net {

Listener::Listener(boost::asio::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<ServerContext> context)
    : ioc_(ioc)
    , acceptor_(ioc)
    , context_(std::move(context)) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        fail(ec, "open");
        return;
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        fail(ec, "set_option");
        return;
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        fail(ec, "bind");
        return;
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        fail(ec, "listen");
        return;
    }
    ok_ = true;
}

tcp::endpoint Listener::local_endpoint() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? tcp::endpoint() : ep;
}

void Listener::run() {
    if (!ok_) return;
    core::log_info("[ws] listening on " + local_endpoint().address().to_string() + ":" +
                   std::to_string(local_endpoint().port()) + context_->config.path);
    do_accept();
}

void Listener::stop() {
    auto self = shared_from_this();
    boost::asio::post(acceptor_.get_executor(), [self] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) self->fail(ec, "close");
    });
}

void Listener::do_accept() {
    // Each connection gets its own strand.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        fail(ec, "accept");
    } else {
        std::make_shared<StreamSession>(std::move(socket), context_)->run();
    }
    if (acceptor_.is_open()) do_accept();
}

void Listener::fail(beast::error_code ec, const char* what) {
    core::log_error(std::string("[ws] ") + what + ": " + ec.message());
}

} // namespace net
