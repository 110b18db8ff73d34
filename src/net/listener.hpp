#pragma once
#include "net/stream_session.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>

namespace net {

// Accepts TCP connections and starts a StreamSession on its own strand for each.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(boost::asio::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<ServerContext> context);

    // false when the endpoint could not be opened/bound (already logged).
    bool ok() const { return ok_; }
    tcp::endpoint local_endpoint() const;

    void run();
    void stop();

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void fail(beast::error_code ec, const char* what);

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<ServerContext> context_;
    bool ok_ = false;
};

} // namespace net
