#include "core/keepalive.hpp"

namespace core {

KeepaliveMonitor::KeepaliveMonitor(std::chrono::milliseconds interval, std::chrono::milliseconds timeout,
                                   Clock::time_point now)
    : interval_(interval), timeout_(timeout), last_pong_(now), last_ping_(now) {}

KeepaliveMonitor::Action KeepaliveMonitor::tick(Clock::time_point now) {
    if (expired_) return Action::None;
    if (now - last_pong_ >= timeout_) {
        expired_ = true;
        return Action::Expire;
    }
    if (now - last_ping_ >= interval_) {
        last_ping_ = now;
        return Action::SendPing;
    }
    return Action::None;
}

const char* to_string(KeepaliveMonitor::Action action) {
    switch (action) {
    case KeepaliveMonitor::Action::SendPing: return "send_ping";
    case KeepaliveMonitor::Action::Expire: return "expire";
    default: return "none";
    }
}

} // namespace core
