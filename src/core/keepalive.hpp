#pragma once
#include <chrono>

namespace core {

// Ping cadence and pong watchdog for one connection. Time is passed in, so
// the transport decides the clock and tests can drive it directly.
class KeepaliveMonitor {
public:
    using Clock = std::chrono::steady_clock;

    enum class Action { None, SendPing, Expire };

    KeepaliveMonitor(std::chrono::milliseconds interval, std::chrono::milliseconds timeout,
                     Clock::time_point now);

    // Called on every timer tick (at least once per interval).
    Action tick(Clock::time_point now);

    // Any pong (or other proof of life) from the peer.
    void on_pong(Clock::time_point now) { last_pong_ = now; }

    std::chrono::milliseconds interval() const { return interval_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    Clock::time_point last_pong() const { return last_pong_; }

private:
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds timeout_;
    Clock::time_point last_pong_;
    Clock::time_point last_ping_;
    bool expired_ = false;
};

const char* to_string(KeepaliveMonitor::Action action);

} // namespace core
