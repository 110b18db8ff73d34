#include <cassert>
#include "core/keepalive.hpp"
#include "core/session_controller.hpp"
#include "../support/test_support.hpp"

using Action = core::KeepaliveMonitor::Action;
using std::chrono::seconds;

int main() {
    const auto t0 = std::chrono::steady_clock::time_point() + std::chrono::hours(1);

    // Client never answers: pings at 20 s and 40 s, dead at 60 s.
    {
        core::KeepaliveMonitor k(seconds(20), seconds(60), t0);
        assert(k.tick(t0 + seconds(5)) == Action::None);
        assert(k.tick(t0 + seconds(20)) == Action::SendPing);
        assert(k.tick(t0 + seconds(25)) == Action::None);
        assert(k.tick(t0 + seconds(40)) == Action::SendPing);
        assert(k.tick(t0 + seconds(59)) == Action::None);
        assert(k.tick(t0 + seconds(60)) == Action::Expire);
        // reported once
        assert(k.tick(t0 + seconds(61)) == Action::None);
    }

    // A pong pushes expiry out.
    {
        core::KeepaliveMonitor k(seconds(20), seconds(60), t0);
        assert(k.tick(t0 + seconds(20)) == Action::SendPing);
        k.on_pong(t0 + seconds(21));
        assert(k.tick(t0 + seconds(40)) == Action::SendPing);
        assert(k.tick(t0 + seconds(60)) == Action::SendPing);
        assert(k.tick(t0 + seconds(80)) == Action::SendPing);
        assert(k.tick(t0 + seconds(81)) == Action::Expire);
    }

    // The controller drives the same monitor with its own clock.
    {
        test::ManualClock clock;
        core::SessionController ctl(core::SessionConfig(), [&clock] { return clock.now; });
        clock.advance(seconds(20));
        assert(ctl.on_keepalive_tick() == Action::SendPing);
        clock.advance(seconds(30));
        ctl.on_pong();
        clock.advance(seconds(20));
        assert(ctl.on_keepalive_tick() == Action::SendPing);
        clock.advance(seconds(60));
        assert(ctl.on_keepalive_tick() == Action::Expire);
        ctl.close(core::CloseReason::ChannelStall);
        assert(ctl.closed());
        assert(ctl.state() == core::SessionState::Closed);
        assert(ctl.on_keepalive_tick() == Action::None);
    }

    assert(std::string(core::to_string(Action::Expire)) == "expire");
    return 0;
}
