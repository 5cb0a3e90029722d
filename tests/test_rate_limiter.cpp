#include "test_common.h"

#include "devit/rate_limiter.h"

using devit::Limits;
using devit::RateDecision;
using devit::RateLimiter;
using std::chrono::milliseconds;
using std::chrono::seconds;

int main() {
    const auto t0 = RateLimiter::Clock::now();

    // Window cap: the (max+1)-th call inside 60s is refused with the limit.
    {
        Limits l;
        l.max_calls_per_min = 3;
        l.cooldown = milliseconds(0);
        RateLimiter rl(l);
        for (int i = 0; i < 3; i++) {
            expect_true(rl.allow("server.health", t0 + milliseconds(i)).allowed(), "call within cap");
        }
        RateDecision d = rl.allow("server.health", t0 + milliseconds(10));
        expect_true(d.kind == RateDecision::Kind::TOO_MANY_CALLS, "4th call should be too_many_calls");
        expect_eq_ll(d.limit, 3, "limit reported");
        expect_eq_ll((long long)rl.window_size("server.health"), 3, "refused call not recorded");

        // Other tools keep their own window.
        expect_true(rl.allow("echo", t0 + milliseconds(10)).allowed(), "separate key is independent");

        // Entries older than 60s fall out of the window.
        expect_true(rl.allow("server.health", t0 + seconds(61)).allowed(), "window slides after 60s");
        expect_eq_ll((long long)rl.window_size("server.health"), 1, "old entries pruned");
    }

    // Cooldown between consecutive calls on one key.
    {
        Limits l;
        l.max_calls_per_min = 100;
        l.cooldown = milliseconds(250);
        RateLimiter rl(l);
        expect_true(rl.allow("echo", t0).allowed(), "first call");
        RateDecision d = rl.allow("echo", t0 + milliseconds(100));
        expect_true(d.kind == RateDecision::Kind::COOLDOWN, "second call inside cooldown");
        expect_eq_ll(d.ms_left, 150, "ms_left = cooldown - elapsed");

        // A refused call does not restart the cooldown.
        expect_true(rl.allow("echo", t0 + milliseconds(250)).allowed(), "call after cooldown");
        expect_eq_ll((long long)rl.window_size("echo"), 2, "two admitted calls");
    }

    // Cooldown is checked before the window.
    {
        Limits l;
        l.max_calls_per_min = 1;
        l.cooldown = milliseconds(1000);
        RateLimiter rl(l);
        expect_true(rl.allow("x", t0).allowed(), "first");
        RateDecision d = rl.allow("x", t0 + milliseconds(10));
        expect_true(d.kind == RateDecision::Kind::COOLDOWN, "cooldown wins over full window");
        d = rl.allow("x", t0 + milliseconds(2000));
        expect_true(d.kind == RateDecision::Kind::TOO_MANY_CALLS, "then the window refuses");
    }

    // Zero cap refuses everything.
    {
        Limits l;
        l.max_calls_per_min = 0;
        l.cooldown = milliseconds(0);
        RateLimiter rl(l);
        expect_true(rl.allow("x", t0).kind == RateDecision::Kind::TOO_MANY_CALLS, "cap 0");
    }

    std::cerr << "test_rate_limiter: ALL PASSED" << std::endl;
    return 0;
}
