#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>

namespace devit {

struct Limits {
    uint32_t max_calls_per_min{60};
    size_t max_json_kb{256};
    std::chrono::milliseconds cooldown{250};
};

struct RateDecision {
    enum class Kind { ALLOWED, TOO_MANY_CALLS, COOLDOWN };
    Kind kind{Kind::ALLOWED};
    uint32_t limit{0};   // TOO_MANY_CALLS
    int64_t ms_left{0};  // COOLDOWN

    bool allowed() const { return kind == Kind::ALLOWED; }
};

// Per-tool admission gate: a cooldown between consecutive calls, then a
// sliding 60s window capped at max_calls_per_min. Rejected calls leave the
// state untouched. Owned by the dispatch loop; not thread-safe.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(Limits limits) : limits_(limits) {}

    RateDecision allow(const std::string& tool, Clock::time_point now);

    const Limits& limits() const { return limits_; }

    // Calls currently counted in tool's window (as of its last admission).
    size_t window_size(const std::string& tool) const;

private:
    Limits limits_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> windows_;
    std::unordered_map<std::string, Clock::time_point> last_call_;
};

} // namespace devit
