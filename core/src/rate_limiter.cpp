#include "devit/rate_limiter.h"

namespace devit {

static constexpr std::chrono::seconds kWindow{60};

RateDecision RateLimiter::allow(const std::string& tool, Clock::time_point now) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    auto last = last_call_.find(tool);
    if (last != last_call_.end()) {
        auto since = now - last->second;
        if (since < limits_.cooldown) {
            RateDecision d;
            d.kind = RateDecision::Kind::COOLDOWN;
            d.ms_left = duration_cast<milliseconds>(limits_.cooldown - since).count();
            return d;
        }
    }

    auto& q = windows_[tool];
    while (!q.empty() && now - q.front() > kWindow) q.pop_front();

    if (q.size() >= limits_.max_calls_per_min) {
        RateDecision d;
        d.kind = RateDecision::Kind::TOO_MANY_CALLS;
        d.limit = limits_.max_calls_per_min;
        return d;
    }

    q.push_back(now);
    last_call_[tool] = now;
    return RateDecision{};
}

size_t RateLimiter::window_size(const std::string& tool) const {
    auto it = windows_.find(tool);
    return it == windows_.end() ? 0 : it->second.size();
}

} // namespace devit
