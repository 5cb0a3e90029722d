#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace devit {

constexpr int kWatchdogExitCode = 3;

// Server-wide wall-clock budget. The dispatch loop calls check() before each
// message; start_ticker() covers an idle loop blocked on input. On expiry the
// process exits immediately with kWatchdogExitCode.
class Watchdog {
public:
    // A zero budget disables the watchdog.
    explicit Watchdog(std::chrono::seconds max_runtime);
    ~Watchdog();
    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    bool enabled() const { return max_runtime_.count() > 0; }
    bool expired() const;

    void check() const;
    void start_ticker(std::chrono::milliseconds period = std::chrono::milliseconds(100));

private:
    [[noreturn]] void fire() const;

    std::chrono::steady_clock::time_point start_;
    std::chrono::seconds max_runtime_;
    std::thread ticker_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_{false};
};

} // namespace devit
