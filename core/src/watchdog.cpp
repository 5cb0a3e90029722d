#include "devit/watchdog.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace devit {

Watchdog::Watchdog(std::chrono::seconds max_runtime)
    : start_(std::chrono::steady_clock::now()), max_runtime_(max_runtime) {}

Watchdog::~Watchdog() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (ticker_.joinable()) ticker_.join();
}

bool Watchdog::expired() const {
    if (!enabled()) return false;
    return std::chrono::steady_clock::now() - start_ >= max_runtime_;
}

void Watchdog::check() const {
    if (expired()) fire();
}

void Watchdog::fire() const {
    std::cerr << "error: max runtime exceeded (" << max_runtime_.count() << "s)" << std::endl;
    std::fflush(stderr);
    // Skip static destructors: the main thread may be blocked in a read.
    std::_Exit(kWatchdogExitCode);
}

void Watchdog::start_ticker(std::chrono::milliseconds period) {
    if (!enabled() || ticker_.joinable()) return;
    ticker_ = std::thread([this, period]() {
        std::unique_lock<std::mutex> lk(mu_);
        while (!stop_) {
            cv_.wait_for(lk, period, [this]() { return stop_; });
            if (stop_) break;
            check();
        }
    });
}

} // namespace devit
