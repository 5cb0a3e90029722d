#pragma once

// Bounded wait for work that may block indefinitely (a pipe read, a peer's
// next line). The work runs on a detached worker that reports through a
// single-slot future; the caller waits for "result or deadline, whichever
// first". On expiry the worker is abandoned, not stopped: whatever it blocks
// on must be torn down by the caller (typically by killing the child that
// owns the other end of the pipe). Everything the work touches must be owned
// by the closure, never borrowed from the caller's stack.

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace devit {

template <typename Fn>
auto run_with_deadline(Fn&& work, std::chrono::milliseconds timeout)
    -> std::optional<decltype(work())> {
    using T = decltype(work());
    auto task = std::make_shared<std::packaged_task<T()>>(std::forward<Fn>(work));
    std::future<T> fut = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    if (fut.wait_for(timeout) != std::future_status::ready) return std::nullopt;
    return fut.get();
}

} // namespace devit
