#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace parley {

/**
 * @brief Single-threaded cooperative task scheduler
 *
 * Every state mutation in the engine runs as a task on one EventLoop.
 * Backend threads (PortAudio callback, capture thread, socket thread) never
 * touch engine state directly; they post() here instead.
 *
 * Thread Safety:
 * - post(), post_delayed(), cancel() and stop() may be called from any thread
 * - poll() and run() must only be driven by the loop's own thread
 * - Tasks posted from one thread run in posting order; no ordering is
 *   guaranteed between different posting threads
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    /// Monotonic clock in milliseconds
    using ClockFn = std::function<int64_t()>;

    /**
     * @param clock Time source; defaults to std::chrono::steady_clock.
     *              Tests inject a manual clock and drive the loop with poll().
     */
    explicit EventLoop(ClockFn clock = nullptr);
    ~EventLoop();

    // Non-copyable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task to run on the loop thread
    void post(Task task);

    /**
     * @brief Queue a task to run once delay_ms has elapsed on the loop clock
     * @return Timer id usable with cancel(); never 0
     */
    TimerId post_delayed(int64_t delay_ms, Task task);

    /// Cancel a pending timer; no-op if it already ran or was cancelled
    void cancel(TimerId id);

    /**
     * @brief Run every task that is ready now, plus timers that are due
     *
     * Tasks posted while polling also run before poll() returns; timers
     * that become due because the clock advanced are picked up too.
     * @return Number of tasks executed
     */
    size_t poll();

    /// Run until stop() is called, sleeping while nothing is due
    void run();

    /// Make run() return after the current task; thread-safe
    void stop();

    /// Current loop clock reading (ms)
    int64_t now_ms() const;

    /// Number of queued immediate tasks plus pending timers
    size_t pending() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
