#include "event_loop.h"
#include "logger.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <utility>

namespace parley {

class EventLoop::Impl {
public:
    explicit Impl(ClockFn clock) : clock_(std::move(clock)) {
        if (!clock_) {
            auto origin = std::chrono::steady_clock::now();
            clock_ = [origin]() {
                return std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - origin).count();
            };
        }
    }

    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    TimerId post_delayed(int64_t delay_ms, Task task) {
        if (delay_ms < 0) delay_ms = 0;
        TimerId id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = ++next_timer_id_;
            // Key on (due, id) so timers with equal deadlines keep insertion order
            timers_.emplace(std::make_pair(clock_() + delay_ms, id), std::move(task));
        }
        cv_.notify_one();
        return id;
    }

    void cancel(TimerId id) {
        if (id == 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->first.second == id) {
                timers_.erase(it);
                return;
            }
        }
    }

    size_t poll() {
        size_t executed = 0;
        while (true) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!tasks_.empty()) {
                    task = std::move(tasks_.front());
                    tasks_.pop_front();
                } else if (!timers_.empty() && timers_.begin()->first.first <= clock_()) {
                    task = std::move(timers_.begin()->second);
                    timers_.erase(timers_.begin());
                } else {
                    break;
                }
            }
            run_task(task);
            executed++;
        }
        return executed;
    }

    void run() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = false;
        }
        while (true) {
            poll();

            std::unique_lock<std::mutex> lock(mutex_);
            if (stopped_) break;
            if (!tasks_.empty()) continue;
            if (timers_.empty()) {
                cv_.wait(lock, [this] { return stopped_ || !tasks_.empty() || !timers_.empty(); });
            } else {
                int64_t wait_ms = timers_.begin()->first.first - clock_();
                if (wait_ms > 0) {
                    cv_.wait_for(lock, std::chrono::milliseconds(wait_ms));
                }
            }
            if (stopped_) break;
        }
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    int64_t now_ms() const {
        return clock_();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size() + timers_.size();
    }

private:
    static void run_task(Task& task) {
        if (!task) return;
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("Event loop task threw: ") + e.what());
        }
    }

    ClockFn clock_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<std::pair<int64_t, TimerId>, Task> timers_;
    TimerId next_timer_id_ = 0;
    bool stopped_ = false;
};

EventLoop::EventLoop(ClockFn clock) : pimpl_(std::make_unique<Impl>(std::move(clock))) {}
EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
    pimpl_->post(std::move(task));
}

EventLoop::TimerId EventLoop::post_delayed(int64_t delay_ms, Task task) {
    return pimpl_->post_delayed(delay_ms, std::move(task));
}

void EventLoop::cancel(TimerId id) {
    pimpl_->cancel(id);
}

size_t EventLoop::poll() {
    return pimpl_->poll();
}

void EventLoop::run() {
    pimpl_->run();
}

void EventLoop::stop() {
    pimpl_->stop();
}

int64_t EventLoop::now_ms() const {
    return pimpl_->now_ms();
}

size_t EventLoop::pending() const {
    return pimpl_->pending();
}

} // namespace parley
