#pragma once

#include "utils/scheduler.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace jukebox {
namespace testing {

// Virtual-time scheduler. Tasks posted from other threads are queued and
// run by whichever test thread drains the queue.
class ManualScheduler : public Scheduler {
public:
    ManualScheduler() : now_(TimePoint(std::chrono::hours(24 * 365 * 50))) {}

    void post(Task task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            posted_.push_back(std::move(task));
        }
        posted_cv_.notify_all();
    }

    TimerId schedule_after(Duration delay, Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        TimerId id = ++next_id_;
        timers_.emplace(id, Timer{now_ + delay, std::move(task)});
        return id;
    }

    void cancel(TimerId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.erase(id);
    }

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    // Run posted tasks, including ones they post, until the queue is empty
    size_t run_pending() {
        size_t ran = 0;
        for (;;) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (posted_.empty()) break;
                task = std::move(posted_.front());
                posted_.pop_front();
            }
            task();
            ++ran;
        }
        return ran;
    }

    // Move virtual time forward, firing due timers in deadline order
    void advance(Duration duration) {
        TimePoint target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = now_ + duration;
        }

        for (;;) {
            run_pending();

            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto due = timers_.end();
                for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                    if (it->second.deadline > target) continue;
                    if (due == timers_.end() || it->second.deadline < due->second.deadline) {
                        due = it;
                    }
                }
                if (due == timers_.end()) break;

                now_ = due->second.deadline;
                task = std::move(due->second.task);
                timers_.erase(due);
            }
            task();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            now_ = target;
        }
        run_pending();
    }

    // Drain tasks posted from other threads until pred holds (real time)
    bool run_until(const std::function<bool()>& pred,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            run_pending();
            if (pred()) return true;

            std::unique_lock<std::mutex> lock(mutex_);
            if (!posted_cv_.wait_until(lock, deadline, [this] { return !posted_.empty(); })) {
                lock.unlock();
                run_pending();
                return pred();
            }
        }
    }

    size_t timer_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.size();
    }

private:
    struct Timer {
        TimePoint deadline;
        Task task;
    };

    mutable std::mutex mutex_;
    std::condition_variable posted_cv_;
    TimePoint now_;
    std::deque<Task> posted_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 0;
};

} // namespace testing
} // namespace jukebox
