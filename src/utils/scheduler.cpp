#include "utils/scheduler.hpp"
#include "utils/logger.hpp"
#include <boost/asio/post.hpp>

namespace jukebox {

AsioScheduler::AsioScheduler() : work_(boost::asio::make_work_guard(io_)) {}

AsioScheduler::~AsioScheduler() {
    stop();
}

void AsioScheduler::start() {
    if (thread_.joinable()) return;

    thread_ = std::thread([this] {
        for (;;) {
            try {
                io_.run();
                break;
            } catch (const std::exception& e) {
                log_error(std::string("Event loop task failed: ") + e.what());
            }
        }
    });
}

void AsioScheduler::stop() {
    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(timers_mutex_);
    timers_.clear();
}

void AsioScheduler::post(Task task) {
    boost::asio::post(io_, std::move(task));
}

TimerId AsioScheduler::schedule_after(Duration delay, Task task) {
    TimerId id = ++next_id_;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);

    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        timers_[id] = timer;
    }

    timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
        {
            // A cancelled timer whose handler was already queued is gone from the map
            std::lock_guard<std::mutex> lock(timers_mutex_);
            auto it = timers_.find(id);
            if (it == timers_.end()) return;
            timers_.erase(it);
        }
        if (ec) return;
        task();
    });

    return id;
}

void AsioScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    auto it = timers_.find(id);
    if (it != timers_.end()) {
        it->second->cancel();
        timers_.erase(it);
    }
}

TimePoint AsioScheduler::now() const {
    return Clock::now();
}

// ==================== TimerRegistry ====================

TimerRegistry::TimerRegistry(Scheduler& scheduler) : scheduler_(scheduler) {}

TimerRegistry::~TimerRegistry() {
    clear_all();
}

void TimerRegistry::arm(const std::string& key, Duration delay, Task task) {
    clear(key);

    std::uint64_t token = ++next_token_;
    TimerId id = scheduler_.schedule_after(delay, [this, key, token, task = std::move(task)]() {
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.token != token) {
            return;
        }
        entries_.erase(it);
        task();
    });

    entries_[key] = Entry{id, token, scheduler_.now() + delay};
}

void TimerRegistry::arm_interval(const std::string& key, Duration period, Task task) {
    arm(key, period, [this, key, period, task]() {
        arm_interval(key, period, task);
        task();
    });
}

bool TimerRegistry::clear(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    scheduler_.cancel(it->second.id);
    entries_.erase(it);
    return true;
}

void TimerRegistry::clear_all() {
    for (const auto& [key, entry] : entries_) {
        scheduler_.cancel(entry.id);
    }
    entries_.clear();
}

bool TimerRegistry::is_armed(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::optional<TimePoint> TimerRegistry::deadline(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.deadline;
}

} // namespace jukebox
