#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace jukebox {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using TimerId = std::uint64_t;
using Task = std::function<void()>;

// Runs blocking work somewhere off the event loop
using BlockingExecutor = std::function<void(Task)>;

// The single logical thread every core component runs on.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual void post(Task task) = 0;
    virtual TimerId schedule_after(Duration delay, Task task) = 0;
    virtual void cancel(TimerId id) = 0;
    virtual TimePoint now() const = 0;
};

class AsioScheduler : public Scheduler {
public:
    AsioScheduler();
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    // Start the event loop thread
    void start();
    void stop();

    boost::asio::io_context& context() { return io_; }

    void post(Task task) override;
    TimerId schedule_after(Duration delay, Task task) override;
    void cancel(TimerId id) override;
    TimePoint now() const override;

private:
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;

    std::mutex timers_mutex_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    std::atomic<TimerId> next_id_{0};
};

// Named timers owned by one entity. Arming a key always clears the previous
// timer under that key; destruction cancels everything still pending.
class TimerRegistry {
public:
    explicit TimerRegistry(Scheduler& scheduler);
    ~TimerRegistry();

    TimerRegistry(const TimerRegistry&) = delete;
    TimerRegistry& operator=(const TimerRegistry&) = delete;

    void arm(const std::string& key, Duration delay, Task task);
    void arm_interval(const std::string& key, Duration period, Task task);

    bool clear(const std::string& key);
    void clear_all();

    bool is_armed(const std::string& key) const;
    std::optional<TimePoint> deadline(const std::string& key) const;
    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        TimerId id;
        std::uint64_t token;
        TimePoint deadline;
    };

    Scheduler& scheduler_;
    std::unordered_map<std::string, Entry> entries_;
    std::uint64_t next_token_ = 0;
};

} // namespace jukebox
