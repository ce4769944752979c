#pragma once

#include "utils/scheduler.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace jukebox {

// Fixed set of workers for blocking calls (subprocesses, HTTP). Results go
// back to the event loop through Scheduler::post.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, std::string name = "worker");
    ~ThreadPool();

    // Disable copy
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false once the pool is shut down
    bool enqueue(Task task);

    // Adapter handed to components that take a BlockingExecutor
    BlockingExecutor executor();


    // Finish queued tasks, then join
    void shutdown();

private:
    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;

    void worker_loop();
};

} // namespace jukebox
