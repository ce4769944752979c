#include "utils/thread_pool.hpp"
#include "utils/logger.hpp"

namespace jukebox {

ThreadPool::ThreadPool(size_t num_threads, std::string name) : name_(std::move(name)), stop_(false) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            log_error(name_ + " pool task failed: " + e.what());
        }
    }
}

bool ThreadPool::enqueue(Task task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
    return true;
}

BlockingExecutor ThreadPool::executor() {
    return [this](Task task) {
        if (!enqueue(std::move(task))) {
            log_warning(name_ + " pool is stopped, dropping task");
        }
    };
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace jukebox
