#include "utils/worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace arbscan {

WorkerPool::WorkerPool(size_t workers, size_t max_queued)
    : max_queued_(max_queued)
{
    if (workers == 0) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
    if (max_queued == 0) {
        throw std::invalid_argument("WorkerPool needs a positive queue size");
    }

    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    spdlog::debug("WorkerPool started: {} workers, queue={}", workers, max_queued);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load() || queue_.size() >= max_queued_) {
            return false;
        }
        queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });

            // Drain before exiting
            if (queue_.empty()) break;

            task = std::move(queue_.front());
            queue_.pop();
        }

        busy_++;
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }
        busy_--;
    }
}

} // namespace arbscan
