#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace arbscan {

/**
 * Fixed set of worker threads draining a bounded task queue.
 *
 * The thread count never grows: a task that blocks (a hung venue) holds one
 * worker until it returns, and new work waits in the queue behind it. When
 * the queue is full, post() and submit() refuse the task instead of growing.
 *
 * The destructor stops accepting work, lets the workers finish what is
 * already queued or running, then joins them.
 */
class WorkerPool {
public:
    WorkerPool(size_t workers, size_t max_queued);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task. False when the queue is full or the pool is shutting down.
    bool post(std::function<void()> task);

    // Queue fn and return its future, or std::nullopt when post() refuses it.
    // Exceptions thrown by fn are delivered through the future.
    template <typename Fn>
    auto submit(Fn fn) -> std::optional<std::future<decltype(fn())>> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();
        if (!post([task] { (*task)(); })) {
            return std::nullopt;
        }
        return future;
    }

    void shutdown();

    size_t workers() const { return threads_.size(); }
    size_t max_queued() const { return max_queued_; }
    size_t queued() const;
    size_t busy() const { return busy_.load(); }

private:
    void worker_loop();

    const size_t max_queued_;
    std::vector<std::thread> threads_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<std::function<void()>> queue_;

    std::atomic<bool> running_{true};
    std::atomic<size_t> busy_{0};
};

} // namespace arbscan
