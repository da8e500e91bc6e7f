#ifndef PROCTOR_WORKER_POOL_H
#define PROCTOR_WORKER_POOL_H

#include "blocking_queue.h"
#include <vector>
#include <thread>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <optional>
#include <type_traits>

namespace proctor {
namespace utils {

/**
 * @brief Fixed-size worker pool with a bounded backlog
 *
 * Blocking sandbox work is handed to the pool so request threads never wait
 * on container I/O. The backlog is capped: once capacity tasks are waiting,
 * trySubmit() refuses new work instead of letting the queue grow without
 * bound.
 *
 * Example Usage:
 * @code
 * WorkerPool pool(4, 64);
 *
 * auto future = pool.trySubmit([&runner, request]() {
 *     return runner.execute(request);
 * });
 * if (!future) {
 *     // backlog full
 * }
 * ExecutionResult result = future->get();
 * @endcode
 */
class WorkerPool {
public:
    /**
     * @param numThreads Number of worker threads
     * @param queueCapacity Maximum number of waiting tasks (0 = unlimited)
     * @throws std::invalid_argument if numThreads is 0
     */
    WorkerPool(size_t numThreads, size_t queueCapacity);

    /**
     * @brief Shuts down and joins; queued tasks still run
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Queue a callable without blocking
     *
     * @return Future for the callable's result, or std::nullopt when the
     *         backlog is full or the pool is shut down
     */
    template<typename F>
    auto trySubmit(F&& f)
        -> std::optional<std::future<typename std::invoke_result<F>::type>>
    {
        using ReturnType = typename std::invoke_result<F>::type;

        if (shutdown_) {
            return std::nullopt;
        }

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        Task wrapped = [task]() { (*task)(); };
        if (!tasks_.tryPush(wrapped)) {
            return std::nullopt;
        }
        return result;
    }

    /**
     * @brief Stop accepting work; workers exit once the backlog drains
     */
    void shutdown();

    /**
     * @brief Join all workers (call after shutdown())
     */
    void wait();

    bool isShutdown() const {
        return shutdown_;
    }

    size_t getThreadCount() const {
        return workers_.size();
    }

    size_t getPendingTaskCount() const {
        return tasks_.size();
    }

    size_t getQueueCapacity() const {
        return tasks_.capacity();
    }

private:
    using Task = std::function<void()>;

    void workerThread();

    std::vector<std::thread> workers_;
    BlockingQueue<Task> tasks_;
    std::atomic<bool> shutdown_;
};

} // namespace utils
} // namespace proctor

#endif // PROCTOR_WORKER_POOL_H
