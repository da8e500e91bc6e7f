#include "utils/worker_pool.h"
#include "utils/log.h"
#include <stdexcept>

namespace proctor {
namespace utils {

WorkerPool::WorkerPool(size_t numThreads, size_t queueCapacity)
    : tasks_(queueCapacity)
    , shutdown_(false)
{
    if (numThreads == 0) {
        throw std::invalid_argument("Worker pool must have at least one thread");
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&WorkerPool::workerThread, this);
    }

    LOGD_FMT("WorkerPool started: threads=" << numThreads << ", queue_capacity=" << queueCapacity);
}

WorkerPool::~WorkerPool() {
    shutdown();
    wait();
}

void WorkerPool::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    tasks_.close();
}

void WorkerPool::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::workerThread() {
    while (true) {
        auto task = tasks_.pop();
        if (!task.has_value()) {
            break;
        }

        // packaged_task stores exceptions in the future; nothing escapes here
        (*task)();
    }
}

} // namespace utils
} // namespace proctor
