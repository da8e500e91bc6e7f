#ifndef PROCTOR_BLOCKING_QUEUE_H
#define PROCTOR_BLOCKING_QUEUE_H

#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <optional>
#include <atomic>

namespace proctor {
namespace utils {

/**
 * @brief Thrown when pushing onto a closed queue
 */
class QueueClosedException : public std::runtime_error {
public:
    QueueClosedException() : std::runtime_error("Queue is closed") {}
};

/**
 * @brief Thread-safe FIFO with an optional capacity
 *
 * Producers either block in push() until there is room or use tryPush()
 * to be turned away when the queue is full. Consumers block in pop()
 * until an item arrives or the queue is closed and drained.
 *
 * @tparam T Element type (movable)
 */
template<typename T>
class BlockingQueue {
public:
    /**
     * @param capacity Maximum number of queued items (0 = unlimited)
     */
    explicit BlockingQueue(size_t capacity = 0)
        : capacity_(capacity)
        , closed_(false)
    {}

    ~BlockingQueue() {
        close();
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * @brief Push, waiting for room when the queue is at capacity
     * @throws QueueClosedException if the queue is or becomes closed
     */
    void push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (capacity_ > 0) {
            notFull_.wait(lock, [this]() {
                return queue_.size() < capacity_ || closed_;
            });
        }

        if (closed_) {
            throw QueueClosedException();
        }

        queue_.push(std::move(item));
        notEmpty_.notify_one();
    }

    /**
     * @brief Push without waiting
     * @return false if the queue is full or closed; the item is left untouched
     */
    bool tryPush(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_ || (capacity_ > 0 && queue_.size() >= capacity_)) {
            return false;
        }

        queue_.push(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Pop, waiting until an item is available
     * @return std::nullopt once the queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        notEmpty_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        notFull_.notify_one();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

    bool isClosed() const {
        return closed_;
    }

    /**
     * @brief Reject further pushes and wake every waiter
     *
     * Items already queued can still be popped.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

private:
    std::queue<T> queue_;
    const size_t capacity_;
    std::atomic<bool> closed_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

} // namespace utils
} // namespace proctor

#endif // PROCTOR_BLOCKING_QUEUE_H
