#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>

#include "cancellation.hpp"

/**
 * @brief An unbounded, closable, thread-safe FIFO queue.
 *
 * Producers push without blocking. Consumers block in pop() until an element
 * arrives, the queue is shut down, or the supplied cancellation token fires.
 * Elements pushed before shutdown() are still handed out; pop() reports
 * std::nullopt only once the queue is both shut down and drained.
 *
 * @tparam T The type of elements stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() : shutdown_(false) {}

    /**
     * @brief Adds an element to the back of the queue.
     *
     * Wakes one waiting consumer. Pushing after shutdown() is ignored and
     * reported by returning false.
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return false;
            queue_.push(std::move(value));
        }
        condition_.notify_one();
        return true;
    }

    /**
     * @brief Blocks until an element is available, the queue is shut down and
     * empty, or the token is cancelled.
     *
     * @return The front element, or std::nullopt on shutdown or cancellation.
     */
    std::optional<T> pop(const CancellationToken& cancel = {}) {
        // Registered before taking mutex_; the callback itself locks it.
        auto wake = cancel.on_cancel([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            condition_.notify_all();
        });
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [&]() { return shutdown_ || !queue_.empty() || cancel.is_cancelled(); });
        if (cancel.is_cancelled() || queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    /**
     * @brief Non-blocking variant of pop().
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /**
     * @brief Shuts down the queue and wakes all waiting consumers.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condition_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    mutable std::mutex mutex_;
    std::queue<T> queue_;
    std::condition_variable condition_;
    bool shutdown_;
};

#endif // THREAD_SAFE_QUEUE_HPP
