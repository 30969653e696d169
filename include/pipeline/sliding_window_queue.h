#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace show_ingest::pipeline {

enum class QueueStatus {
    Ok,
    Empty,    // non-blocking get / timed get found nothing
    Shutdown  // queue is terminal; caller must stop using it
};

/**
 * @brief Bounded FIFO that evicts its oldest element when full.
 *
 * put() never blocks on a full queue: the head is dropped and the new item is
 * appended in the same critical section, so two producers can never
 * double-evict. After shutdown() every put/get returns QueueStatus::Shutdown
 * and blocked consumers are woken.
 */
template <typename T>
class SlidingWindowQueue {
   public:
    explicit SlidingWindowQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("SlidingWindowQueue capacity must be positive");
        }
    }

    SlidingWindowQueue(const SlidingWindowQueue&) = delete;
    SlidingWindowQueue& operator=(const SlidingWindowQueue&) = delete;

    QueueStatus put(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return QueueStatus::Shutdown;
            }
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return QueueStatus::Ok;
    }

    // Blocks until an item is available or the queue is shut down.
    QueueStatus get(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return shutdown_ || !items_.empty(); });
        return popLocked(out);
    }

    template <typename Rep, typename Period>
    QueueStatus get(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return shutdown_ || !items_.empty(); })) {
            return QueueStatus::Empty;
        }
        return popLocked(out);
    }

    QueueStatus tryGet(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutdown_ && items_.empty()) {
            return QueueStatus::Empty;
        }
        return popLocked(out);
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const {
        return capacity_;
    }

    // Number of items evicted by put() on a full queue.
    std::uint64_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

   private:
    QueueStatus popLocked(T& out) {
        if (shutdown_) {
            return QueueStatus::Shutdown;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return QueueStatus::Ok;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::uint64_t dropped_ = 0;
    bool shutdown_ = false;
};

}  // namespace show_ingest::pipeline
