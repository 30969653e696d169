#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace show_ingest::core {

// Group cancellation token shared by every device session and stage thread.
// sleepFor() wakes immediately once requestStop() is called, so reconnect
// backoff never outlives a shutdown request.
class StopSignal {
   public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool stopRequested() const {
        return stopped_.load(std::memory_order_acquire);
    }

    // Returns true if the full duration elapsed, false if stop was requested.
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration,
                             [this] { return stopped_.load(std::memory_order_acquire); });
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

}  // namespace show_ingest::core
