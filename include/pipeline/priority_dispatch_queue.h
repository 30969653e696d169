#pragma once

#include "input/button_event.h"
#include "pipeline/sliding_window_queue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace show_ingest::metrics {
struct PipelineStats;
}

namespace show_ingest::transport {
class Publisher;
}

namespace show_ingest::pipeline {

// Lower numeric value is served first.
enum class Priority : std::uint8_t {
    Emergency = 1,
    High = 10,
    Medium = 20,
    Standard = 30,
    Low = 40,
};

const char* priorityToString(Priority priority);

struct PriorityEnvelope {
    Priority priority = Priority::Standard;
    input::ButtonEvent payload;
    std::uint64_t enqueueSeq = 0;
};

// Orders by (priority, enqueueSeq). Payload is never compared.
// Returns true when a must be served after b (std::priority_queue max-heap).
struct EnvelopeAfter {
    bool operator()(const PriorityEnvelope& a, const PriorityEnvelope& b) const {
        const auto pa = static_cast<std::uint8_t>(a.priority);
        const auto pb = static_cast<std::uint8_t>(b.priority);
        if (pa != pb) {
            return pa > pb;
        }
        return a.enqueueSeq > b.enqueueSeq;
    }
};

/**
 * @brief Multi-producer, single-consumer queue with a total order.
 *
 * Unbounded on purpose: button events are rare and the dispatcher drops
 * failed sends rather than re-queueing them.
 */
class PriorityDispatchQueue {
   public:
    PriorityDispatchQueue() = default;
    PriorityDispatchQueue(const PriorityDispatchQueue&) = delete;
    PriorityDispatchQueue& operator=(const PriorityDispatchQueue&) = delete;

    QueueStatus push(Priority priority, input::ButtonEvent event);

    QueueStatus pop(PriorityEnvelope& out);
    QueueStatus pop(PriorityEnvelope& out, std::chrono::milliseconds timeout);

    void shutdown();
    bool isShutdown() const;
    std::size_t size() const;

   private:
    QueueStatus popLocked(PriorityEnvelope& out);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<PriorityEnvelope, std::vector<PriorityEnvelope>, EnvelopeAfter> heap_;
    std::uint64_t nextSeq_ = 0;
    bool shutdown_ = false;
};

/**
 * @brief Single consumer that drains a PriorityDispatchQueue into a Publisher.
 *
 * One envelope at a time, best effort. A failed publish is logged and the
 * envelope is dropped.
 */
class DispatchWorker {
   public:
    DispatchWorker(PriorityDispatchQueue& queue, transport::Publisher& publisher,
                   std::string subject, metrics::PipelineStats* stats = nullptr);
    ~DispatchWorker();

    DispatchWorker(const DispatchWorker&) = delete;
    DispatchWorker& operator=(const DispatchWorker&) = delete;

    void start();
    // Returns once the queue has been shut down and the thread has exited.
    void join();

    // Drain exactly one envelope. Returns false once the queue is shut down.
    bool dispatchOne(std::chrono::milliseconds timeout);

    std::uint64_t sentCount() const {
        return sent_.load();
    }
    std::uint64_t failedCount() const {
        return failed_.load();
    }

   private:
    void run();

    PriorityDispatchQueue& queue_;
    transport::Publisher& publisher_;
    std::string subject_;
    metrics::PipelineStats* stats_;
    std::thread thread_;
    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> failed_{0};
};

}  // namespace show_ingest::pipeline
