#include "pipeline/priority_dispatch_queue.h"

#include "logging/logger.h"
#include "metrics/pipeline_stats.h"
#include "transport/event_codec.h"
#include "transport/publisher.h"

namespace show_ingest::pipeline {

const char* priorityToString(Priority priority) {
    switch (priority) {
    case Priority::Emergency:
        return "emergency";
    case Priority::High:
        return "high";
    case Priority::Medium:
        return "medium";
    case Priority::Standard:
        return "standard";
    case Priority::Low:
        return "low";
    }
    return "standard";
}

QueueStatus PriorityDispatchQueue::push(Priority priority, input::ButtonEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return QueueStatus::Shutdown;
        }
        PriorityEnvelope env;
        env.priority = priority;
        env.payload = std::move(event);
        env.enqueueSeq = nextSeq_++;
        heap_.push(std::move(env));
    }
    cv_.notify_one();
    return QueueStatus::Ok;
}

QueueStatus PriorityDispatchQueue::pop(PriorityEnvelope& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return shutdown_ || !heap_.empty(); });
    return popLocked(out);
}

QueueStatus PriorityDispatchQueue::pop(PriorityEnvelope& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return shutdown_ || !heap_.empty(); })) {
        return QueueStatus::Empty;
    }
    return popLocked(out);
}

QueueStatus PriorityDispatchQueue::popLocked(PriorityEnvelope& out) {
    if (shutdown_) {
        return QueueStatus::Shutdown;
    }
    out = heap_.top();
    heap_.pop();
    return QueueStatus::Ok;
}

void PriorityDispatchQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

bool PriorityDispatchQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

std::size_t PriorityDispatchQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size();
}

// ========== DispatchWorker ==========

DispatchWorker::DispatchWorker(PriorityDispatchQueue& queue, transport::Publisher& publisher,
                               std::string subject, metrics::PipelineStats* stats)
    : queue_(queue), publisher_(publisher), subject_(std::move(subject)), stats_(stats) {}

DispatchWorker::~DispatchWorker() {
    if (thread_.joinable()) {
        queue_.shutdown();
        thread_.join();
    }
}

void DispatchWorker::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&DispatchWorker::run, this);
}

void DispatchWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool DispatchWorker::dispatchOne(std::chrono::milliseconds timeout) {
    PriorityEnvelope env;
    QueueStatus status = queue_.pop(env, timeout);
    if (status == QueueStatus::Shutdown) {
        return false;
    }
    if (status == QueueStatus::Empty) {
        return true;
    }

    bool ok = false;
    try {
        ok = publisher_.publish(subject_, transport::encodeButtonEvent(env.payload));
    } catch (const std::exception& e) {
        LOG_WARN("[Dispatch] Publisher threw: {}", e.what());
        ok = false;
    }

    if (ok) {
        sent_.fetch_add(1);
        if (stats_) {
            metrics::PipelineStats::bump(stats_->dispatchSent);
        }
        LOG_DEBUG("[Dispatch] Sent {} event seq={} priority={} avatar={}",
                  input::kindToString(env.payload.kind), env.enqueueSeq,
                  priorityToString(env.priority), env.payload.avatarId);
    } else {
        failed_.fetch_add(1);
        if (stats_) {
            metrics::PipelineStats::bump(stats_->dispatchFailures);
        }
        LOG_WARN("[Dispatch] Publish via {} failed, dropping seq={} priority={}",
                 publisher_.name(), env.enqueueSeq, priorityToString(env.priority));
    }
    return true;
}

void DispatchWorker::run() {
    LOG_INFO("[Dispatch] Worker started (subject={})", subject_);
    while (dispatchOne(std::chrono::milliseconds(500))) {
    }
    LOG_INFO("[Dispatch] Worker stopped (sent={}, failed={})", sent_.load(), failed_.load());
}

}  // namespace show_ingest::pipeline
