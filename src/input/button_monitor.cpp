#include "input/button_monitor.h"

#include "core/clock_util.h"
#include "logging/logger.h"
#include "metrics/pipeline_stats.h"

#include <linux/input.h>

namespace show_ingest::input {

namespace {

constexpr std::int32_t kKeyDown = 1;  // 0 = up, 2 = autorepeat

}  // namespace

ButtonMonitor::ButtonMonitor(ButtonDeviceConfig config, std::chrono::milliseconds debounce,
                             InputEventSource& source, pipeline::PriorityDispatchQueue& queue,
                             metrics::PipelineStats* stats)
    : config_(std::move(config)),
      debouncer_(debounce),
      source_(source),
      queue_(queue),
      stats_(stats) {}

std::optional<DeviceError> ButtonMonitor::open() {
    return source_.open(config_.path, config_.grab);
}

void ButtonMonitor::close() {
    source_.close();
}

device::ReadStatus ButtonMonitor::poll(std::chrono::milliseconds timeout) {
    events_.clear();
    device::ReadStatus status = source_.read(events_, timeout);
    // Events read before a hard error are still delivered.
    for (const auto& ev : events_) {
        handleEvent(ev);
    }
    return status;
}

pipeline::Priority ButtonMonitor::priorityFor(const ButtonEvent& event) {
    if (event.kind == EventKind::Action) {
        return (event.action && *event.action == ButtonAction::Reset)
                   ? pipeline::Priority::High
                   : pipeline::Priority::Standard;
    }
    if (event.status && *event.status == ButtonStatus::Dead) {
        return pipeline::Priority::High;
    }
    return pipeline::Priority::Medium;
}

bool ButtonMonitor::handleEvent(const RawInputEvent& event) {
    if (event.type != EV_KEY || event.value != kKeyDown) {
        return false;
    }

    auto key = fromEvdevCode(event.code);
    std::optional<ButtonAction> action = key ? config_.keys.lookup(*key) : std::nullopt;
    if (!action) {
        unmapped_.fetch_add(1);
        if (stats_) {
            metrics::PipelineStats::bump(stats_->buttonUnmapped);
        }
        LOG_DEBUG("[Button:{}] Ignoring unmapped key code {}", config_.path, event.code);
        return false;
    }

    if (!debouncer_.accept(event.timestampMs)) {
        suppressed_.fetch_add(1);
        if (stats_) {
            metrics::PipelineStats::bump(stats_->buttonDebounced);
        }
        LOG_DEBUG("[Button:{}] {} suppressed by debounce ({} ms)", config_.path, keyName(*key),
                  debouncer_.windowMs());
        return false;
    }

    accepted_.fetch_add(1);
    if (stats_) {
        metrics::PipelineStats::bump(stats_->buttonAccepted);
    }
    LOG_INFO("[Button:{}] {} -> {}", config_.path, keyName(*key), actionToString(*action));
    enqueue(ButtonEvent::makeAction(config_.path, config_.avatarId, *action, core::wallSeconds()));
    return true;
}

void ButtonMonitor::onSessionStatus(device::SessionStatus status) {
    ButtonStatus mapped = ButtonStatus::Connected;
    switch (status) {
    case device::SessionStatus::Connected:
        mapped = ButtonStatus::Connected;
        break;
    case device::SessionStatus::Disconnected:
        mapped = ButtonStatus::Disconnected;
        break;
    case device::SessionStatus::Dead:
        mapped = ButtonStatus::Dead;
        break;
    }
    enqueue(ButtonEvent::makeStatus(config_.path, config_.avatarId, mapped, core::wallSeconds()));
}

void ButtonMonitor::attach(device::DeviceSession& session) {
    session.setStatusCallback(
        [this](device::SessionStatus status, const device::DeviceHealth&) {
            onSessionStatus(status);
        });
}

void ButtonMonitor::enqueue(ButtonEvent event) {
    const pipeline::Priority priority = priorityFor(event);
    if (queue_.push(priority, std::move(event)) == pipeline::QueueStatus::Shutdown) {
        LOG_DEBUG("[Button:{}] Dispatch queue shut down, event dropped", config_.path);
    }
}

}  // namespace show_ingest::input
