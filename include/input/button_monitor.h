#pragma once

#include "device/device_session.h"
#include "input/button_event.h"
#include "input/debouncer.h"
#include "input/evdev_device.h"
#include "input/key_codes.h"
#include "pipeline/priority_dispatch_queue.h"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace show_ingest::metrics {
struct PipelineStats;
}

namespace show_ingest::input {

struct ButtonDeviceConfig {
    std::string path;
    int avatarId = kResetAvatarId;
    bool grab = false;
    KeyActionMap keys;
};

/**
 * @brief Button capability driven by a DeviceSession.
 *
 * Keeps only key-down events for keys bound in the device's map, applies
 * the per-device debounce window and pushes accepted actions onto the
 * dispatch queue. Session status changes arrive through attach() and are
 * queued as status events. The key map, debounce state and priorities live
 * in this object, so they survive reconnects unchanged.
 */
class ButtonMonitor : public device::DeviceCapability {
   public:
    ButtonMonitor(ButtonDeviceConfig config, std::chrono::milliseconds debounce,
                  InputEventSource& source, pipeline::PriorityDispatchQueue& queue,
                  metrics::PipelineStats* stats = nullptr);

    const std::string& deviceId() const override {
        return config_.path;
    }
    const char* kind() const override {
        return "button";
    }

    std::optional<DeviceError> open() override;
    void close() override;
    device::ReadStatus poll(std::chrono::milliseconds timeout) override;
    std::optional<DeviceError> lastError() const override {
        return source_.lastError();
    }

    // Routes the session's Connected / Disconnected / Dead notifications.
    void attach(device::DeviceSession& session);
    void onSessionStatus(device::SessionStatus status);

    // Returns true if the event produced a queued action.
    bool handleEvent(const RawInputEvent& event);

    static pipeline::Priority priorityFor(const ButtonEvent& event);

    std::uint64_t acceptedCount() const {
        return accepted_.load();
    }
    std::uint64_t suppressedCount() const {
        return suppressed_.load();
    }
    std::uint64_t unmappedCount() const {
        return unmapped_.load();
    }

   private:
    void enqueue(ButtonEvent event);

    const ButtonDeviceConfig config_;
    Debouncer debouncer_;
    InputEventSource& source_;
    pipeline::PriorityDispatchQueue& queue_;
    metrics::PipelineStats* stats_;

    std::vector<RawInputEvent> events_;
    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> suppressed_{0};
    std::atomic<std::uint64_t> unmapped_{0};
};

}  // namespace show_ingest::input
