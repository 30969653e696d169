#pragma once

#include "app/shutdown_controller.h"
#include "app/service_notify.h"
#include "audio/alsa_capture.h"
#include "audio/audio_capture_stage.h"
#include "audio/audio_processing_stage.h"
#include "core/config_loader.h"
#include "core/stop_signal.h"
#include "device/device_registry.h"
#include "device/device_session.h"
#include "input/button_monitor.h"
#include "input/evdev_device.h"
#include "metrics/pipeline_stats.h"
#include "metrics/stats_reporter.h"
#include "pipeline/priority_dispatch_queue.h"
#include "pipeline/sliding_window_queue.h"
#include "transport/zmq_publisher.h"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

namespace show_ingest::app {

/**
 * @brief Owns and wires every ingest component.
 *
 * Mic: AlsaCapture -> AudioCaptureStage (DeviceSession) -> raw queue ->
 * AudioProcessingStage -> processed queue -> audio forwarder. Mic session
 * status goes straight to the publisher on the audio subject.
 * Buttons: EvdevDevice -> ButtonMonitor (DeviceSession) -> priority queue
 * -> DispatchWorker -> ZmqPublisher.
 *
 * Shutdown order: stop signal, queue shutdown, then joins. Safe to call
 * stop() more than once.
 */
class IngestApp {
   public:
    explicit IngestApp(core::IngestConfig config);
    ~IngestApp();

    IngestApp(const IngestApp&) = delete;
    IngestApp& operator=(const IngestApp&) = delete;

    // Build the pipeline and start all threads. False if the transport
    // endpoint cannot be set up.
    bool start();

    // Wake every worker and join. Idempotent.
    void stop();

    // Supervisor loop: polls signals via the controller and writes the
    // stats file until shutdown is requested.
    int run(ShutdownController& shutdown);

    nlohmann::json statsSnapshot() const;

    const metrics::PipelineStats& stats() const {
        return stats_;
    }

   private:
    struct ButtonChannel {
        std::unique_ptr<input::EvdevDevice> device;
        std::unique_ptr<input::ButtonMonitor> monitor;
        std::unique_ptr<device::DeviceSession> session;
    };

    device::SessionPolicy micPolicy() const;
    device::SessionPolicy buttonPolicy() const;
    void onTransition(const device::SessionTransition& t);
    void onMicStatus(device::SessionStatus status, const device::DeviceHealth& health);
    void addButton(const input::ButtonDeviceConfig& config);
    void forwardAudio();

    const core::IngestConfig config_;
    const std::chrono::steady_clock::time_point startedAt_;

    core::StopSignal stopSignal_;
    metrics::PipelineStats stats_;
    device::DeviceRegistry registry_;
    metrics::StatsReporter statsReporter_;
    ServiceNotifier notifier_;

    pipeline::SlidingWindowQueue<audio::AudioFrame> rawAudio_;
    pipeline::SlidingWindowQueue<audio::TaggedAudioFrame> processedAudio_;
    pipeline::PriorityDispatchQueue dispatchQueue_;

    transport::ZmqPublisher publisher_;
    std::unique_ptr<pipeline::DispatchWorker> dispatcher_;

    std::unique_ptr<audio::AlsaCapture> micSource_;
    std::unique_ptr<audio::AudioCaptureStage> micStage_;
    std::unique_ptr<device::DeviceSession> micSession_;
    std::unique_ptr<audio::AudioProcessingStage> processing_;
    std::thread forwarder_;

    std::vector<ButtonChannel> buttons_;

    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace show_ingest::app
