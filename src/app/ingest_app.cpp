#include "app/ingest_app.h"

#include "core/clock_util.h"
#include "core/ingest_constants.h"
#include "logging/logger.h"
#include "transport/event_codec.h"

#include <exception>
#include <unistd.h>

namespace show_ingest::app {

IngestApp::IngestApp(core::IngestConfig config)
    : config_(std::move(config)),
      startedAt_(std::chrono::steady_clock::now()),
      statsReporter_(config_.ingest.statsFile,
                     std::chrono::milliseconds(config_.ingest.statsIntervalMs)),
      rawAudio_(config_.ingest.queues.rawAudioCapacity),
      processedAudio_(config_.ingest.queues.processedAudioCapacity) {}

IngestApp::~IngestApp() {
    stop();
}

device::SessionPolicy IngestApp::micPolicy() const {
    const auto& rc = config_.ingest.reconnect;
    device::SessionPolicy policy;
    policy.maxReconnectAttempts = rc.maxAttempts;
    policy.backoff = std::chrono::milliseconds(rc.backoffMs);
    policy.errorBurstThreshold = rc.xrunBurstThreshold;
    policy.livenessTimeout = std::chrono::milliseconds(rc.livenessTimeoutMs);
    policy.restartDelay = std::chrono::milliseconds(IngestConstants::DEGRADED_RESTART_DELAY_MS);
    policy.pollInterval = std::chrono::milliseconds(IngestConstants::DEVICE_POLL_INTERVAL_MS);
    return policy;
}

device::SessionPolicy IngestApp::buttonPolicy() const {
    device::SessionPolicy policy = micPolicy();
    policy.livenessTimeout = std::chrono::milliseconds(0);
    return policy;
}

void IngestApp::onTransition(const device::SessionTransition& t) {
    if (t.to == device::SessionState::Degraded) {
        metrics::PipelineStats::bump(stats_.sessionRestarts);
    } else if (t.to == device::SessionState::PermanentlyFailed) {
        metrics::PipelineStats::bump(stats_.sessionsDead);
        LOG_CRITICAL("[Ingest] Device {} permanently failed", t.deviceId);
    }
}

void IngestApp::onMicStatus(device::SessionStatus status, const device::DeviceHealth& health) {
    const auto& in = config_.ingest;
    transport::MicStatus record;
    record.sourceId = IngestConstants::PRIMARY_MIC_SOURCE_ID;
    record.device = in.actorMics.front().name;
    record.status = status;
    record.reconnectAttempts = health.reconnectAttempts;
    record.restarts = health.restarts;
    record.timestamp = core::wallSeconds();

    // Sent even with publishAudio off: consumers of the audio subject need
    // to know the mic is gone.
    try {
        if (!publisher_.publish(in.transport.audioSubject, transport::encodeMicStatus(record))) {
            LOG_WARN("[Ingest] Could not publish mic status {}",
                     device::sessionStatusToString(status));
        }
    } catch (const std::exception& e) {
        LOG_WARN("[Ingest] Dropping mic status {}: {}", device::sessionStatusToString(status),
                 e.what());
    }
}

void IngestApp::addButton(const input::ButtonDeviceConfig& config) {
    ButtonChannel channel;
    channel.device = std::make_unique<input::EvdevDevice>();
    channel.monitor = std::make_unique<input::ButtonMonitor>(
        config, std::chrono::milliseconds(config_.ingest.buttonDebounceMs), *channel.device,
        dispatchQueue_, &stats_);
    channel.session = std::make_unique<device::DeviceSession>(*channel.monitor, buttonPolicy(),
                                                              stopSignal_, &registry_);
    channel.monitor->attach(*channel.session);
    channel.session->setTransitionCallback(
        [this](const device::SessionTransition& t) { onTransition(t); });

    LOG_INFO("[Ingest] Button {} (avatar {}, {} keys{})", config.path, config.avatarId,
             config.keys.size(), config.grab ? ", grabbed" : "");
    buttons_.push_back(std::move(channel));
}

bool IngestApp::start() {
    if (started_) {
        return true;
    }
    const auto& in = config_.ingest;

    if (!publisher_.initialize(in.transport.endpoint)) {
        LOG_ERROR("[Ingest] Cannot set up transport at {}", in.transport.endpoint);
        return false;
    }
    dispatcher_ = std::make_unique<pipeline::DispatchWorker>(dispatchQueue_, publisher_,
                                                             in.transport.buttonSubject, &stats_);

    // Mic chain
    const core::MicConfig& mic = in.actorMics.front();
    audio::PcmConfig pcm;
    pcm.deviceHint = mic.name;
    pcm.sampleRate = mic.sampleRate;
    pcm.channels = mic.channels;
    pcm.format = mic.sampleFormat;
    pcm.periodFrames = mic.sampleRate * static_cast<std::uint32_t>(in.audioChunksMs) / 1000;

    micSource_ = std::make_unique<audio::AlsaCapture>();
    micStage_ = std::make_unique<audio::AudioCaptureStage>(IngestConstants::PRIMARY_MIC_SOURCE_ID,
                                                           *micSource_, pcm, rawAudio_, &stats_);
    micSession_ =
        std::make_unique<device::DeviceSession>(*micStage_, micPolicy(), stopSignal_, &registry_);
    micSession_->setTransitionCallback(
        [this](const device::SessionTransition& t) { onTransition(t); });
    micSession_->setStatusCallback(
        [this](device::SessionStatus status, const device::DeviceHealth& health) {
            onMicStatus(status, health);
        });

    audio::ProcessingConfig processingConfig;
    processingConfig.targetSampleRate = in.targetSampleRate;
    processingConfig.silenceThreshold = in.silenceThreshold;
    std::unique_ptr<audio::NoiseReducer> reducer;
    if (mic.useNoiseReducer) {
        reducer = std::make_unique<audio::SpeexNoiseReducer>(IngestConstants::DENOISE_SUPPRESS_DB);
    }
    processing_ = std::make_unique<audio::AudioProcessingStage>(
        processingConfig, audio::makeSpeechClassifier(in.vadBackend, in.vadAggressiveness),
        std::move(reducer), &stats_);

    LOG_INFO("[Ingest] Mic '{}' {} Hz x{} {} -> {} Hz, {} ms chunks, vad={}/{}{}", mic.name,
             mic.sampleRate, mic.channels, audio::sampleFormatToString(mic.sampleFormat),
             in.targetSampleRate, in.audioChunksMs, in.vadBackend, in.vadAggressiveness,
             mic.useNoiseReducer ? ", denoise" : "");

    // Button chain
    addButton(in.reset);
    for (const auto& controller : in.avatarControllers) {
        addButton(controller);
    }

    dispatcher_->start();
    processing_->start(rawAudio_, processedAudio_);
    forwarder_ = std::thread([this] { forwardAudio(); });
    micSession_->start();
    for (auto& button : buttons_) {
        button.session->start();
    }

    started_ = true;
    LOG_INFO("[Ingest] Started: 1 mic, {} buttons, publishing on {}", buttons_.size(),
             in.transport.endpoint);
    return true;
}

void IngestApp::forwardAudio() {
    const auto& transport = config_.ingest.transport;
    const auto timeout = std::chrono::milliseconds(IngestConstants::WORKER_POP_TIMEOUT_MS);

    while (true) {
        audio::TaggedAudioFrame tagged;
        pipeline::QueueStatus status = processedAudio_.get(tagged, timeout);
        if (status == pipeline::QueueStatus::Shutdown) {
            break;
        }
        if (status == pipeline::QueueStatus::Empty || !transport.publishAudio) {
            continue;
        }
        try {
            if (publisher_.publish(transport.audioSubject, transport::encodeAudioFrame(tagged))) {
                metrics::PipelineStats::bump(stats_.audioPublished);
            }
        } catch (const std::exception& e) {
            LOG_WARN("[Ingest] Dropping audio frame {}: {}", tagged.sequenceNum, e.what());
        }
    }
    LOG_DEBUG("[Ingest] Audio forwarder exited");
}

void IngestApp::stop() {
    if (!started_ || stopped_) {
        return;
    }
    stopped_ = true;
    LOG_INFO("[Ingest] Stopping");

    stopSignal_.requestStop();
    rawAudio_.shutdown();
    processedAudio_.shutdown();

    if (micSession_) {
        micSession_->join();
    }
    for (auto& button : buttons_) {
        button.session->join();
    }
    if (processing_) {
        processing_->join();
    }
    if (forwarder_.joinable()) {
        forwarder_.join();
    }

    dispatchQueue_.shutdown();
    if (dispatcher_) {
        dispatcher_->join();
    }
    publisher_.close();
    statsReporter_.remove();
    LOG_INFO("[Ingest] Stopped ({} button events sent, {} frames processed)",
             stats_.dispatchSent.load(), stats_.framesProcessed.load());
}

nlohmann::json IngestApp::statsSnapshot() const {
    const auto now = std::chrono::steady_clock::now();
    nlohmann::json j;
    j["program"] = IngestConstants::PROGRAM_NAME;
    j["version"] = IngestConstants::VERSION;
    j["pid"] = static_cast<int>(getpid());
    j["show"] = config_.show.name;
    j["uptime_s"] = std::chrono::duration<double>(now - startedAt_).count();
    j["time_stamp"] = core::wallSeconds();
    j["pipeline"] = stats_.toJson();
    const logging::LogCounters logCounts = logging::counters();
    j["log"] = {{"warnings", logCounts.warnings}, {"errors", logCounts.errors}};
    j["stats_file"] = {{"writes", statsReporter_.writeCount()},
                       {"failures", statsReporter_.failureCount()}};
    j["queues"] = {{"raw_audio",
                    {{"size", rawAudio_.size()}, {"dropped", rawAudio_.droppedCount()}}},
                   {"processed_audio",
                    {{"size", processedAudio_.size()},
                     {"dropped", processedAudio_.droppedCount()}}},
                   {"dispatch", {{"size", dispatchQueue_.size()}}}};

    nlohmann::json devices = nlohmann::json::array();
    for (const auto& dev : registry_.snapshot()) {
        devices.push_back(
            {{"path", dev.path},
             {"kind", dev.kind},
             {"connected_s", std::chrono::duration<double>(now - dev.since).count()}});
    }
    j["devices"] = devices;

    nlohmann::json sessions = nlohmann::json::array();
    auto describe = [&sessions](const device::DeviceSession& session) {
        const device::DeviceHealth health = session.health();
        sessions.push_back({{"device", session.deviceId()},
                            {"state", device::sessionStateToString(session.state())},
                            {"total_errors", health.totalErrors},
                            {"reconnect_attempts", health.reconnectAttempts},
                            {"restarts", health.restarts}});
    };
    if (micSession_) {
        describe(*micSession_);
    }
    for (const auto& button : buttons_) {
        describe(*button.session);
    }
    j["sessions"] = sessions;
    return j;
}

int IngestApp::run(ShutdownController& shutdown) {
    if (!start()) {
        return 1;
    }
    shutdown.onStop([this] { stopSignal_.requestStop(); });

    notifier_.notifyReady("Capturing show '" + config_.show.name + "'");

    while (shutdown.running()) {
        if (shutdown.poll()) {
            break;
        }
        notifier_.notifyWatchdog();
        statsReporter_.tick(std::chrono::steady_clock::now(), [this] { return statsSnapshot(); });
        if (!stopSignal_.sleepFor(std::chrono::milliseconds(IngestConstants::SUPERVISOR_TICK_MS))) {
            break;
        }
    }

    notifier_.notifyStopping();
    stop();
    return 0;
}

}  // namespace show_ingest::app
