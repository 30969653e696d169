#include "device/device_session.h"

#include "device/device_registry.h"
#include "logging/logger.h"

#include <stdexcept>

namespace show_ingest::device {

const char* sessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::Connecting:
        return "Connecting";
    case SessionState::Active:
        return "Active";
    case SessionState::Degraded:
        return "Degraded";
    case SessionState::PermanentlyFailed:
        return "PermanentlyFailed";
    }
    return "Unknown";
}

const char* sessionStatusToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::Connected:
        return "connected";
    case SessionStatus::Disconnected:
        return "disconnected";
    case SessionStatus::Dead:
        return "dead";
    }
    return "disconnected";
}

DeviceSession::DeviceSession(DeviceCapability& capability, SessionPolicy policy,
                             core::StopSignal& stop, DeviceRegistry* registry)
    : capability_(capability), policy_(policy), stop_(stop), registry_(registry) {
    if (policy_.maxReconnectAttempts == 0) {
        throw std::invalid_argument("maxReconnectAttempts must be positive");
    }
    if (policy_.errorBurstThreshold == 0) {
        throw std::invalid_argument("errorBurstThreshold must be positive");
    }
    if (policy_.pollInterval.count() <= 0) {
        throw std::invalid_argument("pollInterval must be positive");
    }
    health_.maxReconnectAttempts = policy_.maxReconnectAttempts;
}

DeviceSession::~DeviceSession() {
    if (thread_.joinable()) {
        stop_.requestStop();
        thread_.join();
    }
}

void DeviceSession::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

void DeviceSession::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

SessionState DeviceSession::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

DeviceHealth DeviceSession::health() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return health_;
}

void DeviceSession::transition(SessionState to, std::optional<DeviceError> cause) {
    SessionTransition t;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        t.from = state_;
        state_ = to;
        t.health = health_;
    }
    t.deviceId = capability_.deviceId();
    t.to = to;
    t.cause = std::move(cause);

    if (t.cause) {
        LOG_INFO("[Session:{}] {} -> {} ({}: {})", t.deviceId, sessionStateToString(t.from),
                 sessionStateToString(to), errorCodeToString(t.cause->code), t.cause->message);
    } else {
        LOG_DEBUG("[Session:{}] {} -> {}", t.deviceId, sessionStateToString(t.from),
                  sessionStateToString(to));
    }
    if (transitionCallback_) {
        transitionCallback_(t);
    }
}

void DeviceSession::emitStatus(SessionStatus status) {
    if (statusCallback_) {
        statusCallback_(status, health());
    }
}

SessionState DeviceSession::run() {
    const std::string& id = capability_.deviceId();
    LOG_INFO("[Session:{}] Starting (kind={}, maxAttempts={}, backoff={}ms)", id,
             capability_.kind(), policy_.maxReconnectAttempts, policy_.backoff.count());

    while (!stop_.stopRequested()) {
        transition(SessionState::Connecting);
        std::optional<DeviceError> openError = capability_.open();

        if (openError) {
            std::uint32_t attempts = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                attempts = ++health_.reconnectAttempts;
                ++health_.totalErrors;
            }
            LOG_WARN("[Session:{}] Open failed (attempt {}/{}): {}", id, attempts,
                     policy_.maxReconnectAttempts, openError->message);
            transition(SessionState::Disconnected, openError);

            if (attempts >= policy_.maxReconnectAttempts) {
                DeviceError exhausted(ErrorCode::DEVICE_RETRY_EXHAUSTED,
                                      "reconnect attempts exhausted");
                LOG_ERROR("[Session:{}] Giving up after {} attempts", id, attempts);
                transition(SessionState::PermanentlyFailed, exhausted);
                emitStatus(SessionStatus::Dead);
                return SessionState::PermanentlyFailed;
            }
            if (!stop_.sleepFor(policy_.backoff)) {
                break;
            }
            continue;
        }

        if (stop_.stopRequested()) {
            capability_.close();
            break;
        }

        bool announce = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            health_.reconnectAttempts = 0;
            health_.consecutiveErrors = 0;
            health_.lastHeartbeat = std::chrono::steady_clock::now();
            announce = !announcedConnected_;
            announcedConnected_ = true;
        }
        transition(SessionState::Active);
        if (registry_) {
            registry_->add(id, capability_.kind());
        }
        if (announce) {
            emitStatus(SessionStatus::Connected);
        }

        std::optional<DeviceError> cause;
        ActiveOutcome outcome = runActive(cause);

        if (outcome == ActiveOutcome::Stopped) {
            capability_.close();
            if (registry_) {
                registry_->remove(id);
            }
            break;
        }

        if (outcome == ActiveOutcome::Degraded) {
            transition(SessionState::Degraded, cause);
            capability_.close();
            std::uint32_t stalled = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                health_.consecutiveErrors = 0;
                ++health_.restarts;
                stalled = ++health_.stalledRestarts;
            }
            if (stalled >= policy_.maxReconnectAttempts) {
                if (registry_) {
                    registry_->remove(id);
                }
                DeviceError exhausted(ErrorCode::DEVICE_RETRY_EXHAUSTED,
                                      std::to_string(stalled) + " restarts without data");
                LOG_ERROR("[Session:{}] Giving up: {} restarts without data", id, stalled);
                transition(SessionState::PermanentlyFailed, exhausted);
                emitStatus(SessionStatus::Dead);
                return SessionState::PermanentlyFailed;
            }
            LOG_WARN("[Session:{}] Restarting stream ({}/{} without data)", id, stalled,
                     policy_.maxReconnectAttempts);
            transition(SessionState::Disconnected);
            if (!stop_.sleepFor(policy_.restartDelay)) {
                break;
            }
            continue;
        }

        // Hard I/O error: the device is gone until a reopen succeeds.
        emitStatus(SessionStatus::Disconnected);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            announcedConnected_ = false;
        }
        capability_.close();
        if (registry_) {
            registry_->remove(id);
        }
        transition(SessionState::Disconnected, cause);
        if (!stop_.sleepFor(policy_.backoff)) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = SessionState::Disconnected;
    }
    LOG_INFO("[Session:{}] Stopped", id);
    return SessionState::Disconnected;
}

DeviceSession::ActiveOutcome DeviceSession::runActive(std::optional<DeviceError>& cause) {
    const std::string& id = capability_.deviceId();

    while (!stop_.stopRequested()) {
        ReadStatus rs = capability_.poll(policy_.pollInterval);
        const auto now = std::chrono::steady_clock::now();

        switch (rs) {
        case ReadStatus::Data: {
            std::lock_guard<std::mutex> lock(stateMutex_);
            health_.consecutiveErrors = 0;
            health_.stalledRestarts = 0;
            health_.lastHeartbeat = now;
            break;
        }
        case ReadStatus::Xrun: {
            std::uint32_t consecutive = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                ++health_.totalErrors;
                consecutive = ++health_.consecutiveErrors;
                health_.lastHeartbeat = now;
            }
            LOG_DEBUG("[Session:{}] xrun ({} consecutive)", id, consecutive);
            if (consecutive >= policy_.errorBurstThreshold) {
                cause = DeviceError(ErrorCode::AUDIO_XRUN_BURST,
                                    std::to_string(consecutive) + " consecutive xruns");
                return ActiveOutcome::Degraded;
            }
            break;
        }
        case ReadStatus::HardError: {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                ++health_.totalErrors;
            }
            cause = capability_.lastError();
            if (!cause) {
                cause = DeviceError(ErrorCode::DEVICE_IO_ERROR, "device reported an I/O error");
            }
            LOG_WARN("[Session:{}] Hard I/O error: {}", id, cause->message);
            return ActiveOutcome::Disconnected;
        }
        case ReadStatus::Idle:
            break;
        }

        if (policy_.livenessTimeout.count() > 0) {
            std::chrono::steady_clock::time_point heartbeat;
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                heartbeat = health_.lastHeartbeat;
            }
            const auto age =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - heartbeat);
            if (age > policy_.livenessTimeout) {
                cause = DeviceError(ErrorCode::AUDIO_HEARTBEAT_TIMEOUT,
                                    "no data for " + std::to_string(age.count()) + "ms");
                return ActiveOutcome::Degraded;
            }
        }
    }
    return ActiveOutcome::Stopped;
}

}  // namespace show_ingest::device
