#pragma once

#include "core/error_codes.h"
#include "core/stop_signal.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace show_ingest::device {

class DeviceRegistry;

enum class SessionState : std::uint8_t {
    Disconnected,
    Connecting,
    Active,
    Degraded,
    PermanentlyFailed,
};

const char* sessionStateToString(SessionState state);

// Outcome of one DeviceCapability::poll() call.
enum class ReadStatus : std::uint8_t {
    Data,       // payload delivered and handed off
    Idle,       // nothing within the poll timeout
    Xrun,       // driver flagged an overrun/underrun; chunk discarded
    HardError,  // handle is unusable (unplugged, ENODEV, ...)
};

// Status notifications surfaced to the outside world.
enum class SessionStatus : std::uint8_t { Connected, Disconnected, Dead };

// Lower-case wire names ("connected", "disconnected", "dead").
const char* sessionStatusToString(SessionStatus status);

struct DeviceHealth {
    std::uint32_t consecutiveErrors = 0;
    std::uint32_t totalErrors = 0;
    std::chrono::steady_clock::time_point lastHeartbeat{};
    std::uint32_t reconnectAttempts = 0;
    std::uint32_t maxReconnectAttempts = 0;
    std::uint32_t restarts = 0;  // Degraded restarts
    // Degraded restarts in a row with no Data since the reopen.
    std::uint32_t stalledRestarts = 0;
};

struct SessionPolicy {
    std::uint32_t maxReconnectAttempts = 5;
    std::chrono::milliseconds backoff{1000};
    std::uint32_t errorBurstThreshold = 5;
    // Zero disables the heartbeat check (button devices are idle by nature).
    std::chrono::milliseconds livenessTimeout{1000};
    std::chrono::milliseconds restartDelay{500};
    std::chrono::milliseconds pollInterval{100};
};

/**
 * @brief Hardware seam driven by DeviceSession.
 *
 * poll() performs one bounded read and, for ReadStatus::Data, has already
 * handed the payload to its queue before returning. close() must be safe to
 * call on a closed device.
 */
class DeviceCapability {
   public:
    virtual ~DeviceCapability() = default;

    virtual const std::string& deviceId() const = 0;
    virtual const char* kind() const = 0;
    virtual std::optional<DeviceError> open() = 0;
    virtual void close() = 0;
    virtual ReadStatus poll(std::chrono::milliseconds timeout) = 0;

    // Detail for the last HardError, if the device recorded one.
    virtual std::optional<DeviceError> lastError() const {
        return std::nullopt;
    }
};

struct SessionTransition {
    std::string deviceId;
    SessionState from = SessionState::Disconnected;
    SessionState to = SessionState::Disconnected;
    std::optional<DeviceError> cause;
    DeviceHealth health;
};

/**
 * @brief Supervisory loop shared by every hardware source.
 *
 * Disconnected -> Connecting -> Active -> Degraded -> Disconnected (retry)
 * and Disconnected -> PermanentlyFailed once reconnectAttempts reaches the
 * cap. Only failed opens count as reconnect attempts; the counter resets on
 * a successful open and is never decremented otherwise. A device that opens
 * but never delivers data is capped too: stalledRestarts counts Degraded
 * restarts without a Data read in between and shares the same limit. Backoff and restart
 * delays sleep on the StopSignal so cancellation is observed immediately.
 */
class DeviceSession {
   public:
    using TransitionCallback = std::function<void(const SessionTransition&)>;
    using StatusCallback = std::function<void(SessionStatus, const DeviceHealth&)>;

    DeviceSession(DeviceCapability& capability, SessionPolicy policy, core::StopSignal& stop,
                  DeviceRegistry* registry = nullptr);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    void setTransitionCallback(TransitionCallback cb) {
        transitionCallback_ = std::move(cb);
    }
    void setStatusCallback(StatusCallback cb) {
        statusCallback_ = std::move(cb);
    }

    // Blocks until the session is cancelled or permanently failed.
    SessionState run();

    // run() on an owned thread.
    void start();
    void join();

    SessionState state() const;
    DeviceHealth health() const;
    const std::string& deviceId() const {
        return capability_.deviceId();
    }

   private:
    enum class ActiveOutcome { Stopped, Degraded, Disconnected };

    ActiveOutcome runActive(std::optional<DeviceError>& cause);
    void transition(SessionState to, std::optional<DeviceError> cause = std::nullopt);
    void emitStatus(SessionStatus status);

    DeviceCapability& capability_;
    SessionPolicy policy_;
    core::StopSignal& stop_;
    DeviceRegistry* registry_;

    TransitionCallback transitionCallback_;
    StatusCallback statusCallback_;

    mutable std::mutex stateMutex_;
    SessionState state_ = SessionState::Disconnected;
    DeviceHealth health_;
    bool announcedConnected_ = false;

    std::thread thread_;
};

}  // namespace show_ingest::device
