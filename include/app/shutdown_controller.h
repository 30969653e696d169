#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <string>

namespace show_ingest::app {

// Written by the signal handler only; drained by ShutdownController::poll().
struct PendingSignals {
    volatile sig_atomic_t count = 0;  // SIGINT/SIGTERM since the last drain
    volatile sig_atomic_t last = 0;

    void clear() {
        count = 0;
        last = 0;
    }
};

/**
 * @brief Turns termination signals (or an internal request) into one ordered stop.
 *
 * The supervisor loop calls poll() every tick. The stop action runs exactly
 * once, on the thread that first observes the request; later signals are
 * only announced.
 */
class ShutdownController {
   public:
    using StopAction = std::function<void()>;
    using Announce = std::function<void(const std::string&)>;

    explicit ShutdownController(PendingSignals* signals = nullptr) : signals_(signals) {}

    void onStop(StopAction action) {
        stopAction_ = std::move(action);
    }
    void onAnnounce(Announce announce) {
        announce_ = std::move(announce);
    }

    // True if this call started the shutdown.
    bool poll();

    // Stop without a signal (fatal stage error, tests).
    void requestStop(const std::string& reason);

    bool running() const {
        return !stopping_.load();
    }
    int lastSignal() const {
        return lastSignal_;
    }
    int signalsSeen() const {
        return signalsSeen_;
    }

   private:
    bool beginStop(const std::string& reason);
    void say(const std::string& message) const;

    PendingSignals* signals_;
    std::atomic<bool> stopping_{false};
    StopAction stopAction_;
    Announce announce_;
    int lastSignal_ = 0;
    int signalsSeen_ = 0;
};

// Process-wide flags targeted by the installed handler.
PendingSignals& processSignals();

// Async-signal-safe.
void onTerminationSignal(int sig);

// SIGINT and SIGTERM go to onTerminationSignal; SIGPIPE is ignored so a
// vanished ZMQ peer cannot kill the process.
void installTerminationHandlers();

}  // namespace show_ingest::app
