#include "app/shutdown_controller.h"

#include <string.h>

namespace show_ingest::app {

namespace {

PendingSignals g_pending;

std::string signalName(int sig) {
    switch (sig) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal " + std::to_string(sig);
    }
}

}  // namespace

PendingSignals& processSignals() {
    return g_pending;
}

void onTerminationSignal(int sig) {
    g_pending.last = sig;
    g_pending.count = g_pending.count + 1;
}

void installTerminationHandlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    action.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &action, nullptr);
}

bool ShutdownController::poll() {
    if (!signals_ || signals_->count == 0) {
        return false;
    }
    const int pending = signals_->count;
    lastSignal_ = signals_->last;
    signals_->clear();
    signalsSeen_ += pending;

    const std::string name = signalName(lastSignal_);
    if (beginStop("Received " + name + ", shutting down")) {
        return true;
    }
    say(name + " ignored: shutdown already in progress");
    return false;
}

void ShutdownController::requestStop(const std::string& reason) {
    beginStop(reason);
}

bool ShutdownController::beginStop(const std::string& reason) {
    if (stopping_.exchange(true)) {
        return false;
    }
    say(reason);
    if (stopAction_) {
        stopAction_();
    }
    return true;
}

void ShutdownController::say(const std::string& message) const {
    if (announce_) {
        announce_(message);
    }
}

}  // namespace show_ingest::app
