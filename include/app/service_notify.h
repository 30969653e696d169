#pragma once

#include <string>

namespace show_ingest::app {

/**
 * @brief systemd service notifications (READY, WATCHDOG, STOPPING).
 *
 * Calls sd_notify when built with libsystemd (HAVE_SYSTEMD); otherwise only
 * the bookkeeping runs. READY and STOPPING are sent at most once, and
 * WATCHDOG only between the two.
 */
class ServiceNotifier {
   public:
    void notifyReady(const std::string& status);
    void notifyWatchdog();
    void notifyStopping();

    bool readyNotified() const {
        return readyNotified_;
    }
    bool stoppingNotified() const {
        return stoppingNotified_;
    }
    int watchdogCount() const {
        return watchdogCount_;
    }

   private:
    bool readyNotified_ = false;
    bool stoppingNotified_ = false;
    int watchdogCount_ = 0;
};

}  // namespace show_ingest::app
