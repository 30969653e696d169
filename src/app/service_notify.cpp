#include "app/service_notify.h"

#include "logging/logger.h"

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace show_ingest::app {

void ServiceNotifier::notifyReady(const std::string& status) {
    if (readyNotified_) {
        return;
    }
    readyNotified_ = true;
#ifdef HAVE_SYSTEMD
    const std::string message = "READY=1\nSTATUS=" + status + "\n";
    sd_notify(0, message.c_str());
    LOG_INFO("[Service] systemd: Notified READY=1");
#else
    LOG_DEBUG("[Service] Ready: {}", status);
#endif
}

void ServiceNotifier::notifyWatchdog() {
    if (!readyNotified_ || stoppingNotified_) {
        return;
    }
    ++watchdogCount_;
#ifdef HAVE_SYSTEMD
    sd_notify(0, "WATCHDOG=1");
#endif
}

void ServiceNotifier::notifyStopping() {
    if (stoppingNotified_) {
        return;
    }
    stoppingNotified_ = true;
#ifdef HAVE_SYSTEMD
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
    LOG_INFO("[Service] systemd: Notified STOPPING=1");
#endif
}

}  // namespace show_ingest::app
