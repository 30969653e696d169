#include "app/instance_lock.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace show_ingest::app {

namespace {

bool writePid(int fd) {
    const std::string text = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0 || lseek(fd, 0, SEEK_SET) < 0) {
        return false;
    }
    const ssize_t written = ::write(fd, text.data(), text.size());
    return written == static_cast<ssize_t>(text.size()) && fsync(fd) == 0;
}

}  // namespace

InstanceLock::InstanceLock(std::string pidFile) : pidFile_(std::move(pidFile)) {}

InstanceLock::~InstanceLock() {
    release();
}

int InstanceLock::recordedPid(const std::string& pidFile) {
    std::ifstream in(pidFile);
    int pid = 0;
    if (!(in >> pid) || pid <= 0) {
        return 0;
    }
    return pid;
}

LockAttempt InstanceLock::acquire() {
    LockAttempt attempt;
    if (held()) {
        attempt.status = LockStatus::Acquired;
        return attempt;
    }

    const int fd = ::open(pidFile_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        attempt.detail = std::strerror(errno);
        return attempt;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            attempt.status = LockStatus::HeldByOther;
            attempt.ownerPid = recordedPid(pidFile_);
        } else {
            attempt.detail = std::strerror(err);
        }
        return attempt;
    }

    if (!writePid(fd)) {
        // Still locked, so this instance is the owner; only the PID text is missing.
        LOG_WARN("[Lock] Could not record PID in {}: {}", pidFile_, std::strerror(errno));
    }

    fd_ = fd;
    attempt.status = LockStatus::Acquired;
    LOG_DEBUG("[Lock] Holding {}", pidFile_);
    return attempt;
}

void InstanceLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // Unlink before unlocking; a waiting instance then creates a fresh file.
    ::unlink(pidFile_.c_str());
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace show_ingest::app
