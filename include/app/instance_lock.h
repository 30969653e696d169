#pragma once

#include <string>

namespace show_ingest::app {

enum class LockStatus { Acquired, HeldByOther, IoError };

struct LockAttempt {
    LockStatus status = LockStatus::IoError;
    int ownerPid = 0;    // HeldByOther: PID recorded by the holder, 0 if unknown
    std::string detail;  // IoError: strerror text
};

/**
 * @brief One ingest process per PID file.
 *
 * The file is flock()ed for the lifetime of the object and carries our PID
 * so operators (and a second instance) can see who owns it. A file left by
 * a crashed process is not locked and is simply taken over.
 */
class InstanceLock {
   public:
    explicit InstanceLock(std::string pidFile);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    LockAttempt acquire();

    // Unlinks the file and drops the lock. Safe to call when not held.
    void release() noexcept;

    bool held() const {
        return fd_ >= 0;
    }
    const std::string& pidFile() const {
        return pidFile_;
    }

    static int recordedPid(const std::string& pidFile);

   private:
    std::string pidFile_;
    int fd_ = -1;
};

}  // namespace show_ingest::app
