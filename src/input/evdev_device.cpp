#include "input/evdev_device.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <time.h>
#include <unistd.h>

namespace show_ingest::input {

EvdevDevice::~EvdevDevice() {
    close();
}

std::optional<DeviceError> EvdevDevice::open(const std::string& path, bool grab) {
    close();
    lastError_.reset();

    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        ErrorCode code = (err == ENOENT || err == ENODEV) ? ErrorCode::DEVICE_NOT_FOUND
                                                         : ErrorCode::DEVICE_OPEN_FAILED;
        return DeviceError(code, "open(" + path + ") failed: " + std::strerror(err), err);
    }

    if (grab) {
        if (::ioctl(fd, EVIOCGRAB, 1) < 0) {
            const int err = errno;
            ::close(fd);
            return DeviceError(ErrorCode::DEVICE_GRAB_FAILED,
                               "EVIOCGRAB(" + path + ") failed: " + std::strerror(err), err);
        }
        grabbed_ = true;
    }

    // Event stamps feed the debouncer; a stepped wall clock must not freeze it.
    int clockId = CLOCK_MONOTONIC;
    if (::ioctl(fd, EVIOCSCLOCKID, &clockId) < 0) {
        LOG_WARN("[Button:{}] EVIOCSCLOCKID failed, keeping realtime stamps: {}", path,
                 std::strerror(errno));
    }

    fd_ = fd;
    path_ = path;
    LOG_INFO("[Button:{}] Opened{}", path_, grabbed_ ? " (grabbed)" : "");
    return std::nullopt;
}

void EvdevDevice::close() {
    if (fd_ < 0) {
        return;
    }
    if (grabbed_) {
        // Fails harmlessly if the device is already gone.
        if (::ioctl(fd_, EVIOCGRAB, 0) < 0) {
            LOG_DEBUG("[Button:{}] Ungrab failed: {}", path_, std::strerror(errno));
        }
        grabbed_ = false;
    }
    ::close(fd_);
    fd_ = -1;
    LOG_INFO("[Button:{}] Closed", path_);
}

device::ReadStatus EvdevDevice::hardError(const std::string& what, int err) {
    ErrorCode code = (err == ENODEV || err == EBADF) ? ErrorCode::DEVICE_DISCONNECTED
                                                      : ErrorCode::DEVICE_IO_ERROR;
    lastError_ = DeviceError(code, what + ": " + std::strerror(err), err);
    return device::ReadStatus::HardError;
}

device::ReadStatus EvdevDevice::read(std::vector<RawInputEvent>& out,
                                     std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return hardError("read on closed device", EBADF);
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
        return device::ReadStatus::Idle;
    }
    if (ready < 0) {
        if (errno == EINTR) {
            return device::ReadStatus::Idle;
        }
        return hardError("poll failed", errno);
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        return hardError("device hung up", ENODEV);
    }

    std::size_t appended = 0;
    while (true) {
        input_event ev{};
        const ssize_t n = ::read(fd_, &ev, sizeof(ev));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            return hardError("read failed", errno);
        }
        if (n == 0) {
            return hardError("end of stream", ENODEV);
        }
        if (static_cast<std::size_t>(n) != sizeof(ev)) {
            LOG_WARN("[Button:{}] Short read ({} bytes), skipping", path_, n);
            continue;
        }

        RawInputEvent raw;
        raw.type = ev.type;
        raw.code = ev.code;
        raw.value = ev.value;
        raw.timestampMs = static_cast<std::int64_t>(ev.input_event_sec) * 1000 +
                          static_cast<std::int64_t>(ev.input_event_usec) / 1000;
        out.push_back(raw);
        ++appended;
    }
    return appended > 0 ? device::ReadStatus::Data : device::ReadStatus::Idle;
}

}  // namespace show_ingest::input
