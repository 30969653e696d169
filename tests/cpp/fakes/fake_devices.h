#pragma once

// Scripted stand-ins for hardware and transport seams.

#include "audio/pcm_source.h"
#include "device/device_session.h"
#include "input/evdev_device.h"
#include "transport/publisher.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace show_ingest::fakes {

// Sleeps a little on Idle so a session thread never spins.
inline void idleWait(std::chrono::milliseconds timeout) {
    std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(2)));
}

class ScriptedCapability : public device::DeviceCapability {
   public:
    explicit ScriptedCapability(std::string id, const char* kind = "fake")
        : id_(std::move(id)), kind_(kind) {}

    const std::string& deviceId() const override {
        return id_;
    }
    const char* kind() const override {
        return kind_;
    }

    // Results for successive open() calls; success once exhausted.
    void scriptOpens(std::vector<std::optional<DeviceError>> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        opens_.assign(results.begin(), results.end());
    }
    void failAllOpens() {
        std::lock_guard<std::mutex> lock(mutex_);
        failForever_ = true;
    }
    // Results for successive poll() calls; Idle once exhausted.
    void scriptPolls(std::vector<device::ReadStatus> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        polls_.insert(polls_.end(), results.begin(), results.end());
    }
    void setLastError(DeviceError err) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = std::move(err);
    }

    std::optional<DeviceError> open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++openCalls_;
        if (failForever_) {
            return DeviceError(ErrorCode::DEVICE_NOT_FOUND, "scripted: absent");
        }
        if (opens_.empty()) {
            return std::nullopt;
        }
        auto result = opens_.front();
        opens_.pop_front();
        return result;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closeCalls_;
    }

    device::ReadStatus poll(std::chrono::milliseconds timeout) override {
        std::optional<device::ReadStatus> next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++pollCalls_;
            if (!polls_.empty()) {
                next = polls_.front();
                polls_.pop_front();
            }
        }
        if (!next) {
            idleWait(timeout);
            return device::ReadStatus::Idle;
        }
        return *next;
    }

    std::optional<DeviceError> lastError() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastError_;
    }

    int openCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return openCalls_;
    }
    int closeCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeCalls_;
    }
    int pollCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pollCalls_;
    }

   private:
    std::string id_;
    const char* kind_;
    mutable std::mutex mutex_;
    std::deque<std::optional<DeviceError>> opens_;
    std::deque<device::ReadStatus> polls_;
    std::optional<DeviceError> lastError_;
    bool failForever_ = false;
    int openCalls_ = 0;
    int closeCalls_ = 0;
    int pollCalls_ = 0;
};

class FakePcmSource : public audio::PcmSource {
   public:
    // Hardware answer; zero fields echo the request.
    audio::NegotiatedPcm hardware;
    std::optional<DeviceError> openError;

    void queueRead(device::ReadStatus status, std::vector<std::uint8_t> data = {}) {
        reads_.emplace_back(status, std::move(data));
    }

    std::optional<DeviceError> open(const audio::PcmConfig& config,
                                    audio::NegotiatedPcm& out) override {
        lastRequest = config;
        if (openError) {
            return openError;
        }
        out = hardware;
        out.deviceName = hardware.deviceName.empty() ? config.deviceHint : hardware.deviceName;
        out.sampleRate = hardware.sampleRate ? hardware.sampleRate : config.sampleRate;
        out.channels = hardware.channels ? hardware.channels : config.channels;
        out.periodFrames = hardware.periodFrames ? hardware.periodFrames : config.periodFrames;
        out.resampleRequired = out.sampleRate != config.sampleRate;
        isOpen = true;
        return std::nullopt;
    }

    void close() override {
        isOpen = false;
    }

    device::ReadStatus read(std::vector<std::uint8_t>& out,
                            std::chrono::milliseconds timeout) override {
        if (reads_.empty()) {
            idleWait(timeout);
            return device::ReadStatus::Idle;
        }
        auto [status, data] = std::move(reads_.front());
        reads_.pop_front();
        out = std::move(data);
        return status;
    }

    audio::PcmConfig lastRequest;
    bool isOpen = false;

   private:
    std::deque<std::pair<device::ReadStatus, std::vector<std::uint8_t>>> reads_;
};

class FakeInputSource : public input::InputEventSource {
   public:
    void queueBatch(std::vector<input::RawInputEvent> events,
                    device::ReadStatus status = device::ReadStatus::Data) {
        batches_.emplace_back(status, std::move(events));
    }

    std::optional<DeviceError> open(const std::string& path, bool grab) override {
        ++openCalls;
        openedPath = path;
        grabbed = grab;
        return std::nullopt;
    }
    void close() override {
        grabbed = false;
    }

    device::ReadStatus read(std::vector<input::RawInputEvent>& out,
                            std::chrono::milliseconds timeout) override {
        if (batches_.empty()) {
            idleWait(timeout);
            return device::ReadStatus::Idle;
        }
        auto [status, events] = std::move(batches_.front());
        batches_.pop_front();
        out.insert(out.end(), events.begin(), events.end());
        return status;
    }

    std::string openedPath;
    bool grabbed = false;
    std::atomic<int> openCalls{0};

   private:
    std::deque<std::pair<device::ReadStatus, std::vector<input::RawInputEvent>>> batches_;
};

class RecordingPublisher : public transport::Publisher {
   public:
    enum class Mode { Accept, Fail, Throw };

    bool publish(const std::string& subject, const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mode_ == Mode::Throw) {
            throw std::runtime_error("scripted transport failure");
        }
        if (mode_ == Mode::Fail) {
            return false;
        }
        messages_.emplace_back(subject, payload);
        return true;
    }

    const char* name() const override {
        return "recording";
    }

    void setMode(Mode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
    }

    std::vector<std::pair<std::string, std::string>> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

   private:
    mutable std::mutex mutex_;
    Mode mode_ = Mode::Accept;
    std::vector<std::pair<std::string, std::string>> messages_;
};

}  // namespace show_ingest::fakes
