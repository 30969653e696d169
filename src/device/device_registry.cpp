#include "device/device_registry.h"

namespace show_ingest::device {

bool DeviceRegistry::add(const std::string& path, const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    RegisteredDevice entry{path, kind, std::chrono::steady_clock::now()};
    auto [it, inserted] = devices_.insert_or_assign(path, std::move(entry));
    (void)it;
    return inserted;
}

bool DeviceRegistry::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.erase(path) > 0;
}

bool DeviceRegistry::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.count(path) > 0;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

std::vector<RegisteredDevice> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RegisteredDevice> out;
    out.reserve(devices_.size());
    for (const auto& [path, entry] : devices_) {
        (void)path;
        out.push_back(entry);
    }
    return out;
}

}  // namespace show_ingest::device
