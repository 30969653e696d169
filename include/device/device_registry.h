#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace show_ingest::device {

struct RegisteredDevice {
    std::string path;
    std::string kind;  // "mic", "button"
    std::chrono::steady_clock::time_point since{};
};

/**
 * @brief Live device table shared by the session group.
 *
 * The mutex is held only for the map operation itself. Owned by the app
 * and handed to sessions by pointer.
 */
class DeviceRegistry {
   public:
    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Returns false if the path was already registered (entry is refreshed).
    bool add(const std::string& path, const std::string& kind);
    // Returns false if the path was not registered.
    bool remove(const std::string& path);

    bool contains(const std::string& path) const;
    std::size_t size() const;
    std::vector<RegisteredDevice> snapshot() const;

   private:
    mutable std::mutex mutex_;
    std::map<std::string, RegisteredDevice> devices_;
};

}  // namespace show_ingest::device
