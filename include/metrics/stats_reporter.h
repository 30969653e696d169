#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace show_ingest::metrics {

/**
 * @brief Periodic JSON stats snapshot on disk.
 *
 * Each write goes to "<path>.tmp" and is renamed over <path>, so a reader
 * polling the file sees either the previous snapshot or the new one. A
 * failing disk is logged once per failure streak, not on every tick.
 */
class StatsReporter {
   public:
    using Clock = std::chrono::steady_clock;
    using SnapshotFn = std::function<nlohmann::json()>;

    // Empty path disables reporting.
    StatsReporter(std::string path, std::chrono::milliseconds interval);

    StatsReporter(const StatsReporter&) = delete;
    StatsReporter& operator=(const StatsReporter&) = delete;

    // Builds and writes a snapshot if the interval has elapsed since the last
    // attempt. The first call always writes.
    bool tick(Clock::time_point now, const SnapshotFn& snapshot);

    bool write(const nlohmann::json& snapshot);

    void remove();

    bool enabled() const {
        return !path_.empty();
    }
    const std::string& path() const {
        return path_;
    }
    std::uint64_t writeCount() const {
        return writes_;
    }
    std::uint64_t failureCount() const {
        return failures_;
    }

   private:
    bool replaceFile(const std::string& text, std::string& error) const;

    std::string path_;
    std::chrono::milliseconds interval_;
    Clock::time_point nextDue_{};
    bool started_ = false;
    bool failing_ = false;
    std::uint64_t writes_ = 0;
    std::uint64_t failures_ = 0;
};

}  // namespace show_ingest::metrics
