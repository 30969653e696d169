#include "metrics/stats_reporter.h"

#include "logging/logger.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace show_ingest::metrics {

namespace fs = std::filesystem;

StatsReporter::StatsReporter(std::string path, std::chrono::milliseconds interval)
    : path_(std::move(path)), interval_(interval) {}

bool StatsReporter::tick(Clock::time_point now, const SnapshotFn& snapshot) {
    if (!enabled() || (started_ && now < nextDue_)) {
        return false;
    }
    started_ = true;
    nextDue_ = now + interval_;
    return write(snapshot());
}

bool StatsReporter::write(const nlohmann::json& snapshot) {
    if (!enabled()) {
        return false;
    }
    std::string error;
    if (!replaceFile(snapshot.dump(2) + "\n", error)) {
        ++failures_;
        if (!failing_) {
            LOG_WARN("[Stats] Cannot update {}: {}", path_, error);
            failing_ = true;
        }
        return false;
    }
    if (failing_) {
        LOG_INFO("[Stats] {} writable again", path_);
        failing_ = false;
    }
    ++writes_;
    return true;
}

bool StatsReporter::replaceFile(const std::string& text, std::string& error) const {
    const std::string staging = path_ + ".tmp";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot open " + staging;
            return false;
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            error = "short write to " + staging;
            return false;
        }
    }
    std::error_code ec;
    fs::rename(staging, path_, ec);
    if (ec) {
        error = ec.message();
        fs::remove(staging, ec);
        return false;
    }
    return true;
}

void StatsReporter::remove() {
    if (!enabled()) {
        return;
    }
    std::error_code ec;
    if (!fs::remove(path_, ec) && ec) {
        LOG_DEBUG("[Stats] Leaving {}: {}", path_, ec.message());
    }
}

}  // namespace show_ingest::metrics
