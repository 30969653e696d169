#pragma once

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace show_ingest::metrics {

// Process-wide counters. Owned by the app and passed by reference; every
// field is a relaxed atomic so stages can bump them from their own thread.
struct PipelineStats {
    std::atomic<std::uint64_t> framesCaptured{0};
    std::atomic<std::uint64_t> framesXrun{0};
    std::atomic<std::uint64_t> framesProcessed{0};
    std::atomic<std::uint64_t> speechFrames{0};
    std::atomic<std::uint64_t> silentFrames{0};
    std::atomic<std::uint64_t> audioPublished{0};
    std::atomic<std::uint64_t> buttonAccepted{0};
    std::atomic<std::uint64_t> buttonDebounced{0};
    std::atomic<std::uint64_t> buttonUnmapped{0};
    std::atomic<std::uint64_t> dispatchSent{0};
    std::atomic<std::uint64_t> dispatchFailures{0};
    std::atomic<std::uint64_t> sessionRestarts{0};
    std::atomic<std::uint64_t> sessionsDead{0};

    static void bump(std::atomic<std::uint64_t>& counter, std::uint64_t n = 1) {
        counter.fetch_add(n, std::memory_order_relaxed);
    }

    nlohmann::json toJson() const;
};

inline nlohmann::json PipelineStats::toJson() const {
    auto load = [](const std::atomic<std::uint64_t>& c) {
        return c.load(std::memory_order_relaxed);
    };
    nlohmann::json j;
    j["audio"] = {{"captured", load(framesCaptured)},
                  {"xruns", load(framesXrun)},
                  {"processed", load(framesProcessed)},
                  {"speech", load(speechFrames)},
                  {"silent", load(silentFrames)},
                  {"published", load(audioPublished)}};
    j["buttons"] = {{"accepted", load(buttonAccepted)},
                    {"debounced", load(buttonDebounced)},
                    {"unmapped", load(buttonUnmapped)}};
    j["dispatch"] = {{"sent", load(dispatchSent)}, {"failures", load(dispatchFailures)}};
    j["sessions"] = {{"restarts", load(sessionRestarts)}, {"dead", load(sessionsDead)}};
    return j;
}

}  // namespace show_ingest::metrics
