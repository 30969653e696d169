#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace show_ingest::input {

// Per-device debounce window keyed on monotonic event timestamps (milliseconds).
// An event is suppressed while lastAccepted <= timestamp < lastAccepted + window.
// A timestamp earlier than lastAccepted means the clock base changed and is
// accepted as the new reference.
class Debouncer {
   public:
    explicit Debouncer(std::chrono::milliseconds window) : window_(window.count()) {
        if (window_ <= 0) {
            throw std::invalid_argument("debounce window must be positive");
        }
    }

    bool accept(std::int64_t timestampMs) {
        if (lastAcceptedMs_ && timestampMs >= *lastAcceptedMs_ &&
            timestampMs < *lastAcceptedMs_ + window_) {
            return false;
        }
        lastAcceptedMs_ = timestampMs;
        return true;
    }

    std::optional<std::int64_t> lastAccepted() const {
        return lastAcceptedMs_;
    }

    std::int64_t windowMs() const {
        return window_;
    }

   private:
    std::int64_t window_;
    std::optional<std::int64_t> lastAcceptedMs_;
};

}  // namespace show_ingest::input
