#include "core/stop_signal.h"
#include "device/device_registry.h"
#include "device/device_session.h"
#include "fakes/fake_devices.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace show_ingest;
using namespace show_ingest::device;
using namespace std::chrono_literals;
using fakes::ScriptedCapability;

namespace {

SessionPolicy fastPolicy() {
    SessionPolicy policy;
    policy.maxReconnectAttempts = 3;
    policy.backoff = 1ms;
    policy.errorBurstThreshold = 3;
    policy.livenessTimeout = 0ms;
    policy.restartDelay = 1ms;
    policy.pollInterval = 5ms;
    return policy;
}

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

// Collects callbacks fired on the session thread.
class Recorder {
   public:
    void attach(DeviceSession& session) {
        session.setStatusCallback([this](SessionStatus status, const DeviceHealth&) {
            std::lock_guard<std::mutex> lock(mutex_);
            statuses_.push_back(status);
        });
        session.setTransitionCallback([this](const SessionTransition& t) {
            std::lock_guard<std::mutex> lock(mutex_);
            transitions_.push_back(t);
        });
    }

    std::vector<SessionStatus> statuses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }
    std::vector<SessionTransition> transitions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transitions_;
    }
    int countStatus(SessionStatus s) const {
        auto all = statuses();
        return static_cast<int>(std::count(all.begin(), all.end(), s));
    }
    int countState(SessionState s) const {
        int n = 0;
        for (const auto& t : transitions()) {
            n += (t.to == s) ? 1 : 0;
        }
        return n;
    }
    std::optional<SessionTransition> firstInto(SessionState s) const {
        for (const auto& t : transitions()) {
            if (t.to == s) {
                return t;
            }
        }
        return std::nullopt;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<SessionStatus> statuses_;
    std::vector<SessionTransition> transitions_;
};

}  // namespace

// ============================================================
// Construction
// ============================================================

TEST(DeviceSession, RejectsDegeneratePolicy) {
    ScriptedCapability cap("dev");
    core::StopSignal stop;

    SessionPolicy noAttempts = fastPolicy();
    noAttempts.maxReconnectAttempts = 0;
    EXPECT_THROW(DeviceSession(cap, noAttempts, stop), std::invalid_argument);

    SessionPolicy noBurst = fastPolicy();
    noBurst.errorBurstThreshold = 0;
    EXPECT_THROW(DeviceSession(cap, noBurst, stop), std::invalid_argument);
}

TEST(DeviceSession, StateNames) {
    EXPECT_STREQ(sessionStateToString(SessionState::PermanentlyFailed), "PermanentlyFailed");
    EXPECT_STREQ(sessionStateToString(SessionState::Active), "Active");
}

// ============================================================
// Reconnect budget
// ============================================================

TEST(DeviceSession, DeadExactlyOnceAfterMaxFailedOpens) {
    ScriptedCapability cap("/dev/input/event7", "button");
    cap.failAllOpens();
    core::StopSignal stop;
    DeviceSession session(cap, fastPolicy(), stop);
    Recorder rec;
    rec.attach(session);

    EXPECT_EQ(session.run(), SessionState::PermanentlyFailed);
    EXPECT_EQ(session.state(), SessionState::PermanentlyFailed);
    EXPECT_EQ(cap.openCalls(), 3);
    EXPECT_EQ(rec.countStatus(SessionStatus::Dead), 1);
    EXPECT_EQ(rec.countStatus(SessionStatus::Connected), 0);
    EXPECT_EQ(session.health().reconnectAttempts, 3u);

    auto dead = rec.firstInto(SessionState::PermanentlyFailed);
    ASSERT_TRUE(dead.has_value());
    ASSERT_TRUE(dead->cause.has_value());
    EXPECT_EQ(dead->cause->code, ErrorCode::DEVICE_RETRY_EXHAUSTED);
    EXPECT_EQ(dead->from, SessionState::Disconnected);
}

TEST(DeviceSession, SuccessfulOpenResetsAttemptCounter) {
    ScriptedCapability cap("mic");
    cap.scriptOpens({DeviceError(ErrorCode::DEVICE_NOT_FOUND, "absent"),
                     DeviceError(ErrorCode::DEVICE_NOT_FOUND, "absent"), std::nullopt});
    core::StopSignal stop;
    DeviceRegistry registry;
    DeviceSession session(cap, fastPolicy(), stop, &registry);
    Recorder rec;
    rec.attach(session);

    session.start();
    ASSERT_TRUE(waitFor([&] { return session.state() == SessionState::Active; }));
    EXPECT_EQ(session.health().reconnectAttempts, 0u);
    EXPECT_EQ(session.health().totalErrors, 2u);
    EXPECT_TRUE(registry.contains("mic"));

    stop.requestStop();
    session.join();
    EXPECT_EQ(rec.countStatus(SessionStatus::Connected), 1);
    EXPECT_EQ(rec.countStatus(SessionStatus::Dead), 0);
    EXPECT_FALSE(registry.contains("mic"));
    EXPECT_GE(cap.closeCalls(), 1);
}

// ============================================================
// Degraded restarts
// ============================================================

TEST(DeviceSession, XrunBurstRestartsStream) {
    ScriptedCapability cap("mic");
    cap.scriptPolls({ReadStatus::Xrun, ReadStatus::Xrun, ReadStatus::Xrun});
    core::StopSignal stop;
    DeviceSession session(cap, fastPolicy(), stop);
    Recorder rec;
    rec.attach(session);

    session.start();
    ASSERT_TRUE(waitFor([&] { return cap.openCalls() >= 2; }));
    ASSERT_TRUE(waitFor([&] { return session.state() == SessionState::Active; }));
    stop.requestStop();
    session.join();

    auto degraded = rec.firstInto(SessionState::Degraded);
    ASSERT_TRUE(degraded.has_value());
    ASSERT_TRUE(degraded->cause.has_value());
    EXPECT_EQ(degraded->cause->code, ErrorCode::AUDIO_XRUN_BURST);
    EXPECT_EQ(degraded->from, SessionState::Active);
    EXPECT_EQ(session.health().restarts, 1u);
    EXPECT_EQ(session.health().consecutiveErrors, 0u);
    // A restart is not a disconnect: no extra status events.
    EXPECT_EQ(rec.countStatus(SessionStatus::Connected), 1);
    EXPECT_EQ(rec.countStatus(SessionStatus::Disconnected), 0);
}

TEST(DeviceSession, DataBetweenXrunsResetsBurst) {
    ScriptedCapability cap("mic");
    cap.scriptPolls({ReadStatus::Xrun, ReadStatus::Xrun, ReadStatus::Data, ReadStatus::Xrun,
                     ReadStatus::Xrun, ReadStatus::Data});
    core::StopSignal stop;
    DeviceSession session(cap, fastPolicy(), stop);
    Recorder rec;
    rec.attach(session);

    session.start();
    ASSERT_TRUE(waitFor([&] { return cap.pollCalls() >= 8; }));
    stop.requestStop();
    session.join();

    EXPECT_EQ(rec.countState(SessionState::Degraded), 0);
    EXPECT_EQ(cap.openCalls(), 1);
    EXPECT_EQ(session.health().totalErrors, 4u);
}

TEST(DeviceSession, HeartbeatTimeoutDegrades) {
    ScriptedCapability cap("mic");
    core::StopSignal stop;
    SessionPolicy policy = fastPolicy();
    policy.livenessTimeout = 20ms;
    DeviceSession session(cap, policy, stop);
    Recorder rec;
    rec.attach(session);

    session.start();
    ASSERT_TRUE(waitFor([&] { return rec.countState(SessionState::Degraded) >= 1; }));
    stop.requestStop();
    session.join();

    auto degraded = rec.firstInto(SessionState::Degraded);
    ASSERT_TRUE(degraded.has_value());
    ASSERT_TRUE(degraded->cause.has_value());
    EXPECT_EQ(degraded->cause->code, ErrorCode::AUDIO_HEARTBEAT_TIMEOUT);
}

TEST(DeviceSession, StalledDeviceGoesDeadAfterCap) {
    ScriptedCapability cap("mic");
    core::StopSignal stop;
    DeviceRegistry registry;
    SessionPolicy policy = fastPolicy();
    policy.maxReconnectAttempts = 2;
    policy.livenessTimeout = 10ms;
    DeviceSession session(cap, policy, stop, &registry);
    Recorder rec;
    rec.attach(session);

    // Opens always succeed, polls are always Idle.
    EXPECT_EQ(session.run(), SessionState::PermanentlyFailed);
    EXPECT_EQ(cap.openCalls(), 2);
    EXPECT_EQ(session.health().restarts, 2u);
    EXPECT_EQ(session.health().stalledRestarts, 2u);
    EXPECT_EQ(rec.countStatus(SessionStatus::Dead), 1);
    EXPECT_FALSE(registry.contains("mic"));

    auto dead = rec.firstInto(SessionState::PermanentlyFailed);
    ASSERT_TRUE(dead.has_value());
    ASSERT_TRUE(dead->cause.has_value());
    EXPECT_EQ(dead->cause->code, ErrorCode::DEVICE_RETRY_EXHAUSTED);
    EXPECT_EQ(dead->from, SessionState::Degraded);
}

TEST(DeviceSession, DataAfterReopenClearsStallCount) {
    ScriptedCapability cap("mic");
    cap.scriptPolls({ReadStatus::Xrun, ReadStatus::Xrun, ReadStatus::Xrun, ReadStatus::Data,
                     ReadStatus::Xrun, ReadStatus::Xrun, ReadStatus::Xrun});
    core::StopSignal stop;
    SessionPolicy policy = fastPolicy();
    policy.maxReconnectAttempts = 2;
    DeviceSession session(cap, policy, stop);
    Recorder rec;
    rec.attach(session);

    session.start();
    ASSERT_TRUE(waitFor([&] { return cap.openCalls() >= 3; }));
    ASSERT_TRUE(waitFor([&] { return session.state() == SessionState::Active; }));
    stop.requestStop();
    session.join();

    EXPECT_EQ(session.health().restarts, 2u);
    EXPECT_EQ(session.health().stalledRestarts, 1u);
    EXPECT_EQ(rec.countStatus(SessionStatus::Dead), 0);
}

// ============================================================
// Hard errors
// ============================================================

TEST(DeviceSession, HardErrorAnnouncesDisconnectAndReconnects) {
    ScriptedCapability cap("/dev/input/event3", "button");
    cap.scriptPolls({ReadStatus::HardError});
    cap.setLastError(DeviceError(ErrorCode::DEVICE_DISCONNECTED, "unplugged", 19));
    core::StopSignal stop;
    DeviceRegistry registry;
    DeviceSession session(cap, fastPolicy(), stop, &registry);
    Recorder rec;
    rec.attach(session);

    session.start();
    ASSERT_TRUE(waitFor([&] { return rec.countStatus(SessionStatus::Connected) >= 2; }));
    EXPECT_TRUE(registry.contains("/dev/input/event3"));
    stop.requestStop();
    session.join();

    auto statuses = rec.statuses();
    ASSERT_GE(statuses.size(), 3u);
    EXPECT_EQ(statuses[0], SessionStatus::Connected);
    EXPECT_EQ(statuses[1], SessionStatus::Disconnected);
    EXPECT_EQ(statuses[2], SessionStatus::Connected);

    bool sawCause = false;
    for (const auto& t : rec.transitions()) {
        if (t.from == SessionState::Active && t.to == SessionState::Disconnected) {
            ASSERT_TRUE(t.cause.has_value());
            EXPECT_EQ(t.cause->code, ErrorCode::DEVICE_DISCONNECTED);
            sawCause = true;
        }
    }
    EXPECT_TRUE(sawCause);
    EXPECT_EQ(session.health().restarts, 0u);
}

TEST(DeviceSession, HardErrorThenAbsentDeviceGoesDead) {
    ScriptedCapability cap("/dev/input/event3", "button");
    cap.scriptPolls({ReadStatus::HardError});
    core::StopSignal stop;
    DeviceSession session(cap, fastPolicy(), stop);

    // First open succeeds, then the device never comes back.
    session.setTransitionCallback([&cap](const SessionTransition& t) {
        if (t.to == SessionState::Active) {
            cap.failAllOpens();
        }
    });
    std::vector<SessionStatus> statuses;
    session.setStatusCallback(
        [&statuses](SessionStatus s, const DeviceHealth&) { statuses.push_back(s); });

    EXPECT_EQ(session.run(), SessionState::PermanentlyFailed);
    EXPECT_EQ(cap.openCalls(), 1 + 3);
    EXPECT_EQ(statuses, (std::vector<SessionStatus>{SessionStatus::Connected,
                                                   SessionStatus::Disconnected,
                                                   SessionStatus::Dead}));
}

// ============================================================
// Cancellation
// ============================================================

TEST(DeviceSession, StopInterruptsBackoff) {
    ScriptedCapability cap("mic");
    cap.failAllOpens();
    core::StopSignal stop;
    SessionPolicy policy = fastPolicy();
    policy.maxReconnectAttempts = 100;
    policy.backoff = 10s;
    DeviceSession session(cap, policy, stop);

    session.start();
    ASSERT_TRUE(waitFor([&] { return cap.openCalls() >= 1; }));
    const auto start = std::chrono::steady_clock::now();
    stop.requestStop();
    session.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(cap.openCalls(), 1);
    EXPECT_EQ(session.state(), SessionState::Disconnected);
}

TEST(DeviceSession, StopWhileActiveClosesDevice) {
    ScriptedCapability cap("mic");
    core::StopSignal stop;
    DeviceSession session(cap, fastPolicy(), stop);

    session.start();
    ASSERT_TRUE(waitFor([&] { return session.state() == SessionState::Active; }));
    stop.requestStop();
    session.join();
    EXPECT_EQ(cap.closeCalls(), 1);
    EXPECT_EQ(session.state(), SessionState::Disconnected);
}
