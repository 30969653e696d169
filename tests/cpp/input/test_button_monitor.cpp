#include "core/stop_signal.h"
#include "device/device_registry.h"
#include "device/device_session.h"
#include "fakes/fake_devices.h"
#include "input/button_monitor.h"
#include "metrics/pipeline_stats.h"

#include <gtest/gtest.h>
#include <linux/input.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace show_ingest;
using namespace show_ingest::input;
using namespace std::chrono_literals;
using pipeline::Priority;
using pipeline::PriorityEnvelope;
using pipeline::QueueStatus;

namespace {

RawInputEvent keyEvent(std::uint16_t code, std::int32_t value, std::int64_t tsMs) {
    RawInputEvent ev;
    ev.type = EV_KEY;
    ev.code = code;
    ev.value = value;
    ev.timestampMs = tsMs;
    return ev;
}

RawInputEvent syncEvent(std::int64_t tsMs) {
    RawInputEvent ev;
    ev.type = EV_SYN;
    ev.code = SYN_REPORT;
    ev.timestampMs = tsMs;
    return ev;
}

ButtonDeviceConfig controllerConfig(int avatarId) {
    ButtonDeviceConfig config;
    config.path = "/dev/input/event" + std::to_string(avatarId + 10);
    config.avatarId = avatarId;
    config.grab = true;
    config.keys.bind(KeyCode::Space, ButtonAction::Speak);
    config.keys.bind(KeyCode::Esc, ButtonAction::Exit);
    return config;
}

ButtonDeviceConfig resetConfig() {
    ButtonDeviceConfig config;
    config.path = "/dev/input/event9";
    config.avatarId = kResetAvatarId;
    config.keys.bind(KeyCode::R, ButtonAction::Reset);
    return config;
}

}  // namespace

class ButtonMonitorTest : public ::testing::Test {
   protected:
    fakes::FakeInputSource source;
    pipeline::PriorityDispatchQueue queue;
    metrics::PipelineStats stats;

    PriorityEnvelope popOne() {
        PriorityEnvelope env;
        EXPECT_EQ(queue.pop(env, 1000ms), QueueStatus::Ok);
        return env;
    }
};

// ============================================================
// Event filtering
// ============================================================

TEST_F(ButtonMonitorTest, KeyDownOnMappedKeyBecomesAction) {
    ButtonMonitor monitor(controllerConfig(1), 200ms, source, queue, &stats);
    EXPECT_TRUE(monitor.handleEvent(keyEvent(KEY_SPACE, 1, 12345)));

    PriorityEnvelope env = popOne();
    EXPECT_EQ(env.priority, Priority::Standard);
    EXPECT_EQ(env.payload.kind, EventKind::Action);
    ASSERT_TRUE(env.payload.action.has_value());
    EXPECT_EQ(*env.payload.action, ButtonAction::Speak);
    EXPECT_FALSE(env.payload.status.has_value());
    EXPECT_EQ(env.payload.avatarId, 1);
    EXPECT_EQ(env.payload.sourceId, "/dev/input/event11");
    // Wall clock at acceptance, not the monotonic kernel stamp.
    EXPECT_GT(env.payload.timestamp, 1.0e9);

    EXPECT_EQ(monitor.acceptedCount(), 1u);
    EXPECT_EQ(stats.buttonAccepted.load(), 1u);
}

TEST_F(ButtonMonitorTest, KeyUpRepeatAndNonKeyEventsAreIgnored) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue, &stats);
    EXPECT_FALSE(monitor.handleEvent(keyEvent(KEY_SPACE, 0, 1000)));
    EXPECT_FALSE(monitor.handleEvent(keyEvent(KEY_SPACE, 2, 1000)));
    EXPECT_FALSE(monitor.handleEvent(syncEvent(1000)));
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(monitor.acceptedCount(), 0u);
    EXPECT_EQ(monitor.unmappedCount(), 0u);
    EXPECT_EQ(monitor.suppressedCount(), 0u);
}

TEST_F(ButtonMonitorTest, UnmappedKeysAreCounted) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue, &stats);
    EXPECT_FALSE(monitor.handleEvent(keyEvent(KEY_Q, 1, 1000)));
    EXPECT_FALSE(monitor.handleEvent(keyEvent(KEY_VOLUMEUP, 1, 1000)));
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(monitor.unmappedCount(), 2u);
    EXPECT_EQ(stats.buttonUnmapped.load(), 2u);
}

TEST_F(ButtonMonitorTest, DebounceIsPerDeviceAcrossKeys) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue, &stats);
    EXPECT_TRUE(monitor.handleEvent(keyEvent(KEY_SPACE, 1, 1000)));
    EXPECT_FALSE(monitor.handleEvent(keyEvent(KEY_SPACE, 1, 1199)));
    EXPECT_FALSE(monitor.handleEvent(keyEvent(KEY_ESC, 1, 1100)));
    EXPECT_TRUE(monitor.handleEvent(keyEvent(KEY_ESC, 1, 1200)));

    EXPECT_EQ(monitor.acceptedCount(), 2u);
    EXPECT_EQ(monitor.suppressedCount(), 2u);
    EXPECT_EQ(stats.buttonDebounced.load(), 2u);

    EXPECT_EQ(*popOne().payload.action, ButtonAction::Speak);
    EXPECT_EQ(*popOne().payload.action, ButtonAction::Exit);
}

TEST_F(ButtonMonitorTest, SeparateDevicesDebounceIndependently) {
    fakes::FakeInputSource other;
    ButtonMonitor first(controllerConfig(0), 200ms, source, queue);
    ButtonMonitor second(controllerConfig(1), 200ms, other, queue);
    EXPECT_TRUE(first.handleEvent(keyEvent(KEY_SPACE, 1, 1000)));
    EXPECT_TRUE(second.handleEvent(keyEvent(KEY_SPACE, 1, 1010)));
    EXPECT_EQ(queue.size(), 2u);
}

// ============================================================
// Priorities and status events
// ============================================================

TEST_F(ButtonMonitorTest, PriorityMapping) {
    EXPECT_EQ(ButtonMonitor::priorityFor(ButtonEvent::makeAction("r", -1, ButtonAction::Reset, 0)),
              Priority::High);
    EXPECT_EQ(ButtonMonitor::priorityFor(ButtonEvent::makeAction("a", 0, ButtonAction::Speak, 0)),
              Priority::Standard);
    EXPECT_EQ(ButtonMonitor::priorityFor(ButtonEvent::makeAction("a", 0, ButtonAction::Exit, 0)),
              Priority::Standard);
    EXPECT_EQ(ButtonMonitor::priorityFor(ButtonEvent::makeStatus("a", 0, ButtonStatus::Dead, 0)),
              Priority::High);
    EXPECT_EQ(
        ButtonMonitor::priorityFor(ButtonEvent::makeStatus("a", 0, ButtonStatus::Connected, 0)),
        Priority::Medium);
    EXPECT_EQ(
        ButtonMonitor::priorityFor(ButtonEvent::makeStatus("a", 0, ButtonStatus::Disconnected, 0)),
        Priority::Medium);
}

TEST_F(ButtonMonitorTest, ResetOvertakesQueuedSpeak) {
    fakes::FakeInputSource resetSource;
    ButtonMonitor controller(controllerConfig(0), 200ms, source, queue);
    ButtonMonitor reset(resetConfig(), 200ms, resetSource, queue);

    ASSERT_TRUE(controller.handleEvent(keyEvent(KEY_SPACE, 1, 1000)));
    ASSERT_TRUE(reset.handleEvent(keyEvent(KEY_R, 1, 1001)));

    PriorityEnvelope first = popOne();
    EXPECT_EQ(*first.payload.action, ButtonAction::Reset);
    EXPECT_EQ(first.payload.avatarId, kResetAvatarId);
    EXPECT_EQ(*popOne().payload.action, ButtonAction::Speak);
}

TEST_F(ButtonMonitorTest, SessionStatusBecomesStatusEvent) {
    ButtonMonitor monitor(controllerConfig(2), 200ms, source, queue);
    monitor.onSessionStatus(device::SessionStatus::Disconnected);
    monitor.onSessionStatus(device::SessionStatus::Dead);

    PriorityEnvelope dead = popOne();
    EXPECT_EQ(dead.priority, Priority::High);
    EXPECT_EQ(dead.payload.kind, EventKind::Status);
    EXPECT_EQ(*dead.payload.status, ButtonStatus::Dead);
    EXPECT_FALSE(dead.payload.action.has_value());
    EXPECT_EQ(dead.payload.avatarId, 2);
    EXPECT_GT(dead.payload.timestamp, 0.0);

    PriorityEnvelope gone = popOne();
    EXPECT_EQ(gone.priority, Priority::Medium);
    EXPECT_EQ(*gone.payload.status, ButtonStatus::Disconnected);
}

TEST_F(ButtonMonitorTest, ShutdownQueueDropsEventsQuietly) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue);
    queue.shutdown();
    EXPECT_TRUE(monitor.handleEvent(keyEvent(KEY_SPACE, 1, 1000)));
    monitor.onSessionStatus(device::SessionStatus::Connected);
    EXPECT_EQ(queue.size(), 0u);
}

// ============================================================
// Capability contract
// ============================================================

TEST_F(ButtonMonitorTest, OpenPassesPathAndGrab) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue);
    EXPECT_FALSE(monitor.open().has_value());
    EXPECT_EQ(source.openedPath, "/dev/input/event10");
    EXPECT_TRUE(source.grabbed);
    EXPECT_STREQ(monitor.kind(), "button");
    monitor.close();
    EXPECT_FALSE(source.grabbed);
}

TEST_F(ButtonMonitorTest, PollDeliversEventsReadBeforeError) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue);
    source.queueBatch({keyEvent(KEY_SPACE, 1, 1000), syncEvent(1000), keyEvent(KEY_SPACE, 0, 1050)});
    source.queueBatch({keyEvent(KEY_ESC, 1, 2000)}, device::ReadStatus::HardError);

    EXPECT_EQ(monitor.poll(10ms), device::ReadStatus::Data);
    EXPECT_EQ(monitor.poll(10ms), device::ReadStatus::HardError);
    EXPECT_EQ(monitor.poll(1ms), device::ReadStatus::Idle);

    EXPECT_EQ(monitor.acceptedCount(), 2u);
    EXPECT_EQ(*popOne().payload.action, ButtonAction::Speak);
    EXPECT_EQ(*popOne().payload.action, ButtonAction::Exit);
}

TEST_F(ButtonMonitorTest, SessionDrivesMonitorAndReportsConnected) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue);
    source.queueBatch({keyEvent(KEY_SPACE, 1, 5000)});

    device::SessionPolicy policy;
    policy.maxReconnectAttempts = 3;
    policy.backoff = 1ms;
    policy.livenessTimeout = 0ms;
    policy.restartDelay = 1ms;
    policy.pollInterval = 5ms;

    core::StopSignal stop;
    device::DeviceSession session(monitor, policy, stop);
    monitor.attach(session);
    session.start();

    PriorityEnvelope connected = popOne();
    EXPECT_EQ(connected.payload.kind, EventKind::Status);
    EXPECT_EQ(*connected.payload.status, ButtonStatus::Connected);

    PriorityEnvelope speak = popOne();
    EXPECT_EQ(speak.payload.kind, EventKind::Action);
    EXPECT_EQ(*speak.payload.action, ButtonAction::Speak);

    stop.requestStop();
    session.join();
}

TEST_F(ButtonMonitorTest, ReconnectKeepsMapDebounceAndReannounces) {
    ButtonMonitor monitor(controllerConfig(0), 200ms, source, queue, &stats);
    const std::string path = "/dev/input/event10";
    source.queueBatch({keyEvent(KEY_SPACE, 1, 1000)});
    // Bounce arrives together with the unplug.
    source.queueBatch({keyEvent(KEY_SPACE, 1, 1100)}, device::ReadStatus::HardError);
    // After the reopen: still inside the window, then a different mapped key.
    source.queueBatch({keyEvent(KEY_SPACE, 1, 1150), keyEvent(KEY_ESC, 1, 1300)});

    device::SessionPolicy policy;
    policy.maxReconnectAttempts = 3;
    policy.backoff = 1ms;
    policy.livenessTimeout = 0ms;
    policy.restartDelay = 1ms;
    policy.pollInterval = 5ms;

    core::StopSignal stop;
    device::DeviceRegistry registry;
    device::DeviceSession session(monitor, policy, stop, &registry);
    monitor.attach(session);

    std::mutex mutex;
    std::vector<bool> registeredAtDisconnect;
    session.setTransitionCallback([&](const device::SessionTransition& t) {
        if (t.from == device::SessionState::Active && t.to == device::SessionState::Disconnected) {
            std::lock_guard<std::mutex> lock(mutex);
            registeredAtDisconnect.push_back(registry.contains(path));
        }
    });
    session.start();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (monitor.acceptedCount() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(registry.contains(path));
    stop.requestStop();
    session.join();

    EXPECT_EQ(source.openCalls.load(), 2);
    EXPECT_EQ(monitor.acceptedCount(), 2u);
    EXPECT_EQ(monitor.suppressedCount(), 2u);
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(registeredAtDisconnect, std::vector<bool>{false});
    }

    // Statuses (Medium) drain ahead of actions (Standard), each in arrival order.
    const PriorityEnvelope first = popOne();
    const PriorityEnvelope second = popOne();
    const PriorityEnvelope third = popOne();
    EXPECT_EQ(*first.payload.status, ButtonStatus::Connected);
    EXPECT_EQ(*second.payload.status, ButtonStatus::Disconnected);
    EXPECT_EQ(*third.payload.status, ButtonStatus::Connected);
    EXPECT_EQ(second.priority, Priority::Medium);

    const PriorityEnvelope speak = popOne();
    const PriorityEnvelope exitAction = popOne();
    EXPECT_EQ(*speak.payload.action, ButtonAction::Speak);
    EXPECT_EQ(*exitAction.payload.action, ButtonAction::Exit);
    EXPECT_EQ(exitAction.priority, Priority::Standard);
    EXPECT_EQ(exitAction.payload.avatarId, 0);

    PriorityEnvelope extra;
    EXPECT_EQ(queue.pop(extra, 10ms), QueueStatus::Empty);
}
