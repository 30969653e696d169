#pragma once

#include "audio/audio_frame.h"
#include "device/device_session.h"
#include "input/button_event.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace show_ingest::transport {

constexpr int kButtonRecordVersion = 1;
constexpr int kAudioRecordVersion = 1;
constexpr int kMicStatusRecordVersion = 1;

// Mic session status, published on the audio subject next to the frames it
// concerns.
struct MicStatus {
    int sourceId = 0;
    std::string device;  // configured card name
    device::SessionStatus status = device::SessionStatus::Connected;
    std::uint32_t reconnectAttempts = 0;
    std::uint32_t restarts = 0;
    double timestamp = 0.0;  // wall clock seconds
};

// Wire records. Absent optional fields encode as JSON null.
nlohmann::json buttonEventToJson(const input::ButtonEvent& event);
nlohmann::json audioFrameToJson(const audio::TaggedAudioFrame& tagged);
nlohmann::json micStatusToJson(const MicStatus& status);

std::string encodeButtonEvent(const input::ButtonEvent& event);
std::string encodeAudioFrame(const audio::TaggedAudioFrame& tagged);
std::string encodeMicStatus(const MicStatus& status);

// Subscriber side: inverse of encodeButtonEvent for consumers of the
// INTERFACE subject and for checking what went on the wire. The daemon
// never decodes. nullopt on malformed or foreign records.
std::optional<input::ButtonEvent> decodeButtonEvent(const std::string& payload);

}  // namespace show_ingest::transport
