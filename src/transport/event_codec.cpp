#include "transport/event_codec.h"

#include "core/base64.h"
#include "logging/logger.h"

namespace show_ingest::transport {

using input::ButtonEvent;
using input::EventKind;

nlohmann::json buttonEventToJson(const ButtonEvent& event) {
    nlohmann::json j;
    j["object_type"] = "ButtonData";
    j["version"] = kButtonRecordVersion;
    j["avatar_id"] = event.avatarId;
    j["source"] = event.sourceId;
    j["message_type"] = input::kindToString(event.kind);
    j["action"] = event.action ? nlohmann::json(input::actionToString(*event.action))
                               : nlohmann::json(nullptr);
    j["status"] = event.status ? nlohmann::json(input::statusToString(*event.status))
                               : nlohmann::json(nullptr);
    j["time_stamp"] = event.timestamp;
    return j;
}

nlohmann::json audioFrameToJson(const audio::TaggedAudioFrame& tagged) {
    const audio::AudioFrame& f = tagged.frame;
    nlohmann::json j;
    j["object_type"] = "AudioFrame";
    j["version"] = kAudioRecordVersion;
    j["source_id"] = f.sourceId;
    j["sequence_num"] = tagged.sequenceNum;
    j["sample_rate"] = f.sampleRate;
    j["sample_format"] = audio::sampleFormatToString(f.format);
    j["channels"] = f.channels;
    j["capture_time"] = f.captureTime;
    j["wall_time"] = f.wallTime;
    j["is_silence"] = tagged.isSilence;
    j["is_voice"] = tagged.isVoice;
    j["is_denoised"] = tagged.isDenoised;
    j["vad_state"] = audio::vadStateToString(tagged.vadState);
    j["rms_dbfs"] = tagged.rmsDbfs;
    j["pcm"] = base64::encode(f.data);
    return j;
}

nlohmann::json micStatusToJson(const MicStatus& status) {
    nlohmann::json j;
    j["object_type"] = "MicStatus";
    j["version"] = kMicStatusRecordVersion;
    j["source_id"] = status.sourceId;
    j["device"] = status.device;
    j["status"] = device::sessionStatusToString(status.status);
    j["reconnect_attempts"] = status.reconnectAttempts;
    j["restarts"] = status.restarts;
    j["time_stamp"] = status.timestamp;
    return j;
}

std::string encodeButtonEvent(const ButtonEvent& event) {
    return buttonEventToJson(event).dump();
}

std::string encodeAudioFrame(const audio::TaggedAudioFrame& tagged) {
    return audioFrameToJson(tagged).dump();
}

std::string encodeMicStatus(const MicStatus& status) {
    return micStatusToJson(status).dump();
}

std::optional<ButtonEvent> decodeButtonEvent(const std::string& payload) {
    try {
        auto j = nlohmann::json::parse(payload);
        if (j.value("object_type", "") != "ButtonData") {
            return std::nullopt;
        }

        ButtonEvent ev;
        ev.avatarId = j.at("avatar_id").get<int>();
        ev.sourceId = j.value("source", "");
        ev.timestamp = j.at("time_stamp").get<double>();

        const std::string type = j.at("message_type").get<std::string>();
        if (type == "action") {
            ev.kind = EventKind::Action;
            if (!j["action"].is_string()) {
                return std::nullopt;
            }
            ev.action = input::parseAction(j["action"].get<std::string>());
            if (!ev.action) {
                return std::nullopt;
            }
        } else if (type == "status") {
            ev.kind = EventKind::Status;
            if (!j["status"].is_string()) {
                return std::nullopt;
            }
            const std::string s = j["status"].get<std::string>();
            if (s == "connected") {
                ev.status = input::ButtonStatus::Connected;
            } else if (s == "disconnected") {
                ev.status = input::ButtonStatus::Disconnected;
            } else if (s == "dead") {
                ev.status = input::ButtonStatus::Dead;
            } else {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }
        return ev;
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("[Codec] Rejecting button record: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace show_ingest::transport
