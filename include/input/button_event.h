#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace show_ingest::input {

enum class ButtonAction : std::uint8_t { Reset, Speak, Unset, Exit };

enum class ButtonStatus : std::uint8_t { Connected, Disconnected, Dead };

enum class EventKind : std::uint8_t { Action, Status };

// avatarId of the show reset button; avatar controllers use 0..n-1.
constexpr int kResetAvatarId = -1;

/**
 * @brief Event produced by a button device session.
 *
 * Exactly one of action/status is populated, selected by kind. Use the
 * factory helpers so that invariant holds.
 */
struct ButtonEvent {
    std::string sourceId;  // device path
    int avatarId = kResetAvatarId;
    EventKind kind = EventKind::Status;
    std::optional<ButtonAction> action;
    std::optional<ButtonStatus> status;
    double timestamp = 0.0;  // wall clock seconds

    static ButtonEvent makeAction(std::string source, int avatar, ButtonAction a, double ts) {
        ButtonEvent ev;
        ev.sourceId = std::move(source);
        ev.avatarId = avatar;
        ev.kind = EventKind::Action;
        ev.action = a;
        ev.timestamp = ts;
        return ev;
    }

    static ButtonEvent makeStatus(std::string source, int avatar, ButtonStatus s, double ts) {
        ButtonEvent ev;
        ev.sourceId = std::move(source);
        ev.avatarId = avatar;
        ev.kind = EventKind::Status;
        ev.status = s;
        ev.timestamp = ts;
        return ev;
    }
};

inline const char* actionToString(ButtonAction action) {
    switch (action) {
    case ButtonAction::Reset:
        return "reset";
    case ButtonAction::Speak:
        return "speak";
    case ButtonAction::Unset:
        return "unset";
    case ButtonAction::Exit:
        return "exit";
    }
    return "unset";
}

inline std::optional<ButtonAction> parseAction(std::string_view name) {
    if (name == "reset") {
        return ButtonAction::Reset;
    }
    if (name == "speak") {
        return ButtonAction::Speak;
    }
    if (name == "unset") {
        return ButtonAction::Unset;
    }
    if (name == "exit") {
        return ButtonAction::Exit;
    }
    return std::nullopt;
}

inline const char* statusToString(ButtonStatus status) {
    switch (status) {
    case ButtonStatus::Connected:
        return "connected";
    case ButtonStatus::Disconnected:
        return "disconnected";
    case ButtonStatus::Dead:
        return "dead";
    }
    return "disconnected";
}

inline const char* kindToString(EventKind kind) {
    return kind == EventKind::Action ? "action" : "status";
}

}  // namespace show_ingest::input
