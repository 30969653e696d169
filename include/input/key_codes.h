#pragma once

#include "input/button_event.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace show_ingest::input {

// Keys a show controller may be bound to: (enumerator, config name, evdev code).
// The evdev column is only expanded in key_codes.cpp, where <linux/input.h>
// is included.
// clang-format off
#define SHOW_INGEST_KEY_CODES(X)                                                          \
    X(Esc, "KEY_ESC", KEY_ESC) X(Num1, "KEY_1", KEY_1) X(Num2, "KEY_2", KEY_2)             \
    X(Num3, "KEY_3", KEY_3) X(Num4, "KEY_4", KEY_4) X(Num5, "KEY_5", KEY_5)                \
    X(Num6, "KEY_6", KEY_6) X(Num7, "KEY_7", KEY_7) X(Num8, "KEY_8", KEY_8)                \
    X(Num9, "KEY_9", KEY_9) X(Num0, "KEY_0", KEY_0) X(Minus, "KEY_MINUS", KEY_MINUS)       \
    X(Equal, "KEY_EQUAL", KEY_EQUAL) X(Backspace, "KEY_BACKSPACE", KEY_BACKSPACE)          \
    X(Tab, "KEY_TAB", KEY_TAB) X(Q, "KEY_Q", KEY_Q) X(W, "KEY_W", KEY_W)                   \
    X(E, "KEY_E", KEY_E) X(R, "KEY_R", KEY_R) X(T, "KEY_T", KEY_T) X(Y, "KEY_Y", KEY_Y)    \
    X(U, "KEY_U", KEY_U) X(I, "KEY_I", KEY_I) X(O, "KEY_O", KEY_O) X(P, "KEY_P", KEY_P)    \
    X(LeftBrace, "KEY_LEFTBRACE", KEY_LEFTBRACE)                                          \
    X(RightBrace, "KEY_RIGHTBRACE", KEY_RIGHTBRACE) X(Enter, "KEY_ENTER", KEY_ENTER)       \
    X(A, "KEY_A", KEY_A) X(S, "KEY_S", KEY_S) X(D, "KEY_D", KEY_D) X(F, "KEY_F", KEY_F)    \
    X(G, "KEY_G", KEY_G) X(H, "KEY_H", KEY_H) X(J, "KEY_J", KEY_J) X(K, "KEY_K", KEY_K)    \
    X(L, "KEY_L", KEY_L) X(Semicolon, "KEY_SEMICOLON", KEY_SEMICOLON)                     \
    X(Apostrophe, "KEY_APOSTROPHE", KEY_APOSTROPHE) X(Grave, "KEY_GRAVE", KEY_GRAVE)       \
    X(Backslash, "KEY_BACKSLASH", KEY_BACKSLASH) X(Z, "KEY_Z", KEY_Z) X(X_, "KEY_X", KEY_X) \
    X(C, "KEY_C", KEY_C) X(V, "KEY_V", KEY_V) X(B, "KEY_B", KEY_B) X(N, "KEY_N", KEY_N)    \
    X(M, "KEY_M", KEY_M) X(Comma, "KEY_COMMA", KEY_COMMA) X(Dot, "KEY_DOT", KEY_DOT)       \
    X(Slash, "KEY_SLASH", KEY_SLASH) X(Space, "KEY_SPACE", KEY_SPACE)                      \
    X(F1, "KEY_F1", KEY_F1) X(F2, "KEY_F2", KEY_F2) X(F3, "KEY_F3", KEY_F3)                \
    X(F4, "KEY_F4", KEY_F4) X(F5, "KEY_F5", KEY_F5) X(F6, "KEY_F6", KEY_F6)                \
    X(F7, "KEY_F7", KEY_F7) X(F8, "KEY_F8", KEY_F8) X(F9, "KEY_F9", KEY_F9)                \
    X(F10, "KEY_F10", KEY_F10) X(F11, "KEY_F11", KEY_F11) X(F12, "KEY_F12", KEY_F12)       \
    X(Home, "KEY_HOME", KEY_HOME) X(Up, "KEY_UP", KEY_UP) X(PageUp, "KEY_PAGEUP", KEY_PAGEUP) \
    X(Left, "KEY_LEFT", KEY_LEFT) X(Right, "KEY_RIGHT", KEY_RIGHT) X(End, "KEY_END", KEY_END) \
    X(Down, "KEY_DOWN", KEY_DOWN) X(PageDown, "KEY_PAGEDOWN", KEY_PAGEDOWN)                \
    X(Insert, "KEY_INSERT", KEY_INSERT) X(Delete, "KEY_DELETE", KEY_DELETE)              \
    X(Kp0, "KEY_KP0", KEY_KP0) X(Kp1, "KEY_KP1", KEY_KP1) X(Kp2, "KEY_KP2", KEY_KP2)       \
    X(Kp3, "KEY_KP3", KEY_KP3) X(Kp4, "KEY_KP4", KEY_KP4) X(Kp5, "KEY_KP5", KEY_KP5)       \
    X(Kp6, "KEY_KP6", KEY_KP6) X(Kp7, "KEY_KP7", KEY_KP7) X(Kp8, "KEY_KP8", KEY_KP8)       \
    X(Kp9, "KEY_KP9", KEY_KP9) X(KpDot, "KEY_KPDOT", KEY_KPDOT)                            \
    X(KpEnter, "KEY_KPENTER", KEY_KPENTER) X(KpMinus, "KEY_KPMINUS", KEY_KPMINUS)          \
    X(KpPlus, "KEY_KPPLUS", KEY_KPPLUS) X(KpAsterisk, "KEY_KPASTERISK", KEY_KPASTERISK)    \
    X(KpSlash, "KEY_KPSLASH", KEY_KPSLASH)
// clang-format on

enum class KeyCode : std::uint8_t {
#define SHOW_INGEST_KEY_ENUM(id, name, code) id,
    SHOW_INGEST_KEY_CODES(SHOW_INGEST_KEY_ENUM)
#undef SHOW_INGEST_KEY_ENUM
};

constexpr std::size_t kKeyCodeCount = 0
#define SHOW_INGEST_KEY_COUNT(id, name, code) +1
    SHOW_INGEST_KEY_CODES(SHOW_INGEST_KEY_COUNT)
#undef SHOW_INGEST_KEY_COUNT
    ;

// "KEY_SPACE" -> KeyCode::Space; nullopt for names outside the closed set.
std::optional<KeyCode> parseKeyName(std::string_view name);
const char* keyName(KeyCode key);

std::optional<KeyCode> fromEvdevCode(std::uint16_t code);
std::uint16_t toEvdevCode(KeyCode key);

/**
 * @brief Fixed-size key -> action table for one device.
 *
 * Indexed directly by KeyCode; unbound keys have no action.
 */
class KeyActionMap {
   public:
    void bind(KeyCode key, ButtonAction action) {
        table_[static_cast<std::size_t>(key)] = action;
    }

    std::optional<ButtonAction> lookup(KeyCode key) const {
        return table_[static_cast<std::size_t>(key)];
    }

    bool contains(ButtonAction action) const {
        for (const auto& slot : table_) {
            if (slot && *slot == action) {
                return true;
            }
        }
        return false;
    }

    std::size_t size() const {
        std::size_t n = 0;
        for (const auto& slot : table_) {
            n += slot.has_value() ? 1 : 0;
        }
        return n;
    }

    bool empty() const {
        return size() == 0;
    }

    std::vector<std::pair<KeyCode, ButtonAction>> bindings() const;

   private:
    std::array<std::optional<ButtonAction>, kKeyCodeCount> table_{};
};

}  // namespace show_ingest::input
