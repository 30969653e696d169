#include "input/key_codes.h"

#include <linux/input.h>

namespace show_ingest::input {

namespace {

struct KeyInfo {
    KeyCode key;
    const char* name;
    std::uint16_t evdev;
};

constexpr KeyInfo kKeys[] = {
#define SHOW_INGEST_KEY_INFO(id, name, code) {KeyCode::id, name, static_cast<std::uint16_t>(code)},
    SHOW_INGEST_KEY_CODES(SHOW_INGEST_KEY_INFO)
#undef SHOW_INGEST_KEY_INFO
};

static_assert(sizeof(kKeys) / sizeof(kKeys[0]) == kKeyCodeCount, "key table out of sync");

}  // namespace

std::optional<KeyCode> parseKeyName(std::string_view name) {
    for (const auto& info : kKeys) {
        if (name == info.name) {
            return info.key;
        }
    }
    return std::nullopt;
}

const char* keyName(KeyCode key) {
    return kKeys[static_cast<std::size_t>(key)].name;
}

std::optional<KeyCode> fromEvdevCode(std::uint16_t code) {
    for (const auto& info : kKeys) {
        if (info.evdev == code) {
            return info.key;
        }
    }
    return std::nullopt;
}

std::uint16_t toEvdevCode(KeyCode key) {
    return kKeys[static_cast<std::size_t>(key)].evdev;
}

std::vector<std::pair<KeyCode, ButtonAction>> KeyActionMap::bindings() const {
    std::vector<std::pair<KeyCode, ButtonAction>> out;
    for (std::size_t i = 0; i < table_.size(); ++i) {
        if (table_[i]) {
            out.emplace_back(static_cast<KeyCode>(i), *table_[i]);
        }
    }
    return out;
}

}  // namespace show_ingest::input
