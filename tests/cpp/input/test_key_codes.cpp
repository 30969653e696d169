#include "input/key_codes.h"

#include <gtest/gtest.h>
#include <linux/input.h>

using namespace show_ingest::input;

TEST(KeyCodes, ParseKnownNames) {
    EXPECT_EQ(parseKeyName("KEY_SPACE"), KeyCode::Space);
    EXPECT_EQ(parseKeyName("KEY_A"), KeyCode::A);
    EXPECT_EQ(parseKeyName("KEY_X"), KeyCode::X_);
    EXPECT_EQ(parseKeyName("KEY_F12"), KeyCode::F12);
}

TEST(KeyCodes, KeypadKeysAreBindable) {
    EXPECT_EQ(parseKeyName("KEY_KP0"), KeyCode::Kp0);
    EXPECT_EQ(parseKeyName("KEY_KP9"), KeyCode::Kp9);
    EXPECT_EQ(parseKeyName("KEY_KPENTER"), KeyCode::KpEnter);
    EXPECT_EQ(parseKeyName("KEY_KPASTERISK"), KeyCode::KpAsterisk);
    EXPECT_EQ(parseKeyName("KEY_KPSLASH"), KeyCode::KpSlash);
    EXPECT_EQ(toEvdevCode(KeyCode::KpPlus), KEY_KPPLUS);
    EXPECT_EQ(fromEvdevCode(KEY_KPDOT), KeyCode::KpDot);
    EXPECT_EQ(fromEvdevCode(KEY_KPMINUS), KeyCode::KpMinus);
    EXPECT_STREQ(keyName(KeyCode::Kp5), "KEY_KP5");
}

TEST(KeyCodes, UnknownNamesAreRejected) {
    EXPECT_FALSE(parseKeyName("").has_value());
    EXPECT_FALSE(parseKeyName("SPACE").has_value());
    EXPECT_FALSE(parseKeyName("key_space").has_value());
    EXPECT_FALSE(parseKeyName("KEY_VOLUMEUP").has_value());
}

TEST(KeyCodes, EvdevMapping) {
    EXPECT_EQ(toEvdevCode(KeyCode::Space), KEY_SPACE);
    EXPECT_EQ(toEvdevCode(KeyCode::Esc), KEY_ESC);
    EXPECT_EQ(fromEvdevCode(KEY_ENTER), KeyCode::Enter);
    EXPECT_FALSE(fromEvdevCode(BTN_LEFT).has_value());
    EXPECT_FALSE(fromEvdevCode(KEY_VOLUMEUP).has_value());
}

TEST(KeyCodes, EveryKeyIsConsistent) {
    for (std::size_t i = 0; i < kKeyCodeCount; ++i) {
        const auto key = static_cast<KeyCode>(i);
        const char* name = keyName(key);
        EXPECT_EQ(parseKeyName(name), key) << name;
        EXPECT_EQ(fromEvdevCode(toEvdevCode(key)), key) << name;
    }
}

TEST(KeyActionMap, BindLookupAndContains) {
    KeyActionMap map;
    EXPECT_TRUE(map.empty());
    EXPECT_FALSE(map.lookup(KeyCode::Space).has_value());

    map.bind(KeyCode::Space, ButtonAction::Speak);
    map.bind(KeyCode::Esc, ButtonAction::Exit);
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.lookup(KeyCode::Space), ButtonAction::Speak);
    EXPECT_TRUE(map.contains(ButtonAction::Exit));
    EXPECT_FALSE(map.contains(ButtonAction::Reset));

    map.bind(KeyCode::Space, ButtonAction::Unset);
    EXPECT_EQ(map.size(), 2u);
    EXPECT_FALSE(map.contains(ButtonAction::Speak));
}

TEST(KeyActionMap, BindingsInKeyOrder) {
    KeyActionMap map;
    map.bind(KeyCode::Space, ButtonAction::Speak);
    map.bind(KeyCode::Esc, ButtonAction::Exit);

    auto bindings = map.bindings();
    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(bindings[0].first, KeyCode::Esc);
    EXPECT_EQ(bindings[0].second, ButtonAction::Exit);
    EXPECT_EQ(bindings[1].first, KeyCode::Space);
}

TEST(ButtonActionNames, RoundTrip) {
    for (auto action : {ButtonAction::Reset, ButtonAction::Speak, ButtonAction::Unset,
                        ButtonAction::Exit}) {
        EXPECT_EQ(parseAction(actionToString(action)), action);
    }
    EXPECT_FALSE(parseAction("Speak").has_value());
    EXPECT_STREQ(statusToString(ButtonStatus::Dead), "dead");
    EXPECT_STREQ(kindToString(EventKind::Action), "action");
}
