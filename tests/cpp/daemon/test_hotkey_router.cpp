#include "daemon/input/hotkey_router.h"

#include <gtest/gtest.h>
#include <vector>

using namespace std::chrono_literals;
using daemon_input::HotkeyRole;
using daemon_input::HotkeyRouter;
using daemon_session::ControlCommand;
using daemon_session::ControlCommandType;

class HotkeyRouterTest : public ::testing::Test {
   protected:
    std::vector<ControlCommand> posted;
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} + 5s;

    HotkeyRouter makeRouter(std::chrono::milliseconds debounce = 150ms) {
        return HotkeyRouter(
            debounce, [this](ControlCommand cmd) { posted.push_back(std::move(cmd)); },
            [this] { return now; });
    }
};

TEST_F(HotkeyRouterTest, TogglePressPostsToggle) {
    auto router = makeRouter();
    router.onKey(HotkeyRole::Toggle, true, "evdev:kbd");

    ASSERT_EQ(posted.size(), 1u);
    EXPECT_EQ(posted[0].type, ControlCommandType::Toggle);
    EXPECT_EQ(posted[0].sourceId, "evdev:kbd");
}

TEST_F(HotkeyRouterTest, ToggleReleaseIgnored) {
    auto router = makeRouter();
    router.onKey(HotkeyRole::Toggle, false, "evdev:kbd");
    EXPECT_TRUE(posted.empty());
}

TEST_F(HotkeyRouterTest, ToggleWithinDebounceDropped) {
    auto router = makeRouter();
    router.onKey(HotkeyRole::Toggle, true, "evdev:kbd");
    now += 50ms;
    router.onKey(HotkeyRole::Toggle, true, "evdev:kbd2");
    EXPECT_EQ(posted.size(), 1u);

    now += 150ms;
    router.onKey(HotkeyRole::Toggle, true, "evdev:kbd");
    EXPECT_EQ(posted.size(), 2u);
}

TEST_F(HotkeyRouterTest, HoldEventsNeverDebounced) {
    auto router = makeRouter();
    router.onKey(HotkeyRole::Hold, true, "evdev:kbd");
    router.onKey(HotkeyRole::Hold, false, "evdev:kbd");
    router.onKey(HotkeyRole::Hold, true, "evdev:kbd");

    ASSERT_EQ(posted.size(), 3u);
    EXPECT_EQ(posted[0].type, ControlCommandType::HoldPress);
    EXPECT_EQ(posted[1].type, ControlCommandType::HoldRelease);
    EXPECT_EQ(posted[2].type, ControlCommandType::HoldPress);
}

TEST_F(HotkeyRouterTest, HoldDoesNotConsumeToggleDebounce) {
    auto router = makeRouter();
    router.onKey(HotkeyRole::Hold, true, "a");
    router.onKey(HotkeyRole::Toggle, true, "a");
    ASSERT_EQ(posted.size(), 2u);
    EXPECT_EQ(posted[1].type, ControlCommandType::Toggle);
}

TEST_F(HotkeyRouterTest, MissingPostIsHarmless) {
    HotkeyRouter router(150ms, nullptr);
    router.onKey(HotkeyRole::Toggle, true, "a");
    SUCCEED();
}
