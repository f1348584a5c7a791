#include "daemon/input/hold_gesture_tracker.h"

#include <gtest/gtest.h>

using daemon_input::HoldGestureTracker;

TEST(HoldGestureTrackerTest, FirstPressPerSourceIsAccepted) {
    HoldGestureTracker tracker;
    EXPECT_TRUE(tracker.onPress("evdev:/dev/input/event3"));
    EXPECT_FALSE(tracker.onPress("evdev:/dev/input/event3"));
    EXPECT_TRUE(tracker.isActive("evdev:/dev/input/event3"));
}

TEST(HoldGestureTrackerTest, SecondSourceIsTrackedSeparately) {
    HoldGestureTracker tracker;
    EXPECT_TRUE(tracker.onPress("a"));
    tracker.markStarted();
    EXPECT_TRUE(tracker.onPress("b"));
    EXPECT_TRUE(tracker.anyActive());
}

TEST(HoldGestureTrackerTest, ReleaseStopsOnlyAfterLastSource) {
    HoldGestureTracker tracker;
    tracker.onPress("a");
    tracker.markStarted();
    tracker.onPress("b");

    EXPECT_FALSE(tracker.onRelease("a"));
    EXPECT_TRUE(tracker.onRelease("b"));
    EXPECT_FALSE(tracker.anyActive());
    EXPECT_FALSE(tracker.startedByHold());
}

TEST(HoldGestureTrackerTest, ReleaseOfUnknownSourceIsIgnored) {
    HoldGestureTracker tracker;
    tracker.onPress("a");
    tracker.markStarted();
    EXPECT_FALSE(tracker.onRelease("ghost"));
    EXPECT_TRUE(tracker.isActive("a"));
}

TEST(HoldGestureTrackerTest, ReleaseWithoutHoldStartDoesNotStop) {
    HoldGestureTracker tracker;
    tracker.onPress("a");
    EXPECT_FALSE(tracker.onRelease("a"));
}

TEST(HoldGestureTrackerTest, ResetClearsEverything) {
    HoldGestureTracker tracker;
    tracker.onPress("a");
    tracker.markStarted();
    tracker.reset();

    EXPECT_FALSE(tracker.anyActive());
    EXPECT_FALSE(tracker.startedByHold());
    EXPECT_TRUE(tracker.onPress("a"));
}
