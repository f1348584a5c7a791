#include "daemon/input/trigger_debouncer.h"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using daemon_input::TriggerDebouncer;

TEST(TriggerDebouncerTest, FirstTriggerAccepted) {
    TriggerDebouncer debouncer(150ms);
    EXPECT_TRUE(debouncer.accept(TriggerDebouncer::TimePoint{} + 1s));
}

TEST(TriggerDebouncerTest, RejectsWithinInterval) {
    TriggerDebouncer debouncer(150ms);
    auto t0 = TriggerDebouncer::TimePoint{} + 1s;
    EXPECT_TRUE(debouncer.accept(t0));
    EXPECT_FALSE(debouncer.accept(t0 + 10ms));
    EXPECT_FALSE(debouncer.accept(t0 + 149ms));
    EXPECT_TRUE(debouncer.accept(t0 + 150ms));
}

TEST(TriggerDebouncerTest, IntervalMeasuredFromLastAccepted) {
    TriggerDebouncer debouncer(100ms);
    auto t0 = TriggerDebouncer::TimePoint{} + 1s;
    EXPECT_TRUE(debouncer.accept(t0));
    EXPECT_FALSE(debouncer.accept(t0 + 90ms));
    // Rejected presses do not extend the window.
    EXPECT_TRUE(debouncer.accept(t0 + 100ms));
}

TEST(TriggerDebouncerTest, ResetForgetsLastTrigger) {
    TriggerDebouncer debouncer(150ms);
    auto t0 = TriggerDebouncer::TimePoint{} + 1s;
    debouncer.accept(t0);
    debouncer.reset();
    EXPECT_TRUE(debouncer.accept(t0 + 1ms));
}

TEST(TriggerDebouncerTest, ZeroIntervalAcceptsEverything) {
    TriggerDebouncer debouncer(0ms);
    auto t0 = TriggerDebouncer::TimePoint{} + 1s;
    EXPECT_TRUE(debouncer.accept(t0));
    EXPECT_TRUE(debouncer.accept(t0));
}
