/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sequencer/easing.hpp"
#include <gtest/gtest.h>

using namespace dolly::sequencer;

namespace {
    constexpr float FLOAT_TOLERANCE = 1e-5f;
}

TEST(EasingTest, EaseInOutHitsFixedPoints) {
    EXPECT_FLOAT_EQ(easeInOut(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(easeInOut(0.5f), 0.5f);
    EXPECT_FLOAT_EQ(easeInOut(1.0f), 1.0f);
    EXPECT_FLOAT_EQ(easeInOut(-1.0f), 0.0f);
    EXPECT_FLOAT_EQ(easeInOut(2.0f), 1.0f);
    EXPECT_LT(easeInOut(0.25f), 0.25f);
    EXPECT_GT(easeInOut(0.75f), 0.75f);
}

TEST(SpeedRampTest, DurationUsesAverageSpeed) {
    const auto ramp = makeSpeedRamp(0.0f, 5.0f, false, false, 10.0f);
    EXPECT_FALSE(ramp.two_half);
    EXPECT_NEAR(ramp.duration, 4.0f, FLOAT_TOLERANCE);
}

TEST(SpeedRampTest, LinearRampIntegratesSpeed) {
    const auto ramp = makeSpeedRamp(0.0f, 5.0f, false, false, 10.0f);

    const auto half = sampleSpeedRamp(ramp, 0.5f);
    EXPECT_NEAR(half.speed, 2.5f, FLOAT_TOLERANCE);
    // 2 s at an average of 1.25 covers 2.5 of 10
    EXPECT_NEAR(half.progress, 0.25f, FLOAT_TOLERANCE);

    const auto end = sampleSpeedRamp(ramp, 1.0f);
    EXPECT_FLOAT_EQ(end.progress, 1.0f);
    EXPECT_NEAR(end.speed, 5.0f, FLOAT_TOLERANCE);
}

TEST(SpeedRampTest, EasedRampStartsAndStopsAtRest) {
    const auto ramp = makeSpeedRamp(4.0f, 4.0f, true, true, 8.0f);
    ASSERT_TRUE(ramp.two_half);
    EXPECT_NEAR(ramp.duration, 2.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(ramp.cruise_speed, 8.0f, FLOAT_TOLERANCE);

    EXPECT_NEAR(sampleSpeedRamp(ramp, 0.0f).speed, 0.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(sampleSpeedRamp(ramp, 0.5f).speed, 8.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(sampleSpeedRamp(ramp, 0.5f).progress, 0.5f, FLOAT_TOLERANCE);
    EXPECT_NEAR(sampleSpeedRamp(ramp, 1.0f).speed, 0.0f, FLOAT_TOLERANCE);
    EXPECT_FLOAT_EQ(sampleSpeedRamp(ramp, 1.0f).progress, 1.0f);

    // Slow start: less than a quarter of the way after a quarter of the time
    EXPECT_LT(sampleSpeedRamp(ramp, 0.25f).progress, 0.25f);

    float previous = 0.0f;
    for (int i = 1; i <= 20; ++i) {
        const float progress = sampleSpeedRamp(ramp, static_cast<float>(i) / 20.0f).progress;
        EXPECT_GE(progress, previous);
        previous = progress;
    }
}

TEST(SpeedRampTest, OneEasedEndpointKeepsDuration) {
    const auto ramp = makeSpeedRamp(2.0f, 6.0f, false, true, 12.0f);
    EXPECT_NEAR(ramp.duration, 3.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(ramp.start_speed, 2.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(ramp.end_speed, 0.0f, FLOAT_TOLERANCE);
    EXPECT_FLOAT_EQ(sampleSpeedRamp(ramp, 1.0f).progress, 1.0f);
    EXPECT_NEAR(sampleSpeedRamp(ramp, 0.999f).progress, 1.0f, 1e-3f);
}

TEST(SpeedRampTest, ZeroSpeedsAreInstantAndFollowTime) {
    const auto ramp = makeSpeedRamp(0.0f, 0.0f, false, false, 10.0f);
    EXPECT_FLOAT_EQ(ramp.duration, 0.0f);
    EXPECT_FLOAT_EQ(sampleSpeedRamp(ramp, 0.3f).progress, 0.3f);
}

TEST(SpeedRampTest, ZeroDistanceIsInstant) {
    const auto ramp = makeSpeedRamp(3.0f, 3.0f, true, false, 0.0f);
    EXPECT_FLOAT_EQ(ramp.duration, 0.0f);
    EXPECT_FLOAT_EQ(sampleSpeedRamp(ramp, 1.0f).progress, 1.0f);
}

TEST(SpeedRampTest, NegativeSpeedsAreTreatedAsRest) {
    const auto ramp = makeSpeedRamp(-4.0f, 4.0f, false, false, 4.0f);
    EXPECT_NEAR(ramp.duration, 2.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(ramp.start_speed, 0.0f, FLOAT_TOLERANCE);
}
