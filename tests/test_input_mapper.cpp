/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "operator/input_mapper.hpp"
#include <gtest/gtest.h>

using namespace dolly;
using namespace dolly::cam;

namespace {

    constexpr float FLOAT_TOLERANCE = 1e-5f;

    class InputMapperTest : public ::testing::Test {
    protected:
        core::param::OperatorParameters params_;
        InputMapper mapper_{params_};
    };

} // namespace

TEST_F(InputMapperTest, NoInputGivesNoDelta) {
    const auto delta = mapper_.map({}, 1.0f / 60.0f);
    EXPECT_FLOAT_EQ(delta.horizontal, 0.0f);
    EXPECT_FLOAT_EQ(delta.vertical, 0.0f);
    EXPECT_FLOAT_EQ(delta.zoom, 0.0f);
}

TEST_F(InputMapperTest, PointerIsIgnoredUntilCaptured) {
    RawInput input;
    input.pointer_delta = {100.0f, -50.0f};
    EXPECT_FLOAT_EQ(mapper_.map(input, 0.016f).horizontal, 0.0f);

    input.pointer_captured = true;
    const auto delta = mapper_.map(input, 0.016f);
    EXPECT_NEAR(delta.horizontal, -100.0f * params_.pointer_sensitivity, FLOAT_TOLERANCE);
    EXPECT_NEAR(delta.vertical, 50.0f * params_.pointer_sensitivity, FLOAT_TOLERANCE);
}

TEST_F(InputMapperTest, KeysScaleWithFrameTime) {
    RawInput input;
    input.look_left = true;
    input.look_up = true;

    const auto delta = mapper_.map(input, 0.5f);
    EXPECT_NEAR(delta.horizontal, 0.5f * params_.key_rate, FLOAT_TOLERANCE);
    EXPECT_NEAR(delta.vertical, 0.5f * params_.key_rate, FLOAT_TOLERANCE);

    input.look_left = false;
    input.look_right = true;
    input.look_up = false;
    input.look_down = true;
    const auto opposite = mapper_.map(input, 0.5f);
    EXPECT_NEAR(opposite.horizontal, -0.5f * params_.key_rate, FLOAT_TOLERANCE);
    EXPECT_NEAR(opposite.vertical, -0.5f * params_.key_rate, FLOAT_TOLERANCE);
}

TEST_F(InputMapperTest, OpposingKeysCancel) {
    RawInput input;
    input.look_left = true;
    input.look_right = true;
    input.zoom_in = true;
    input.zoom_out = true;
    const auto delta = mapper_.map(input, 0.5f);
    EXPECT_FLOAT_EQ(delta.horizontal, 0.0f);
    EXPECT_FLOAT_EQ(delta.zoom, 0.0f);
}

TEST_F(InputMapperTest, WheelAwayZoomsIn) {
    RawInput input;
    input.wheel = 2.0f;
    EXPECT_NEAR(mapper_.map(input, 0.016f).zoom, -2.0f * params_.wheel_step, FLOAT_TOLERANCE);

    input.wheel = 0.0f;
    input.zoom_out = true;
    EXPECT_NEAR(mapper_.map(input, 0.25f).zoom, 0.25f * params_.key_rate, FLOAT_TOLERANCE);
}

TEST_F(InputMapperTest, DeltasAreClamped) {
    RawInput input;
    input.pointer_captured = true;
    input.pointer_delta = {-100000.0f, 100000.0f};
    input.wheel = -500.0f;

    const auto delta = mapper_.map(input, 0.016f);
    EXPECT_FLOAT_EQ(delta.horizontal, 1.0f);
    EXPECT_FLOAT_EQ(delta.vertical, -1.0f);
    EXPECT_FLOAT_EQ(delta.zoom, 1.0f);
}

TEST_F(InputMapperTest, AccumulatedInputSumsMotionAndMergesButtons) {
    RawInput total;
    RawInput a;
    a.pointer_delta = {3.0f, 1.0f};
    a.wheel = 1.0f;
    a.look_left = true;
    RawInput b;
    b.pointer_delta = {2.0f, -4.0f};
    b.wheel = 0.5f;
    b.pointer_captured = true;

    total += a;
    total += b;
    EXPECT_EQ(total.pointer_delta, glm::vec2(5.0f, -3.0f));
    EXPECT_FLOAT_EQ(total.wheel, 1.5f);
    EXPECT_TRUE(total.look_left);
    EXPECT_TRUE(total.pointer_captured);
    EXPECT_FALSE(total.zoom_in);
}
