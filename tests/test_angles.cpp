/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/angles.hpp"
#include <gtest/gtest.h>

using namespace dolly::core;

namespace {
    constexpr float FLOAT_TOLERANCE = 1e-4f;

    void expectVecNear(const glm::vec3& a, const glm::vec3& b) {
        EXPECT_NEAR(a.x, b.x, FLOAT_TOLERANCE);
        EXPECT_NEAR(a.y, b.y, FLOAT_TOLERANCE);
        EXPECT_NEAR(a.z, b.z, FLOAT_TOLERANCE);
    }
} // namespace

TEST(AnglesTest, ShortRotationTakesTheShortWayRound) {
    EXPECT_NEAR(shortRotation(350.0f, 10.0f), 20.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(shortRotation(10.0f, 350.0f), -20.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(shortRotation(-170.0f, 170.0f), -20.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(shortRotation(0.0f, 720.0f + 45.0f), 45.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(shortRotation(30.0f, 30.0f), 0.0f, FLOAT_TOLERANCE);
}

TEST(AnglesTest, ShortRotationPerAxis) {
    expectVecNear(shortRotation(glm::vec3(350.0f, 0.0f, -90.0f), glm::vec3(10.0f, 200.0f, 90.0f)),
                  glm::vec3(20.0f, -160.0f, 180.0f));
}

TEST(AnglesTest, WrapDegreesRange) {
    EXPECT_NEAR(wrapDegrees(540.0f), 180.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(wrapDegrees(-180.0f), 180.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(wrapDegrees(-190.0f), 170.0f, FLOAT_TOLERANCE);
    EXPECT_NEAR(wrapDegrees(359.0f), -1.0f, FLOAT_TOLERANCE);
}

TEST(AnglesTest, BackVectorFollowsYawAndPitch) {
    expectVecNear(backVector(glm::vec3(0.0f)), {0.0f, 0.0f, 1.0f});
    expectVecNear(backVector({0.0f, 90.0f, 0.0f}), {1.0f, 0.0f, 0.0f});
    // Looking up puts the camera below the anchor
    expectVecNear(backVector({90.0f, 0.0f, 0.0f}), {0.0f, -1.0f, 0.0f});
    // Roll spins around the viewing axis only
    expectVecNear(backVector({0.0f, 0.0f, 45.0f}), {0.0f, 0.0f, 1.0f});
    expectVecNear(forwardVector(glm::vec3(0.0f)), {0.0f, 0.0f, -1.0f});
}

TEST(AnglesTest, CameraPositionAppliesZoomBehindAnchor) {
    expectVecNear(cameraPosition({1.0f, 2.0f, 3.0f}, {0.0f, 90.0f, 0.0f}, 5.0f), {6.0f, 2.0f, 3.0f});
    expectVecNear(cameraPosition({1.0f, 2.0f, 3.0f}, {30.0f, 60.0f, 0.0f}, 0.0f), {1.0f, 2.0f, 3.0f});
}

TEST(AnglesTest, SafeNormalizeHandlesZero) {
    expectVecNear(safeNormalize(glm::vec3(0.0f)), glm::vec3(0.0f));
    expectVecNear(safeNormalize({0.0f, 3.0f, 4.0f}), {0.0f, 0.6f, 0.8f});
}
