/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "operator/ground_alignment.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace dolly::cam;

namespace {

    constexpr float ANGLE_TOLERANCE = 1e-3f;

    // Ground sloping down toward +X by `degrees`
    glm::vec3 slopeAlongX(const float degrees) {
        const float r = glm::radians(degrees);
        return {std::sin(r), std::cos(r), 0.0f};
    }

} // namespace

TEST(GroundAlignmentTest, FlatGroundGivesNoTilt) {
    EXPECT_NEAR(groundTiltTarget({0.0f, 1.0f, 0.0f}, {0.0f, 37.0f, 0.0f}, 1.0f), 0.0f, ANGLE_TOLERANCE);
}

TEST(GroundAlignmentTest, SideSlopeTiltsByItsAngle) {
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f), glm::vec3(0.0f), 1.0f), -30.0f, ANGLE_TOLERANCE);
}

TEST(GroundAlignmentTest, FactorScalesTilt) {
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f), glm::vec3(0.0f), 0.5f), -15.0f, ANGLE_TOLERANCE);
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f), glm::vec3(0.0f), 0.0f), 0.0f, ANGLE_TOLERANCE);
}

TEST(GroundAlignmentTest, FacingTheOtherWayFlipsTheSign) {
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f), {0.0f, 180.0f, 0.0f}, 1.0f), 30.0f, ANGLE_TOLERANCE);
}

TEST(GroundAlignmentTest, PitchDoesNotAffectTilt) {
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f), {45.0f, 0.0f, 0.0f}, 1.0f), -30.0f, ANGLE_TOLERANCE);
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f), {-80.0f, 0.0f, 0.0f}, 1.0f), -30.0f, ANGLE_TOLERANCE);
}

TEST(GroundAlignmentTest, SlopeAlongViewDirectionGivesNoTilt) {
    const float r = glm::radians(25.0f);
    EXPECT_NEAR(groundTiltTarget({0.0f, std::cos(r), std::sin(r)}, glm::vec3(0.0f), 1.0f), 0.0f, ANGLE_TOLERANCE);
}

TEST(GroundAlignmentTest, NormalAlongViewDirectionIsIgnored) {
    EXPECT_FLOAT_EQ(groundTiltTarget({0.0f, 0.0f, 1.0f}, glm::vec3(0.0f), 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(groundTiltTarget(glm::vec3(0.0f), glm::vec3(0.0f), 1.0f), 0.0f);
}

TEST(GroundAlignmentTest, UnnormalizedNormalGivesSameTilt) {
    EXPECT_NEAR(groundTiltTarget(slopeAlongX(30.0f) * 7.0f, glm::vec3(0.0f), 1.0f), -30.0f, ANGLE_TOLERANCE);
}
