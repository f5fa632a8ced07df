/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "path/bezier_path.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using dolly::path::BezierPath;

namespace {

    constexpr float FLOAT_TOLERANCE = 1e-4f;

    void expectVecNear(const glm::vec3& a, const glm::vec3& b, const float tol = FLOAT_TOLERANCE) {
        EXPECT_NEAR(a.x, b.x, tol);
        EXPECT_NEAR(a.y, b.y, tol);
        EXPECT_NEAR(a.z, b.z, tol);
    }

    BezierPath makePath(const std::vector<glm::vec3>& points, const int samples = dolly::path::DEFAULT_PATH_SAMPLES) {
        auto result = BezierPath::create(points, samples);
        EXPECT_TRUE(result.has_value());
        return std::move(*result);
    }

    bool isFinite(const glm::vec3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

} // namespace

TEST(BezierPathTest, EndpointsAreExactForEveryDegree) {
    const std::vector<std::vector<glm::vec3>> sets = {
        {{1.5f, -2.0f, 3.25f}, {7.0f, 1.0f, -4.0f}},
        {{0.0f, 0.0f, 0.0f}, {3.0f, 9.0f, 1.0f}, {6.0f, 0.5f, 2.0f}},
        {{0.1f, 0.2f, 0.3f}, {5.0f, 8.0f, -1.0f}, {-3.0f, 4.0f, 2.0f}, {9.7f, -3.3f, 0.9f}},
    };

    for (const auto& points : sets) {
        const BezierPath path = makePath(points, 32);
        EXPECT_EQ(path.degree(), static_cast<int>(points.size()) - 1);

        const glm::vec3 first = path.uniformPosition(0.0f);
        const glm::vec3 last = path.uniformPosition(1.0f);
        EXPECT_EQ(first.x, points.front().x);
        EXPECT_EQ(first.y, points.front().y);
        EXPECT_EQ(first.z, points.front().z);
        EXPECT_EQ(last.x, points.back().x);
        EXPECT_EQ(last.y, points.back().y);
        EXPECT_EQ(last.z, points.back().z);
    }
}

TEST(BezierPathTest, ProgressIsClamped) {
    const std::vector<glm::vec3> points = {{0.0f, 0.0f, 0.0f}, {2.0f, 2.0f, 0.0f}, {4.0f, 0.0f, 0.0f}};
    const BezierPath path = makePath(points, 16);

    expectVecNear(path.uniformPosition(-0.5f), points.front());
    expectVecNear(path.uniformPosition(1.5f), points.back());
}

TEST(BezierPathTest, UnevenControlPolygonIsTraversedAtConstantSpeed) {
    // Straight line whose parameterization bunches up near the start
    const std::vector<glm::vec3> points = {
        {0.0f, 0.0f, 0.0f}, {0.5f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {10.0f, 0.0f, 0.0f}};
    const BezierPath path = makePath(points, 128);

    EXPECT_NEAR(path.length(), 10.0f, 1e-3f);

    // Raw parameter spacing is far from uniform
    EXPECT_LT(path.evaluate(0.5f).x, 3.0f);

    constexpr int STEPS = 32;
    for (int k = 0; k <= STEPS; ++k) {
        const float progress = static_cast<float>(k) / STEPS;
        EXPECT_NEAR(path.uniformPosition(progress).x, 10.0f * progress, 0.02f) << "at progress " << progress;
    }
}

TEST(BezierPathTest, SampleSpacingIsUniformOnCurvedPath) {
    const std::vector<glm::vec3> points = {
        {0.0f, 0.0f, 0.0f}, {0.0f, 10.0f, 0.0f}, {10.0f, 10.0f, 5.0f}, {10.0f, 0.0f, 5.0f}};
    const BezierPath path = makePath(points, 256);

    constexpr int STEPS = 40;
    std::vector<float> steps;
    glm::vec3 previous = path.uniformPosition(0.0f);
    for (int k = 1; k <= STEPS; ++k) {
        const glm::vec3 p = path.uniformPosition(static_cast<float>(k) / STEPS);
        steps.push_back(glm::distance(previous, p));
        previous = p;
    }

    const float expected = path.length() / STEPS;
    for (const float step : steps) {
        EXPECT_NEAR(step, expected, expected * 0.03f);
    }
}

TEST(BezierPathTest, LinearPathInterpolatesExactly) {
    const std::vector<glm::vec3> points = {{0.0f, 0.0f, 0.0f}, {4.0f, -8.0f, 2.0f}};
    const BezierPath path = makePath(points);

    expectVecNear(path.uniformPosition(0.25f), {1.0f, -2.0f, 0.5f});
    expectVecNear(path.uniformPosition(0.75f), {3.0f, -6.0f, 1.5f});
}

TEST(BezierPathTest, DegenerateCurveNeverProducesNaN) {
    const std::vector<glm::vec3> points(4, glm::vec3(2.0f, 3.0f, 4.0f));
    const BezierPath path = makePath(points, 8);

    EXPECT_FLOAT_EQ(path.length(), 0.0f);
    for (const float progress : {0.0f, 0.3f, 0.5f, 1.0f}) {
        const glm::vec3 p = path.uniformPosition(progress);
        EXPECT_TRUE(isFinite(p));
        expectVecNear(p, points.front());
    }
    EXPECT_TRUE(isFinite(path.uniformPosition(std::nanf(""))));
}

TEST(BezierPathTest, RejectsInvalidControlPointCount) {
    const std::vector<glm::vec3> one = {{0.0f, 0.0f, 0.0f}};
    const std::vector<glm::vec3> five(5, glm::vec3(1.0f));
    EXPECT_FALSE(BezierPath::create(one, 8).has_value());

    const auto result = BezierPath::create(five, 8);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("got 5"), std::string::npos);
}

TEST(BezierPathTest, TranslateMovesWholeCurve) {
    const std::vector<glm::vec3> points = {{0.0f, 0.0f, 0.0f}, {1.0f, 3.0f, 0.0f}, {2.0f, 0.0f, 0.0f}};
    BezierPath path = makePath(points, 32);
    const glm::vec3 before = path.uniformPosition(0.4f);

    path.translate({5.0f, -1.0f, 2.0f});

    expectVecNear(path.uniformPosition(0.0f), {5.0f, -1.0f, 2.0f});
    expectVecNear(path.uniformPosition(1.0f), {7.0f, -1.0f, 2.0f});
    expectVecNear(path.uniformPosition(0.4f), before + glm::vec3(5.0f, -1.0f, 2.0f));
    EXPECT_NEAR(path.length(), makePath(points, 32).length(), FLOAT_TOLERANCE);
}
