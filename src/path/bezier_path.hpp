/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <glm/glm.hpp>
#include <span>
#include <string>
#include <vector>

namespace dolly::path {

    inline constexpr int DEFAULT_PATH_SAMPLES = 64;
    inline constexpr int MIN_PATH_SAMPLES = 2;
    inline constexpr size_t MAX_CONTROL_POINTS = 4;

    // Bezier curve of degree (control points - 1), resampled so that equal steps
    // of progress cover equal arc length.
    class BezierPath {
    public:
        // Fails unless 2..4 control points are given
        [[nodiscard]] static std::expected<BezierPath, std::string> create(
            std::span<const glm::vec3> control_points, int sample_count = DEFAULT_PATH_SAMPLES);

        // Position at normalized arc-length progress, clamped to [0, 1]
        [[nodiscard]] glm::vec3 uniformPosition(float progress) const;

        // Position at raw curve parameter t
        [[nodiscard]] glm::vec3 evaluate(float t) const;

        void translate(const glm::vec3& delta);

        [[nodiscard]] float length() const { return length_; }
        [[nodiscard]] int degree() const { return static_cast<int>(control_points_.size()) - 1; }
        [[nodiscard]] std::span<const glm::vec3> controlPoints() const { return control_points_; }

    private:
        BezierPath(std::span<const glm::vec3> control_points, int sample_count);

        void buildArcLengthTable(int sample_count);

        std::vector<glm::vec3> control_points_;
        std::vector<glm::vec3> samples_;
        float length_ = 0.0f;
    };

} // namespace dolly::path
