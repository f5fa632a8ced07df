/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "bezier_path.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>

namespace dolly::path {

    namespace {
        // Parameter steps per output sample used to measure the curve
        constexpr int OVERSAMPLING = 8;
        constexpr int MIN_PARAMETER_STEPS = 64;
        constexpr float MIN_LENGTH = 1e-6f;
    } // namespace

    std::expected<BezierPath, std::string> BezierPath::create(std::span<const glm::vec3> control_points,
                                                              const int sample_count) {
        if (control_points.size() < 2 || control_points.size() > MAX_CONTROL_POINTS) {
            return std::unexpected(fmt::format("Bezier path needs 2 to {} control points, got {}",
                                               MAX_CONTROL_POINTS, control_points.size()));
        }
        return BezierPath(control_points, sample_count);
    }

    BezierPath::BezierPath(std::span<const glm::vec3> control_points, const int sample_count)
        : control_points_(control_points.begin(), control_points.end()) {
        buildArcLengthTable(std::max(sample_count, MIN_PATH_SAMPLES));
    }

    glm::vec3 BezierPath::evaluate(const float t) const {
        // de Casteljau
        std::array<glm::vec3, MAX_CONTROL_POINTS> work{};
        const size_t n = control_points_.size();
        std::copy(control_points_.begin(), control_points_.end(), work.begin());
        for (size_t level = 1; level < n; ++level) {
            for (size_t i = 0; i < n - level; ++i) {
                work[i] = glm::mix(work[i], work[i + 1], t);
            }
        }
        return work[0];
    }

    void BezierPath::buildArcLengthTable(const int sample_count) {
        const int steps = std::max(sample_count * OVERSAMPLING, MIN_PARAMETER_STEPS);

        std::vector<glm::vec3> dense;
        std::vector<float> cumulative;
        dense.reserve(static_cast<size_t>(steps) + 1);
        cumulative.reserve(static_cast<size_t>(steps) + 1);

        dense.push_back(control_points_.front());
        cumulative.push_back(0.0f);
        for (int i = 1; i <= steps; ++i) {
            const float t = static_cast<float>(i) / static_cast<float>(steps);
            const glm::vec3 p = (i == steps) ? control_points_.back() : evaluate(t);
            cumulative.push_back(cumulative.back() + glm::distance(dense.back(), p));
            dense.push_back(p);
        }
        length_ = cumulative.back();

        samples_.clear();
        samples_.reserve(static_cast<size_t>(sample_count));

        if (length_ < MIN_LENGTH) {
            // Degenerate curve, fall back to parameter spacing
            for (int k = 0; k < sample_count; ++k) {
                const float t = static_cast<float>(k) / static_cast<float>(sample_count - 1);
                samples_.push_back(evaluate(t));
            }
            samples_.front() = control_points_.front();
            samples_.back() = control_points_.back();
            return;
        }

        // Invert cumulative length -> position
        size_t seg = 0;
        for (int k = 0; k < sample_count; ++k) {
            if (k == 0) {
                samples_.push_back(control_points_.front());
                continue;
            }
            if (k == sample_count - 1) {
                samples_.push_back(control_points_.back());
                continue;
            }
            const float target = length_ * static_cast<float>(k) / static_cast<float>(sample_count - 1);
            while (seg + 1 < cumulative.size() - 1 && cumulative[seg + 1] < target) {
                ++seg;
            }
            const float span = cumulative[seg + 1] - cumulative[seg];
            const float f = span > 0.0f ? (target - cumulative[seg]) / span : 0.0f;
            samples_.push_back(glm::mix(dense[seg], dense[seg + 1], std::clamp(f, 0.0f, 1.0f)));
        }

        LOG_TRACE("Bezier path: degree {}, length {:.3f}, {} samples", degree(), length_, samples_.size());
    }

    glm::vec3 BezierPath::uniformPosition(const float progress) const {
        const float p = std::clamp(progress, 0.0f, 1.0f);
        if (!(p > 0.0f)) {
            return samples_.front();
        }
        if (p >= 1.0f) {
            return samples_.back();
        }
        const float scaled = p * static_cast<float>(samples_.size() - 1);
        const size_t i = std::min(static_cast<size_t>(scaled), samples_.size() - 2);
        return glm::mix(samples_[i], samples_[i + 1], scaled - static_cast<float>(i));
    }

    void BezierPath::translate(const glm::vec3& delta) {
        for (auto& p : control_points_) {
            p += delta;
        }
        for (auto& p : samples_) {
            p += delta;
        }
    }

} // namespace dolly::path
