/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "ground_alignment.hpp"
#include "core/angles.hpp"
#include <cmath>

namespace dolly::cam {

    float groundTiltTarget(const glm::vec3& ground_normal, const glm::vec3& look_degrees, const float factor) {
        // Only yaw defines the viewing plane; pitch must not leak into the tilt
        const glm::vec3 back = core::backVector(glm::vec3(0.0f, look_degrees.y, 0.0f));

        const glm::vec3 normal = core::safeNormalize(ground_normal);
        const glm::vec3 projected = core::safeNormalize(normal - glm::dot(normal, back) * back);
        if (projected == glm::vec3(0.0f)) {
            return 0.0f;
        }

        const float sine = glm::dot(glm::cross(core::WORLD_UP, projected), back);
        const float cosine = glm::dot(core::WORLD_UP, projected);
        return glm::degrees(std::atan2(sine, cosine)) * factor;
    }

} // namespace dolly::cam
