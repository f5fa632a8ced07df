/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace dolly::core {

    inline constexpr float GEOMETRY_EPSILON = 1e-6f;
    inline constexpr glm::vec3 WORLD_UP{0.0f, 1.0f, 0.0f};

    // Look angles are degrees: x = pitch, y = yaw, z = roll.
    // The camera looks down -Z of its look frame, so +Z is the back vector.

    [[nodiscard]] float wrapDegrees(float degrees);

    // Signed delta from `from` to `to` taking the short way round, in (-180, 180]
    [[nodiscard]] float shortRotation(float from, float to);
    [[nodiscard]] glm::vec3 shortRotation(const glm::vec3& from, const glm::vec3& to);

    [[nodiscard]] glm::quat lookRotation(const glm::vec3& look_degrees);
    [[nodiscard]] glm::vec3 rotateByLook(const glm::vec3& look_degrees, const glm::vec3& v);
    [[nodiscard]] glm::vec3 backVector(const glm::vec3& look_degrees);
    [[nodiscard]] glm::vec3 forwardVector(const glm::vec3& look_degrees);

    // World position of a camera orbiting `anchor` at `zoom` distance behind it
    [[nodiscard]] glm::vec3 cameraPosition(const glm::vec3& anchor, const glm::vec3& look_degrees, float zoom);

    // Zero vector in, zero vector out
    [[nodiscard]] glm::vec3 safeNormalize(const glm::vec3& v);

} // namespace dolly::core
