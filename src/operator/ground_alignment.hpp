/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>

namespace dolly::cam {

    // Signed roll, in degrees, that tilts the camera's up vector toward the ground
    // normal as seen along the camera's horizontal viewing direction, scaled by
    // `factor`. Returns 0 for normals parallel to the viewing direction.
    [[nodiscard]] float groundTiltTarget(const glm::vec3& ground_normal, const glm::vec3& look_degrees, float factor);

} // namespace dolly::cam
