/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <optional>

namespace dolly::cam {

    struct OperatorState {
        glm::vec3 position{0.0f}; // look anchor, world space
        glm::vec3 look{0.0f};
        float zoom = 0.0f;

        glm::vec3 look_target{0.0f};
        float zoom_target = 0.0f;

        float ground_alignment = 0.0f;
        float ground_alignment_target = 0.0f;

        // Zoom boundary found by the last collision, consumed by the next zoom input
        std::optional<float> interrupted_zoom;
        bool zoom_obstructed = false;

        bool active = false;
    };

} // namespace dolly::cam
