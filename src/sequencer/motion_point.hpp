/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/ids.hpp"
#include "path/bezier_path.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <variant>

namespace dolly::sequencer {

    struct MotionPoint {
        std::optional<ObjectId> attached_object;
        glm::vec3 position{0.0f};  // look anchor, world space
        glm::vec3 look{0.0f};      // pitch, yaw, roll in degrees
        float zoom = 0.0f;
        float speed = 0.0f;
        bool ease_in_out = false;
        bool use_bezier = false;
        std::optional<glm::vec3> path_anchor_direction;
        std::optional<CheckpointId> checkpoint;

        // Derived when the point is inserted into a sequence
        glm::vec3 camera_position{0.0f};
        bool derived_anchor = false; // path_anchor_direction taken from the neighbours
        std::optional<path::BezierPath> path; // segment arriving at this point
        float segment_distance = 0.0f;
        float segment_duration = 0.0f;
    };

    // A requested target: literal point or checkpoint to be resolved by the environment
    using MotionRequest = std::variant<MotionPoint, CheckpointId>;

    struct CameraPose {
        glm::vec3 position{0.0f};
        glm::vec3 look{0.0f};
        float zoom = 0.0f;
        float speed = 0.0f;
    };

} // namespace dolly::sequencer
