/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/ids.hpp"
#include "sequencer/motion_point.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace dolly::cam {

    struct ControlDelta {
        float horizontal = 0.0f;
        float vertical = 0.0f;
        float zoom = 0.0f;
    };

    // Inbound
    namespace msg {
        struct FollowSequence {
            std::vector<sequencer::MotionRequest> points;
            ObjectId observer = 0;
        };
        struct FollowPoint {
            sequencer::MotionRequest point;
            ObjectId observer = 0;
        };
        struct Unfollow {};
        struct Activate {};
        struct Deactivate {};
        struct GroundNormal {
            glm::vec3 normal{0.0f, 1.0f, 0.0f};
        };
        struct ManualControl {
            ControlDelta delta;
        };
        struct InternalControl {
            bool enabled = false;
        };
        struct Debug {
            bool enabled = false;
        };

        // Outbound
        struct OperatorAttached {
            ObjectId operator_id = 0;
        };
        struct OperatorDetached {
            ObjectId operator_id = 0;
        };
        struct MotionPointReached {
            std::optional<ObjectId> object;
            std::optional<CheckpointId> checkpoint;
        };
        struct MotionFinished {
            std::optional<ObjectId> object;
            std::optional<CheckpointId> checkpoint;
        };
        struct MotionInterrupted {};
    } // namespace msg

    using InboundMessage = std::variant<msg::FollowSequence,
                                        msg::FollowPoint,
                                        msg::Unfollow,
                                        msg::Activate,
                                        msg::Deactivate,
                                        msg::GroundNormal,
                                        msg::ManualControl,
                                        msg::InternalControl,
                                        msg::Debug>;

    using OutboundMessage = std::variant<msg::OperatorAttached,
                                         msg::OperatorDetached,
                                         msg::MotionPointReached,
                                         msg::MotionFinished,
                                         msg::MotionInterrupted>;

    [[nodiscard]] std::string_view messageName(const OutboundMessage& message);

} // namespace dolly::cam
