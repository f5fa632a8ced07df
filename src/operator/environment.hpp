/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/ids.hpp"
#include "messages.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace dolly::cam {

    struct CheckpointInfo {
        glm::vec3 position{0.0f};
        std::optional<ObjectId> parent;
        glm::vec3 orientation{0.0f}; // degrees
        std::unordered_map<std::string, float> properties; // zoom, speed, inout, bezier
    };

    struct RayHit {
        float fraction = 1.0f; // of the ray length
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
    };

    // Everything the operator needs from the scene it lives in
    class Environment {
    public:
        virtual ~Environment() = default;

        [[nodiscard]] virtual std::optional<CheckpointInfo> resolveCheckpoint(const CheckpointId& id) const = 0;

        // nullopt once the object no longer exists
        [[nodiscard]] virtual std::optional<glm::vec3> objectPosition(ObjectId id) const = 0;

        [[nodiscard]] virtual std::optional<RayHit> castRay(const glm::vec3& origin,
                                                            const glm::vec3& direction,
                                                            float max_distance,
                                                            std::span<const ObjectId> ignore) const = 0;

        virtual void post(ObjectId target, const OutboundMessage& message) = 0;
    };

} // namespace dolly::cam
