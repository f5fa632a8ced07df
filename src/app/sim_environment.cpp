/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sim_environment.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace dolly::app {

    SimEnvironment::SimEnvironment(const Scenario& scenario)
        : objects_(scenario.objects),
          checkpoints_(scenario.checkpoints),
          ground_height_(scenario.ground_height) {}

    const SceneObject* SimEnvironment::find(const ObjectId id) const {
        const auto it = std::find_if(objects_.begin(), objects_.end(),
                                     [id](const SceneObject& o) { return o.id == id; });
        return it != objects_.end() ? &*it : nullptr;
    }

    void SimEnvironment::advance(const float dt) {
        for (auto& object : objects_) {
            object.position += object.velocity * dt;
            if (object.lifetime) {
                *object.lifetime -= dt;
            }
        }
        const auto expired = std::remove_if(objects_.begin(), objects_.end(), [](const SceneObject& o) {
            return o.lifetime && *o.lifetime <= 0.0f;
        });
        for (auto it = expired; it != objects_.end(); ++it) {
            LOG_INFO("Object {} removed from scene", it->id);
        }
        objects_.erase(expired, objects_.end());
    }

    std::optional<glm::vec3> SimEnvironment::groundNormal(const ObjectId id) const {
        const auto* object = find(id);
        return object ? object->ground_normal : std::nullopt;
    }

    std::optional<cam::CheckpointInfo> SimEnvironment::resolveCheckpoint(const CheckpointId& id) const {
        const auto it = checkpoints_.find(id);
        if (it == checkpoints_.end()) {
            return std::nullopt;
        }
        cam::CheckpointInfo info = it->second;
        // Checkpoints parented to a moving object travel with it
        if (info.parent) {
            if (const auto* parent = find(*info.parent)) {
                info.position += parent->position;
            }
        }
        return info;
    }

    std::optional<glm::vec3> SimEnvironment::objectPosition(const ObjectId id) const {
        const auto* object = find(id);
        return object ? std::optional(object->position) : std::nullopt;
    }

    std::optional<cam::RayHit> SimEnvironment::castRay(const glm::vec3& origin,
                                                       const glm::vec3& direction,
                                                       const float max_distance,
                                                       std::span<const ObjectId>) const {
        if (!ground_height_ || max_distance <= 0.0f || std::abs(direction.y) < 1e-6f) {
            return std::nullopt;
        }
        const float t = (*ground_height_ - origin.y) / direction.y;
        if (t < 0.0f || t > max_distance) {
            return std::nullopt;
        }
        return cam::RayHit{t / max_distance, glm::vec3(0.0f, 1.0f, 0.0f)};
    }

    void SimEnvironment::post(const ObjectId target, const cam::OutboundMessage& message) {
        LOG_INFO("-> {} : {}", target, cam::messageName(message));
        if (on_post_) {
            on_post_(target, message);
        }
    }

} // namespace dolly::app
