/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "operator/environment.hpp"
#include "scenario.hpp"
#include <functional>
#include <vector>

namespace dolly::app {

    // Scene stand-in for the runner: static checkpoints, objects moving at constant
    // velocity and an optional horizontal ground plane for collision rays.
    class SimEnvironment final : public cam::Environment {
    public:
        using PostCallback = std::function<void(ObjectId, const cam::OutboundMessage&)>;

        explicit SimEnvironment(const Scenario& scenario);

        void advance(float dt);
        void setPostCallback(PostCallback callback) { on_post_ = std::move(callback); }

        [[nodiscard]] std::optional<glm::vec3> groundNormal(ObjectId id) const;

        [[nodiscard]] std::optional<cam::CheckpointInfo> resolveCheckpoint(const CheckpointId& id) const override;
        [[nodiscard]] std::optional<glm::vec3> objectPosition(ObjectId id) const override;
        [[nodiscard]] std::optional<cam::RayHit> castRay(const glm::vec3& origin,
                                                         const glm::vec3& direction,
                                                         float max_distance,
                                                         std::span<const ObjectId> ignore) const override;
        void post(ObjectId target, const cam::OutboundMessage& message) override;

    private:
        [[nodiscard]] const SceneObject* find(ObjectId id) const;

        std::vector<SceneObject> objects_;
        std::unordered_map<CheckpointId, cam::CheckpointInfo> checkpoints_;
        std::optional<float> ground_height_;
        PostCallback on_post_;
    };

} // namespace dolly::app
