/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/ids.hpp"
#include "operator/environment.hpp"
#include "operator/messages.hpp"
#include <expected>
#include <filesystem>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dolly::app {

    struct SceneObject {
        ObjectId id = 0;
        glm::vec3 position{0.0f};
        glm::vec3 velocity{0.0f};
        std::optional<glm::vec3> ground_normal;
        std::optional<float> lifetime; // seconds until the object is removed
    };

    struct ScriptedMessage {
        float time = 0.0f;
        cam::InboundMessage message;
    };

    struct Scenario {
        ObjectId operator_id = 1;
        glm::vec3 start_position{0.0f};
        glm::vec3 start_look{0.0f};
        float start_zoom = 0.0f;
        bool start_active = true;

        std::vector<SceneObject> objects;
        std::unordered_map<CheckpointId, cam::CheckpointInfo> checkpoints;
        std::optional<float> ground_height;

        float frame_rate = 60.0f;
        float duration = 10.0f;
        std::vector<ScriptedMessage> script; // sorted by time
    };

    [[nodiscard]] std::expected<Scenario, std::string> load_scenario(const std::filesystem::path& path);
    [[nodiscard]] std::expected<Scenario, std::string> parse_scenario(const std::string& json_text);

} // namespace dolly::app
