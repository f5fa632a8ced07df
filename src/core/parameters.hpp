/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <glm/glm.hpp>
#include <string>

namespace dolly::core::param {

    struct OperatorParameters {
        // Smoothing time constants in seconds, 0 snaps
        float look_smoothing = 0.15f;
        float zoom_smoothing = 0.25f;
        float ground_smoothing = 0.5f;

        // Look limits in degrees per axis (pitch, yaw, roll). A span of 720 or more
        // lets the axis turn without bound.
        glm::vec3 look_min{-89.0f, -180.0f, -180.0f};
        glm::vec3 look_max{89.0f, 180.0f, 180.0f};

        float min_zoom = 0.0f;
        float max_zoom = 50.0f;
        float initial_zoom = 0.0f;
        float collision_margin = 0.3f;

        float ground_alignment_factor = 0.5f;

        // Manual control
        float look_speed = 120.0f;         // degrees per unit of normalized input
        float zoom_speed = 5.0f;           // distance per unit of normalized input
        float pointer_sensitivity = 0.002f; // normalized units per pixel
        float wheel_step = 0.1f;           // normalized zoom per wheel notch
        float key_rate = 1.0f;             // normalized units per second while a key is held

        int path_samples = 64;
    };

    [[nodiscard]] std::expected<OperatorParameters, std::string> read_operator_params_from_json(
        const std::filesystem::path& path);

    [[nodiscard]] std::expected<OperatorParameters, std::string> parse_operator_params(
        const std::string& json_text);

    [[nodiscard]] std::expected<void, std::string> save_operator_params_to_json(
        const OperatorParameters& params, const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, std::string> validate(const OperatorParameters& params);

} // namespace dolly::core::param
