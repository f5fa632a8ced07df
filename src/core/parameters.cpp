/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "parameters.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace dolly::core::param {

    namespace {
        constexpr int JSON_VERSION = 1;

        glm::vec3 read_vec3(const nlohmann::json& j, const char* key, const glm::vec3& fallback) {
            if (!j.contains(key)) {
                return fallback;
            }
            const auto& v = j.at(key);
            return {v.at(0).get<float>(), v.at(1).get<float>(), v.at(2).get<float>()};
        }

        OperatorParameters from_json(const nlohmann::json& j) {
            OperatorParameters p;
            p.look_smoothing = j.value("look_smoothing", p.look_smoothing);
            p.zoom_smoothing = j.value("zoom_smoothing", p.zoom_smoothing);
            p.ground_smoothing = j.value("ground_smoothing", p.ground_smoothing);
            p.look_min = read_vec3(j, "look_min", p.look_min);
            p.look_max = read_vec3(j, "look_max", p.look_max);
            p.min_zoom = j.value("min_zoom", p.min_zoom);
            p.max_zoom = j.value("max_zoom", p.max_zoom);
            p.initial_zoom = j.value("initial_zoom", p.initial_zoom);
            p.collision_margin = j.value("collision_margin", p.collision_margin);
            p.ground_alignment_factor = j.value("ground_alignment_factor", p.ground_alignment_factor);
            p.look_speed = j.value("look_speed", p.look_speed);
            p.zoom_speed = j.value("zoom_speed", p.zoom_speed);
            p.pointer_sensitivity = j.value("pointer_sensitivity", p.pointer_sensitivity);
            p.wheel_step = j.value("wheel_step", p.wheel_step);
            p.key_rate = j.value("key_rate", p.key_rate);
            p.path_samples = j.value("path_samples", p.path_samples);
            return p;
        }
    } // namespace

    std::expected<void, std::string> validate(const OperatorParameters& params) {
        if (params.path_samples < 2) {
            return std::unexpected("path_samples must be at least 2");
        }
        if (params.min_zoom < 0.0f || params.min_zoom > params.max_zoom) {
            return std::unexpected("zoom range must satisfy 0 <= min_zoom <= max_zoom");
        }
        if (params.initial_zoom < params.min_zoom || params.initial_zoom > params.max_zoom) {
            return std::unexpected("initial_zoom outside [min_zoom, max_zoom]");
        }
        for (int axis = 0; axis < 3; ++axis) {
            if (params.look_min[axis] > params.look_max[axis]) {
                return std::unexpected("look_min exceeds look_max on axis " + std::to_string(axis));
            }
        }
        if (params.look_smoothing < 0.0f || params.zoom_smoothing < 0.0f || params.ground_smoothing < 0.0f) {
            return std::unexpected("smoothing constants must not be negative");
        }
        if (params.collision_margin < 0.0f) {
            return std::unexpected("collision_margin must not be negative");
        }
        return {};
    }

    std::expected<OperatorParameters, std::string> parse_operator_params(const std::string& json_text) {
        try {
            const auto j = nlohmann::json::parse(json_text);
            if (!j.is_object()) {
                return std::unexpected("Operator parameters must be a JSON object");
            }
            auto params = from_json(j);
            if (auto valid = validate(params); !valid) {
                return std::unexpected(valid.error());
            }
            return params;
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Failed to parse operator parameters: ") + e.what());
        }
    }

    std::expected<OperatorParameters, std::string> read_operator_params_from_json(
        const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected("Failed to open operator parameters: " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        auto result = parse_operator_params(buffer.str());
        if (result) {
            LOG_INFO("Loaded operator parameters from {}", path.string());
        }
        return result;
    }

    std::expected<void, std::string> save_operator_params_to_json(
        const OperatorParameters& p, const std::filesystem::path& path) {
        try {
            nlohmann::json j;
            j["version"] = JSON_VERSION;
            j["look_smoothing"] = p.look_smoothing;
            j["zoom_smoothing"] = p.zoom_smoothing;
            j["ground_smoothing"] = p.ground_smoothing;
            j["look_min"] = {p.look_min.x, p.look_min.y, p.look_min.z};
            j["look_max"] = {p.look_max.x, p.look_max.y, p.look_max.z};
            j["min_zoom"] = p.min_zoom;
            j["max_zoom"] = p.max_zoom;
            j["initial_zoom"] = p.initial_zoom;
            j["collision_margin"] = p.collision_margin;
            j["ground_alignment_factor"] = p.ground_alignment_factor;
            j["look_speed"] = p.look_speed;
            j["zoom_speed"] = p.zoom_speed;
            j["pointer_sensitivity"] = p.pointer_sensitivity;
            j["wheel_step"] = p.wheel_step;
            j["key_rate"] = p.key_rate;
            j["path_samples"] = p.path_samples;

            std::ofstream file(path);
            if (!file.is_open()) {
                return std::unexpected("Failed to open file for writing: " + path.string());
            }
            file << j.dump(2);
            LOG_INFO("Saved operator parameters to {}", path.string());
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Failed to save operator parameters: ") + e.what());
        }
    }

} // namespace dolly::core::param
