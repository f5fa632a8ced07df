/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scenario.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace dolly::app {

    namespace {
        using nlohmann::json;

        glm::vec3 to_vec3(const json& j) {
            return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>()};
        }

        glm::vec3 vec3_or(const json& j, const char* key, const glm::vec3& fallback) {
            return j.contains(key) ? to_vec3(j.at(key)) : fallback;
        }

        std::expected<sequencer::MotionRequest, std::string> parse_request(const json& j) {
            if (j.is_string()) {
                return j.get<std::string>();
            }
            if (!j.is_object()) {
                return std::unexpected("Motion point must be a checkpoint name or an object");
            }
            sequencer::MotionPoint point;
            if (j.contains("object")) {
                point.attached_object = j.at("object").get<ObjectId>();
            }
            point.position = vec3_or(j, "position", point.position);
            point.look = vec3_or(j, "look", point.look);
            point.zoom = j.value("zoom", point.zoom);
            point.speed = j.value("speed", point.speed);
            point.ease_in_out = j.value("inout", point.ease_in_out);
            point.use_bezier = j.value("bezier", point.use_bezier);
            if (j.contains("anchor_direction")) {
                point.path_anchor_direction = to_vec3(j.at("anchor_direction"));
            }
            return point;
        }

        std::expected<cam::InboundMessage, std::string> parse_message(const json& j) {
            const auto name = j.at("message").get<std::string>();
            const ObjectId observer = j.value("observer", ObjectId{0});

            if (name == "follow_sequence") {
                cam::msg::FollowSequence m;
                m.observer = observer;
                for (const auto& p : j.at("points")) {
                    auto request = parse_request(p);
                    if (!request) {
                        return std::unexpected(request.error());
                    }
                    m.points.push_back(std::move(*request));
                }
                return m;
            }
            if (name == "follow_point") {
                auto request = parse_request(j.at("point"));
                if (!request) {
                    return std::unexpected(request.error());
                }
                return cam::msg::FollowPoint{std::move(*request), observer};
            }
            if (name == "unfollow") return cam::msg::Unfollow{};
            if (name == "activate") return cam::msg::Activate{};
            if (name == "deactivate") return cam::msg::Deactivate{};
            if (name == "manual_control") {
                return cam::msg::ManualControl{{j.value("horizontal", 0.0f),
                                                j.value("vertical", 0.0f),
                                                j.value("zoom", 0.0f)}};
            }
            if (name == "internal_control") return cam::msg::InternalControl{j.value("enabled", true)};
            if (name == "debug") return cam::msg::Debug{j.value("enabled", true)};
            return std::unexpected("Unknown message '" + name + "'");
        }
    } // namespace

    std::expected<Scenario, std::string> parse_scenario(const std::string& json_text) {
        try {
            const auto j = json::parse(json_text);
            Scenario scenario;

            if (j.contains("operator")) {
                const auto& op = j.at("operator");
                scenario.operator_id = op.value("id", scenario.operator_id);
                scenario.start_position = vec3_or(op, "position", scenario.start_position);
                scenario.start_look = vec3_or(op, "look", scenario.start_look);
                scenario.start_zoom = op.value("zoom", scenario.start_zoom);
                scenario.start_active = op.value("active", scenario.start_active);
            }

            for (const auto& o : j.value("objects", json::array())) {
                SceneObject object;
                object.id = o.at("id").get<ObjectId>();
                object.position = vec3_or(o, "position", object.position);
                object.velocity = vec3_or(o, "velocity", object.velocity);
                if (o.contains("ground_normal")) {
                    object.ground_normal = to_vec3(o.at("ground_normal"));
                }
                if (o.contains("lifetime")) {
                    object.lifetime = o.at("lifetime").get<float>();
                }
                scenario.objects.push_back(object);
            }

            for (const auto& c : j.value("checkpoints", json::array())) {
                cam::CheckpointInfo info;
                info.position = vec3_or(c, "position", info.position);
                info.orientation = vec3_or(c, "orientation", info.orientation);
                if (c.contains("parent")) {
                    info.parent = c.at("parent").get<ObjectId>();
                }
                const auto properties = c.value("properties", json::object());
                for (const auto& [key, value] : properties.items()) {
                    info.properties[key] = value.is_boolean() ? (value.get<bool>() ? 1.0f : 0.0f)
                                                              : value.get<float>();
                }
                scenario.checkpoints.emplace(c.at("id").get<std::string>(), std::move(info));
            }

            if (j.contains("ground_height")) {
                scenario.ground_height = j.at("ground_height").get<float>();
            }
            scenario.frame_rate = j.value("frame_rate", scenario.frame_rate);
            scenario.duration = j.value("duration", scenario.duration);
            if (scenario.frame_rate <= 0.0f) {
                return std::unexpected("frame_rate must be positive");
            }

            for (const auto& s : j.value("script", json::array())) {
                auto message = parse_message(s);
                if (!message) {
                    return std::unexpected(message.error());
                }
                scenario.script.push_back({s.value("time", 0.0f), std::move(*message)});
            }
            std::stable_sort(scenario.script.begin(), scenario.script.end(),
                             [](const ScriptedMessage& a, const ScriptedMessage& b) { return a.time < b.time; });

            return scenario;
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Scenario parse failed: ") + e.what());
        }
    }

    std::expected<Scenario, std::string> load_scenario(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected("Failed to open scenario file: " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        auto scenario = parse_scenario(buffer.str());
        if (scenario) {
            LOG_INFO("Loaded scenario {}: {} checkpoints, {} objects, {} scripted messages",
                     path.string(), scenario->checkpoints.size(), scenario->objects.size(),
                     scenario->script.size());
        }
        return scenario;
    }

} // namespace dolly::app
