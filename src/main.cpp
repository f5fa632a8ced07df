/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/scenario.hpp"
#include "app/sim_environment.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "operator/camera_operator.hpp"

#include <cmath>
#include <cstdio>
#include <expected>
#include <string>
#include <string_view>

namespace {

    struct Options {
        std::string scenario;
        std::string config;
        std::string log_file;
        dolly::core::LogLevel log_level = dolly::core::LogLevel::Info;
    };

    std::expected<dolly::core::LogLevel, std::string> parse_level(const std::string_view name) {
        using dolly::core::LogLevel;
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "off") return LogLevel::Off;
        return std::unexpected("Unknown log level '" + std::string(name) + "'");
    }

    std::expected<Options, std::string> parse_args(const int argc, char* argv[]) {
        Options options;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            const auto next = [&]() -> std::expected<std::string, std::string> {
                if (i + 1 >= argc) {
                    return std::unexpected("Missing value for " + std::string(arg));
                }
                return std::string(argv[++i]);
            };

            if (arg == "--config" || arg == "--log-file" || arg == "--log-level") {
                auto value = next();
                if (!value) {
                    return std::unexpected(value.error());
                }
                if (arg == "--config") {
                    options.config = *value;
                } else if (arg == "--log-file") {
                    options.log_file = *value;
                } else {
                    auto level = parse_level(*value);
                    if (!level) {
                        return std::unexpected(level.error());
                    }
                    options.log_level = *level;
                }
            } else if (arg.starts_with("--")) {
                return std::unexpected("Unknown option " + std::string(arg));
            } else {
                options.scenario = arg;
            }
        }
        if (options.scenario.empty()) {
            return std::unexpected("Usage: dolly_sim <scenario.json> [--config params.json] "
                                   "[--log-level trace|debug|info|warn|error|off] [--log-file path]");
        }
        return options;
    }

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        std::fprintf(stderr, "Error: %s\n", options.error().c_str());
        return -1;
    }

    dolly::core::Logger::get().init(options->log_level, options->log_file);

    dolly::core::param::OperatorParameters params;
    if (!options->config.empty()) {
        auto loaded = dolly::core::param::read_operator_params_from_json(options->config);
        if (!loaded) {
            LOG_ERROR("Failed to load operator parameters: {}", loaded.error());
            return -1;
        }
        params = std::move(*loaded);
    }

    auto scenario = dolly::app::load_scenario(options->scenario);
    if (!scenario) {
        LOG_ERROR("Failed to load scenario: {}", scenario.error());
        return -1;
    }

    LOG_INFO("========================================");
    LOG_INFO("DollyCam scenario runner");
    LOG_INFO("========================================");

    dolly::app::SimEnvironment env(*scenario);
    dolly::cam::CameraOperator camera(scenario->operator_id, env, params);
    camera.placeAt(scenario->start_position, scenario->start_look, scenario->start_zoom);
    if (scenario->start_active) {
        camera.activate();
    }

    const float dt = 1.0f / scenario->frame_rate;
    const auto frames = static_cast<long>(std::ceil(scenario->duration * scenario->frame_rate));
    size_t next_message = 0;

    {
        LOG_TIMER("Scenario");
        for (long frame = 0; frame < frames; ++frame) {
            const float now = static_cast<float>(frame) * dt;
            while (next_message < scenario->script.size() && scenario->script[next_message].time <= now) {
                if (auto result = camera.handle(scenario->script[next_message].message); !result) {
                    LOG_WARN("t={:.3f}: message rejected: {}", now, result.error());
                }
                ++next_message;
            }

            env.advance(dt);
            if (const auto attached = camera.attachedObject()) {
                if (const auto normal = env.groundNormal(*attached)) {
                    camera.setGroundNormal(*normal);
                }
            }
            camera.update(dt);
        }
    }

    const glm::vec3 pos = camera.cameraPosition();
    const glm::vec3 look = camera.cameraLook();
    LOG_INFO("Final camera: position ({:.3f}, {:.3f}, {:.3f}) look ({:.2f}, {:.2f}, {:.2f})",
             pos.x, pos.y, pos.z, look.x, look.y, look.z);
    dolly::core::Logger::get().flush();
    return 0;
}
