/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "messages.hpp"
#include <glm/glm.hpp>

namespace dolly::cam {

    // Raw device state for one frame
    struct RawInput {
        glm::vec2 pointer_delta{0.0f}; // pixels, +y down
        float wheel = 0.0f;            // notches, + away from the user
        bool pointer_captured = false; // look only follows the pointer while captured
        bool look_left = false;
        bool look_right = false;
        bool look_up = false;
        bool look_down = false;
        bool zoom_in = false;
        bool zoom_out = false;

        RawInput& operator+=(const RawInput& other);
    };

    class InputMapper {
    public:
        explicit InputMapper(const core::param::OperatorParameters& params)
            : pointer_sensitivity_(params.pointer_sensitivity),
              wheel_step_(params.wheel_step),
              key_rate_(params.key_rate) {}

        // Normalized deltas in [-1, 1]; keys contribute key_rate per second
        [[nodiscard]] ControlDelta map(const RawInput& input, float dt) const;

    private:
        float pointer_sensitivity_;
        float wheel_step_;
        float key_rate_;
    };

} // namespace dolly::cam
