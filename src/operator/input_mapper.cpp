/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "input_mapper.hpp"
#include <algorithm>

namespace dolly::cam {

    namespace {
        float axis(const bool negative, const bool positive) {
            return (positive ? 1.0f : 0.0f) - (negative ? 1.0f : 0.0f);
        }
    } // namespace

    RawInput& RawInput::operator+=(const RawInput& other) {
        pointer_delta += other.pointer_delta;
        wheel += other.wheel;
        pointer_captured = pointer_captured || other.pointer_captured;
        look_left = look_left || other.look_left;
        look_right = look_right || other.look_right;
        look_up = look_up || other.look_up;
        look_down = look_down || other.look_down;
        zoom_in = zoom_in || other.zoom_in;
        zoom_out = zoom_out || other.zoom_out;
        return *this;
    }

    ControlDelta InputMapper::map(const RawInput& input, const float dt) const {
        const float key_step = key_rate_ * std::max(dt, 0.0f);

        ControlDelta delta;
        if (input.pointer_captured) {
            delta.horizontal = -input.pointer_delta.x * pointer_sensitivity_;
            delta.vertical = -input.pointer_delta.y * pointer_sensitivity_;
        }
        delta.horizontal += axis(input.look_right, input.look_left) * key_step;
        delta.vertical += axis(input.look_down, input.look_up) * key_step;
        delta.zoom = -input.wheel * wheel_step_ + axis(input.zoom_in, input.zoom_out) * key_step;

        delta.horizontal = std::clamp(delta.horizontal, -1.0f, 1.0f);
        delta.vertical = std::clamp(delta.vertical, -1.0f, 1.0f);
        delta.zoom = std::clamp(delta.zoom, -1.0f, 1.0f);
        return delta;
    }

} // namespace dolly::cam
