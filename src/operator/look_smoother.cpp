/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "look_smoother.hpp"
#include "core/angles.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace dolly::cam {

    namespace {
        constexpr float FULL_TURN = 360.0f;
    } // namespace

    float smoothStep(const float current, const float target, const float time_constant, const float dt) {
        const float delta = target - current;
        if (time_constant <= 0.0f) {
            return target;
        }
        const float factor = std::min(std::max(dt, 0.0f) / time_constant, 1.0f);
        return current + delta * factor;
    }

    void LookSmoother::correctContinuousRotation(OperatorState& state) const {
        for (int axis = 0; axis < 3; ++axis) {
            const float lo = params_.look_min[axis];
            const float hi = params_.look_max[axis];
            const float span = hi - lo;
            if (span >= UNBOUNDED_AXIS_SPAN) {
                continue;
            }

            float& current = state.look[axis];
            float& target = state.look_target[axis];
            const bool above = current > hi && target > hi;
            const bool below = current < lo && target < lo;
            if (!(above || below) || std::abs(target - current) >= FULL_TURN) {
                continue;
            }

            if (span >= FULL_TURN) {
                // Same orientation one turn over, move both without snapping
                const float turns = above ? std::ceil((current - hi) / FULL_TURN)
                                          : -std::ceil((lo - current) / FULL_TURN);
                current -= turns * FULL_TURN;
                target -= turns * FULL_TURN;
            } else {
                current = std::clamp(current, lo, hi);
                target = std::clamp(target, lo, hi);
            }
        }
    }

    void LookSmoother::step(OperatorState& state, const float dt) const {
        correctContinuousRotation(state);

        for (int axis = 0; axis < 3; ++axis) {
            state.look[axis] = smoothStep(state.look[axis], state.look_target[axis], params_.look_smoothing, dt);
        }
        state.zoom = smoothStep(state.zoom, state.zoom_target, params_.zoom_smoothing, dt);
        state.ground_alignment = smoothStep(state.ground_alignment, state.ground_alignment_target,
                                            params_.ground_smoothing, dt);
    }

    void LookSmoother::resolveZoomCollision(OperatorState& state, const Environment& env,
                                            const std::span<const ObjectId> ignore) const {
        const float reach = state.zoom + params_.collision_margin;
        if (reach <= 0.0f) {
            state.zoom_obstructed = false;
            state.interrupted_zoom.reset();
            return;
        }

        const auto hit = env.castRay(state.position, core::backVector(state.look), reach, ignore);
        if (!hit) {
            state.zoom_obstructed = false;
            state.interrupted_zoom.reset();
            return;
        }

        const float fraction = std::clamp(hit->fraction, 0.0f, 1.0f);
        const float clamped = std::max(reach * fraction - params_.collision_margin, 0.0f);
        state.zoom = std::min(state.zoom, clamped);

        // Remember the boundary once per obstruction; a consumed boundary stays consumed
        if (!state.zoom_obstructed || state.interrupted_zoom) {
            state.interrupted_zoom = state.zoom;
        }
        state.zoom_obstructed = true;
        LOG_TRACE("Zoom obstructed at {:.3f} (target {:.3f})", state.zoom, state.zoom_target);
    }

    void LookSmoother::applyControl(OperatorState& state, const ControlDelta& delta) const {
        state.look_target.y += delta.horizontal * params_.look_speed;
        state.look_target.x += delta.vertical * params_.look_speed;
        for (int axis = 0; axis < 3; ++axis) {
            const float span = params_.look_max[axis] - params_.look_min[axis];
            if (span < FULL_TURN) {
                state.look_target[axis] = std::clamp(state.look_target[axis],
                                                     params_.look_min[axis], params_.look_max[axis]);
            }
        }

        if (delta.zoom != 0.0f) {
            const float base = state.interrupted_zoom.value_or(state.zoom_target);
            state.zoom_target = std::clamp(base + delta.zoom * params_.zoom_speed,
                                           params_.min_zoom, params_.max_zoom);
            state.interrupted_zoom.reset();
        }
    }

} // namespace dolly::cam
