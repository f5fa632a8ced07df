/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/ids.hpp"
#include "core/parameters.hpp"
#include "environment.hpp"
#include "messages.hpp"
#include "operator_state.hpp"
#include <span>
#include <utility>

namespace dolly::cam {

    inline constexpr float UNBOUNDED_AXIS_SPAN = 720.0f;

    // Moves a smoothed value toward its target without overshooting
    [[nodiscard]] float smoothStep(float current, float target, float time_constant, float dt);

    // Free look: drives look, zoom and ground alignment toward their targets while no
    // motion sequence owns the camera.
    class LookSmoother {
    public:
        explicit LookSmoother(core::param::OperatorParameters params)
            : params_(std::move(params)) {}

        void step(OperatorState& state, float dt) const;

        // Pulls zoom in front of geometry behind the camera
        void resolveZoomCollision(OperatorState& state, const Environment& env,
                                  std::span<const ObjectId> ignore) const;

        // Applies normalized manual input to the look and zoom targets
        void applyControl(OperatorState& state, const ControlDelta& delta) const;

        // Wrap/clamp correction for bounded axes
        void correctContinuousRotation(OperatorState& state) const;

    private:
        core::param::OperatorParameters params_;
    };

} // namespace dolly::cam
