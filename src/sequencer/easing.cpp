/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "easing.hpp"
#include <algorithm>

namespace dolly::sequencer {

    namespace {
        constexpr float MIN_DISTANCE = 1e-6f;
    } // namespace

    float easeInOut(const float t) {
        const float c = std::clamp(t, 0.0f, 1.0f);
        if (c < 0.5f) {
            return 4.0f * c * c * c;
        }
        const float u = -2.0f * c + 2.0f;
        return 1.0f - 0.5f * u * u * u;
    }

    SpeedRamp makeSpeedRamp(const float start_speed, const float end_speed,
                            const bool ease_start, const bool ease_end, const float distance) {
        SpeedRamp ramp;
        const float s0 = std::max(start_speed, 0.0f);
        const float s1 = std::max(end_speed, 0.0f);
        const float average = 0.5f * (s0 + s1);

        ramp.distance = std::max(distance, 0.0f);
        ramp.duration = (average > 0.0f && ramp.distance > MIN_DISTANCE) ? ramp.distance / average : 0.0f;
        ramp.two_half = ease_start || ease_end;
        ramp.start_speed = ease_start ? 0.0f : s0;
        ramp.end_speed = ease_end ? 0.0f : s1;
        // Area of the two trapezoids equals average * duration
        ramp.cruise_speed = ramp.two_half ? 2.0f * average - 0.5f * (ramp.start_speed + ramp.end_speed)
                                          : average;
        return ramp;
    }

    RampSample sampleSpeedRamp(const SpeedRamp& ramp, const float time_progress) {
        const float t = std::clamp(time_progress, 0.0f, 1.0f);

        if (ramp.duration <= 0.0f || ramp.distance <= MIN_DISTANCE) {
            return {t, 0.0f};
        }

        float travelled = 0.0f;
        float speed = 0.0f;
        if (ramp.two_half) {
            if (t <= 0.5f) {
                speed = ramp.start_speed + (ramp.cruise_speed - ramp.start_speed) * (t / 0.5f);
                travelled = ramp.duration * t * 0.5f * (ramp.start_speed + speed);
            } else {
                const float first_half = ramp.duration * 0.5f * 0.5f * (ramp.start_speed + ramp.cruise_speed);
                const float u = t - 0.5f;
                speed = ramp.cruise_speed + (ramp.end_speed - ramp.cruise_speed) * (u / 0.5f);
                travelled = first_half + ramp.duration * u * 0.5f * (ramp.cruise_speed + speed);
            }
        } else {
            speed = ramp.start_speed + (ramp.end_speed - ramp.start_speed) * t;
            travelled = ramp.duration * t * 0.5f * (ramp.start_speed + speed);
        }

        const float progress = t >= 1.0f ? 1.0f : std::clamp(travelled / ramp.distance, 0.0f, 1.0f);
        return {progress, speed};
    }

} // namespace dolly::sequencer
