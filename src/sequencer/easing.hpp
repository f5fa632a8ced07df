/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

namespace dolly::sequencer {

    // Cubic ease-in-out on [0, 1], input clamped
    [[nodiscard]] float easeInOut(float t);

    // Speed over one segment as a function of time progress. Path progress is the
    // integral of speed over time, normalized by the segment distance.
    struct SpeedRamp {
        float start_speed = 0.0f;
        float cruise_speed = 0.0f; // peak at half time, two-half ramps only
        float end_speed = 0.0f;
        float duration = 0.0f;
        float distance = 0.0f;
        bool two_half = false;
    };

    struct RampSample {
        float progress = 0.0f;
        float speed = 0.0f;
    };

    // Eased endpoints start/stop at rest; the cruise speed is chosen so the ramp
    // covers `distance` in distance / average(start_speed, end_speed).
    [[nodiscard]] SpeedRamp makeSpeedRamp(float start_speed, float end_speed,
                                          bool ease_start, bool ease_end, float distance);

    [[nodiscard]] RampSample sampleSpeedRamp(const SpeedRamp& ramp, float time_progress);

} // namespace dolly::sequencer
