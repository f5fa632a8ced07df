/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "easing.hpp"
#include "motion_point.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace dolly::sequencer {

    enum class MotionState : uint8_t {
        IDLE,
        ADVANCING,
        GLIDING,
        FINISHED
    };

    struct Arrival {
        std::optional<ObjectId> object;
        std::optional<CheckpointId> checkpoint;
        bool final = false;
    };

    struct SequenceStep {
        CameraPose pose;
        std::vector<Arrival> arrivals;
        bool finished = false;
    };

    // Ordered motion points walked segment by segment. Point 0 is always the start of
    // the segment in flight; completed segments are dropped from the front.
    class MotionSequence {
    public:
        // `start` is the live camera state with zoom already collapsed into its position.
        [[nodiscard]] static std::expected<MotionSequence, std::string> create(
            MotionPoint start, std::vector<MotionPoint> targets,
            int path_samples = path::DEFAULT_PATH_SAMPLES);

        // Advances by exactly dt, gliding over as many segment boundaries as dt covers
        SequenceStep update(float dt);

        // Rigidly moves every point attached to `object`
        void translateAttached(ObjectId object, const glm::vec3& delta);

        // Points on `object` stay where they are and no longer report it
        void releaseAttached(ObjectId object);

        [[nodiscard]] MotionState state() const { return state_; }
        [[nodiscard]] bool finished() const { return state_ == MotionState::FINISHED; }
        [[nodiscard]] size_t remainingSegments() const { return points_.size() - 1; }
        [[nodiscard]] std::span<const MotionPoint> points() const { return points_; }
        [[nodiscard]] const MotionPoint& segmentStart() const { return points_[0]; }
        [[nodiscard]] const MotionPoint& segmentTarget() const { return points_[1]; }

        [[nodiscard]] float timer() const { return timer_; }
        [[nodiscard]] float pathProgress() const { return progress_; }
        [[nodiscard]] float currentSpeed() const { return speed_; }
        [[nodiscard]] CameraPose pose() const;

    private:
        MotionSequence(std::vector<MotionPoint> points, int path_samples);

        void resolveLooks();
        void resolveAnchors();
        void resolveAnchor(size_t index);
        void buildSegment(size_t target_index);
        void beginSegment();
        void sample(float time_progress);

        std::vector<MotionPoint> points_;
        int path_samples_;
        SpeedRamp ramp_;
        MotionState state_ = MotionState::ADVANCING;
        float timer_ = 0.0f;
        float progress_ = 0.0f;
        float speed_ = 0.0f;
    };

} // namespace dolly::sequencer
