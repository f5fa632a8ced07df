/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_sequence.hpp"
#include "core/angles.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <array>

namespace dolly::sequencer {

    std::expected<MotionSequence, std::string> MotionSequence::create(
        MotionPoint start, std::vector<MotionPoint> targets, const int path_samples) {
        if (targets.empty()) {
            return std::unexpected("Motion sequence needs at least one target point");
        }

        std::vector<MotionPoint> points;
        points.reserve(targets.size() + 1);
        start.path.reset();
        start.path_anchor_direction.reset();
        start.derived_anchor = false;
        start.segment_distance = 0.0f;
        start.segment_duration = 0.0f;
        points.push_back(std::move(start));
        for (auto& target : targets) {
            points.push_back(std::move(target));
        }

        MotionSequence sequence(std::move(points), path_samples);
        LOG_DEBUG("Motion sequence created: {} segments, first duration {:.3f}s",
                  sequence.remainingSegments(), sequence.ramp_.duration);
        return sequence;
    }

    MotionSequence::MotionSequence(std::vector<MotionPoint> points, const int path_samples)
        : points_(std::move(points)),
          path_samples_(path_samples) {
        resolveLooks();
        resolveAnchors();
        for (size_t i = 1; i < points_.size(); ++i) {
            buildSegment(i);
        }
        beginSegment();
    }

    void MotionSequence::resolveLooks() {
        auto& first = points_.front();
        first.camera_position = core::cameraPosition(first.position, first.look, first.zoom);
        for (size_t i = 1; i < points_.size(); ++i) {
            const glm::vec3& previous = points_[i - 1].look;
            auto& point = points_[i];
            point.look = previous + core::shortRotation(previous, point.look);
            point.camera_position = core::cameraPosition(point.position, point.look, point.zoom);
        }
    }

    void MotionSequence::resolveAnchors() {
        for (size_t i = 1; i < points_.size(); ++i) {
            resolveAnchor(i);
        }
    }

    void MotionSequence::resolveAnchor(const size_t index) {
        auto& point = points_[index];
        if (point.path_anchor_direction && !point.derived_anchor) {
            const glm::vec3 dir = core::safeNormalize(*point.path_anchor_direction);
            point.path_anchor_direction = dir == glm::vec3(0.0f) ? std::nullopt : std::optional(dir);
            return;
        }
        point.path_anchor_direction.reset();
        point.derived_anchor = false;

        // Interior point followed by a Bezier segment: tangent through the neighbours
        if (index > 0 && index + 1 < points_.size() && points_[index + 1].use_bezier) {
            const glm::vec3 dir = core::safeNormalize(points_[index + 1].camera_position -
                                                      points_[index - 1].camera_position);
            if (dir != glm::vec3(0.0f)) {
                point.path_anchor_direction = dir;
                point.derived_anchor = true;
            }
        }
    }

    void MotionSequence::buildSegment(const size_t target_index) {
        const MotionPoint& from = points_[target_index - 1];
        MotionPoint& to = points_[target_index];

        const float chord = glm::distance(from.camera_position, to.camera_position);
        const float half = 0.5f * chord;

        std::vector<glm::vec3> controls;
        controls.reserve(path::MAX_CONTROL_POINTS);
        controls.push_back(from.camera_position);
        if (from.path_anchor_direction) {
            controls.push_back(from.camera_position + *from.path_anchor_direction * half);
        }
        if (to.path_anchor_direction) {
            controls.push_back(to.camera_position - *to.path_anchor_direction * half);
        }
        controls.push_back(to.camera_position);

        auto curve = path::BezierPath::create(controls, path_samples_);
        if (!curve) {
            LOG_ERROR("Segment path rejected, using the chord: {}", curve.error());
            const std::array chord_ends{from.camera_position, to.camera_position};
            curve = path::BezierPath::create(chord_ends, path_samples_);
        }
        to.path = std::move(*curve);
        to.segment_distance = chord;
        to.segment_duration = makeSpeedRamp(from.speed, to.speed, from.ease_in_out, to.ease_in_out, chord).duration;
    }

    void MotionSequence::beginSegment() {
        const MotionPoint& from = points_[0];
        const MotionPoint& to = points_[1];
        ramp_ = makeSpeedRamp(from.speed, to.speed, from.ease_in_out, to.ease_in_out, to.segment_distance);
        timer_ = 0.0f;
        progress_ = 0.0f;
        speed_ = ramp_.start_speed;
        state_ = MotionState::ADVANCING;
    }

    void MotionSequence::sample(const float time_progress) {
        const RampSample s = sampleSpeedRamp(ramp_, time_progress);
        progress_ = s.progress;
        speed_ = s.speed;
    }

    SequenceStep MotionSequence::update(const float dt) {
        SequenceStep step;
        if (state_ == MotionState::FINISHED) {
            step.pose = pose();
            step.finished = true;
            return step;
        }

        float remaining = std::max(dt, 0.0f);
        // Each pass either stays inside a segment or consumes one boundary
        for (size_t guard = points_.size(); guard > 0; --guard) {
            timer_ += remaining;
            remaining = 0.0f;

            const float duration = ramp_.duration;
            if (duration > 0.0f && timer_ < duration) {
                sample(timer_ / duration);
                state_ = MotionState::ADVANCING;
                break;
            }

            const float overtime = duration > 0.0f ? timer_ - duration : timer_;
            sample(1.0f);
            const MotionPoint& reached = points_[1];

            if (points_.size() == 2) {
                timer_ = duration;
                state_ = MotionState::FINISHED;
                step.arrivals.push_back({reached.attached_object, reached.checkpoint, true});
                step.finished = true;
                LOG_DEBUG("Motion finished at checkpoint '{}'", reached.checkpoint.value_or(""));
                break;
            }

            state_ = MotionState::GLIDING;
            step.arrivals.push_back({reached.attached_object, reached.checkpoint, false});
            LOG_DEBUG("Gliding past checkpoint '{}', carrying {:.4f}s", reached.checkpoint.value_or(""), overtime);

            // Carriers may have moved the neighbours since the tangents were taken
            resolveAnchor(1);
            resolveAnchor(2);
            points_.erase(points_.begin());
            buildSegment(1);
            beginSegment();
            remaining = overtime;
        }

        step.pose = pose();
        return step;
    }

    void MotionSequence::translateAttached(const ObjectId object, const glm::vec3& delta) {
        if (delta == glm::vec3(0.0f)) {
            return;
        }
        for (auto& point : points_) {
            if (point.attached_object != object) {
                continue;
            }
            point.position += delta;
            point.camera_position += delta;
            if (point.path) {
                point.path->translate(delta);
            }
        }
    }

    void MotionSequence::releaseAttached(const ObjectId object) {
        for (auto& point : points_) {
            if (point.attached_object == object) {
                point.attached_object.reset();
            }
        }
    }

    CameraPose MotionSequence::pose() const {
        const MotionPoint& from = points_[0];
        const MotionPoint& to = points_[1];
        if (state_ == MotionState::FINISHED) {
            return {to.position, to.look, to.zoom, 0.0f};
        }
        return {to.path->uniformPosition(progress_),
                glm::mix(from.look, to.look, easeInOut(progress_)),
                0.0f,
                speed_};
    }

} // namespace dolly::sequencer
