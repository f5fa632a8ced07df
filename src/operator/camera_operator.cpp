/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera_operator.hpp"
#include "core/angles.hpp"
#include "core/logger.hpp"
#include "ground_alignment.hpp"
#include <array>
#include <type_traits>

namespace dolly::cam {

    namespace {
        constexpr const char* PROP_ZOOM = "zoom";
        constexpr const char* PROP_SPEED = "speed";
        constexpr const char* PROP_INOUT = "inout";
        constexpr const char* PROP_BEZIER = "bezier";

        float property(const CheckpointInfo& info, const char* key, const float fallback) {
            const auto it = info.properties.find(key);
            return it != info.properties.end() ? it->second : fallback;
        }

        core::param::OperatorParameters checkedParameters(core::param::OperatorParameters params, const ObjectId id) {
            if (const auto valid = core::param::validate(params); !valid) {
                LOG_ERROR("Operator {} rejected its parameters, using defaults: {}", id, valid.error());
                return {};
            }
            return params;
        }
    } // namespace

    CameraOperator::CameraOperator(const ObjectId id, Environment& env, core::param::OperatorParameters params)
        : id_(id),
          env_(env),
          params_(checkedParameters(std::move(params), id)),
          smoother_(params_),
          input_mapper_(params_),
          attachment_(id, env) {
        state_.zoom = params_.initial_zoom;
        state_.zoom_target = params_.initial_zoom;
    }

    std::expected<void, std::string> CameraOperator::handle(const InboundMessage& message) {
        return std::visit([this](const auto& m) -> std::expected<void, std::string> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, msg::FollowSequence>) {
                return followSequence(m.points, m.observer);
            } else if constexpr (std::is_same_v<T, msg::FollowPoint>) {
                return followPoint(m.point, m.observer);
            } else if constexpr (std::is_same_v<T, msg::Unfollow>) {
                unfollow();
            } else if constexpr (std::is_same_v<T, msg::Activate>) {
                activate();
            } else if constexpr (std::is_same_v<T, msg::Deactivate>) {
                deactivate();
            } else if constexpr (std::is_same_v<T, msg::GroundNormal>) {
                setGroundNormal(m.normal);
            } else if constexpr (std::is_same_v<T, msg::ManualControl>) {
                manualControl(m.delta);
            } else if constexpr (std::is_same_v<T, msg::InternalControl>) {
                setInternalControl(m.enabled);
            } else if constexpr (std::is_same_v<T, msg::Debug>) {
                setDebug(m.enabled);
            }
            return {};
        },
                          message);
    }

    std::expected<sequencer::MotionPoint, std::string> CameraOperator::resolve(
        const sequencer::MotionRequest& request) const {
        if (const auto* point = std::get_if<sequencer::MotionPoint>(&request)) {
            return *point;
        }

        const auto& checkpoint = std::get<CheckpointId>(request);
        const auto info = env_.resolveCheckpoint(checkpoint);
        if (!info) {
            return std::unexpected("Unknown checkpoint '" + checkpoint + "'");
        }

        sequencer::MotionPoint point;
        point.attached_object = info->parent;
        point.position = info->position;
        point.look = info->orientation;
        point.zoom = property(*info, PROP_ZOOM, 0.0f);
        point.speed = property(*info, PROP_SPEED, 0.0f);
        point.ease_in_out = property(*info, PROP_INOUT, 0.0f) != 0.0f;
        point.use_bezier = property(*info, PROP_BEZIER, 0.0f) != 0.0f;
        point.checkpoint = checkpoint;
        return point;
    }

    std::expected<void, std::string> CameraOperator::followSequence(
        const std::vector<sequencer::MotionRequest>& requests, const ObjectId observer) {
        if (requests.empty()) {
            LOG_WARN("Operator {}: follow request without target points ignored", id_);
            return std::unexpected("Follow request needs at least one target point");
        }

        std::vector<sequencer::MotionPoint> targets;
        targets.reserve(requests.size());
        for (const auto& request : requests) {
            auto point = resolve(request);
            if (!point) {
                LOG_ERROR("Operator {}: {}", id_, point.error());
                return std::unexpected(point.error());
            }
            targets.push_back(std::move(*point));
        }

        const float carried_speed = sequence_ ? sequence_->currentSpeed() : 0.0f;
        interruptMotion();

        // Collapse zoom into the world position so the path starts at the lens
        state_.position = core::cameraPosition(state_.position, state_.look, state_.zoom);
        state_.zoom = 0.0f;

        sequencer::MotionPoint start;
        start.attached_object = attachment_.attached();
        start.position = state_.position;
        start.look = state_.look;
        start.speed = carried_speed;

        auto sequence = sequencer::MotionSequence::create(std::move(start), std::move(targets), params_.path_samples);
        if (!sequence) {
            return std::unexpected(sequence.error());
        }
        sequence_.emplace(std::move(*sequence));
        observer_ = observer;
        ++motion_generation_;
        std::vector<ObjectId> missing;
        for (const auto& point : sequence_->points()) {
            if (!point.attached_object || carriers_.contains(*point.attached_object)) {
                continue;
            }
            if (const auto position = env_.objectPosition(*point.attached_object)) {
                carriers_.emplace(*point.attached_object, *position);
            } else {
                missing.push_back(*point.attached_object);
            }
        }
        for (const ObjectId object : missing) {
            LOG_WARN("Operator {}: object {} is gone, its points stay in place", id_, object);
            sequence_->releaseAttached(object);
        }
        settleTargets();
        syncAttachment(sequence_->segmentTarget().attached_object);

        LOG_INFO("Operator {} following {} point(s) for observer {}", id_, requests.size(), observer);
        return {};
    }

    std::expected<void, std::string> CameraOperator::followPoint(const sequencer::MotionRequest& request,
                                                                 const ObjectId observer) {
        return followSequence({request}, observer);
    }

    void CameraOperator::unfollow() {
        interruptMotion();
    }

    void CameraOperator::interruptMotion() {
        if (!sequence_) {
            return;
        }
        const size_t remaining = sequence_->remainingSegments();
        resetMotion();
        ++motion_generation_;

        // A single pending segment is about to finish anyway and is not reported
        if (remaining > 1) {
            LOG_DEBUG("Operator {}: motion interrupted with {} segments left", id_, remaining);
            env_.post(observer_, msg::MotionInterrupted{});
        }
    }

    void CameraOperator::resetMotion() {
        sequence_.reset();
        carriers_.clear();
        settleTargets();
    }

    void CameraOperator::carrySequenceObjects() {
        for (auto it = carriers_.begin(); it != carriers_.end();) {
            const auto position = env_.objectPosition(it->first);
            if (!position) {
                // Points on a vanished object stay where it was last seen
                LOG_DEBUG("Operator {}: object {} vanished during motion", id_, it->first);
                sequence_->releaseAttached(it->first);
                it = carriers_.erase(it);
                continue;
            }
            sequence_->translateAttached(it->first, *position - it->second);
            it->second = *position;
            ++it;
        }
    }

    void CameraOperator::settleTargets() {
        state_.look_target = state_.look;
        state_.zoom_target = state_.zoom;
        state_.interrupted_zoom.reset();
        state_.zoom_obstructed = false;
    }

    void CameraOperator::syncAttachment(const std::optional<ObjectId>& object) {
        if (object == attachment_.attached()) {
            return;
        }
        if (object) {
            if (const auto result = attachment_.attach(*object); !result) {
                LOG_WARN("Operator {}: {}", id_, result.error());
            }
        } else {
            detach();
        }
    }

    void CameraOperator::detach() {
        attachment_.detach();
        state_.ground_alignment_target = 0.0f;
    }

    void CameraOperator::activate() {
        if (!state_.active) {
            state_.active = true;
            LOG_DEBUG("Operator {} activated", id_);
        }
    }

    void CameraOperator::deactivate() {
        if (state_.active) {
            state_.active = false;
            pending_input_ = {};
            LOG_DEBUG("Operator {} deactivated", id_);
        }
    }

    void CameraOperator::setGroundNormal(const glm::vec3& normal) {
        if (!attachment_.isAttached()) {
            return;
        }
        state_.ground_alignment_target = groundTiltTarget(normal, state_.look, params_.ground_alignment_factor);
    }

    void CameraOperator::manualControl(const ControlDelta& delta) {
        if (!state_.active || sequence_) {
            return;
        }
        smoother_.applyControl(state_, delta);
    }

    void CameraOperator::setInternalControl(const bool enabled) {
        internal_control_ = enabled;
        if (!enabled) {
            pending_input_ = {};
        }
    }

    void CameraOperator::setDebug(const bool enabled) {
        debug_ = enabled;
        core::Logger::get().set_frame_logging(enabled);
        LOG_INFO("Operator {} debug output {}", id_, enabled ? "on" : "off");
    }

    void CameraOperator::feedRawInput(const RawInput& input) {
        if (internal_control_ && state_.active) {
            pending_input_ += input;
        }
    }

    void CameraOperator::placeAt(const glm::vec3& position, const glm::vec3& look, const float zoom) {
        interruptMotion();
        state_.position = position;
        state_.look = look;
        state_.zoom = zoom;
        settleTargets();
    }

    void CameraOperator::update(const float dt) {
        const glm::vec3 moved = attachment_.track();
        if (attachment_.isAttached()) {
            state_.position += moved;
        } else {
            state_.ground_alignment_target = 0.0f;
        }
        if (sequence_) {
            carrySequenceObjects();
        }

        if (internal_control_ && state_.active) {
            const ControlDelta delta = input_mapper_.map(pending_input_, dt);
            if (delta.horizontal != 0.0f || delta.vertical != 0.0f || delta.zoom != 0.0f) {
                manualControl(delta);
            }
        }
        pending_input_ = {};

        if (sequence_) {
            applyStep(sequence_->update(dt));
        } else {
            smoother_.step(state_, dt);
            std::array<ObjectId, 1> ignore{};
            const auto attached = attachment_.attached();
            if (attached) {
                ignore[0] = *attached;
            }
            smoother_.resolveZoomCollision(state_, env_, std::span<const ObjectId>(ignore.data(), attached ? 1 : 0));
        }

        if (debug_) {
            const glm::vec3 cam = cameraPosition();
            LOG_FRAME("op {} pos ({:.2f}, {:.2f}, {:.2f}) look ({:.1f}, {:.1f}, {:.1f}) zoom {:.2f} tilt {:.2f}",
                      id_, cam.x, cam.y, cam.z, state_.look.x, state_.look.y, state_.look.z,
                      state_.zoom, state_.ground_alignment);
        }
    }

    void CameraOperator::applyStep(const sequencer::SequenceStep& step) {
        state_.position = step.pose.position;
        state_.look = step.pose.look;
        state_.zoom = step.pose.zoom;

        const ObjectId observer = observer_;
        const uint64_t generation = motion_generation_;
        if (step.finished) {
            resetMotion();
        } else {
            state_.look_target = state_.look;
            state_.zoom_target = state_.zoom;
            syncAttachment(sequence_->segmentTarget().attached_object);
        }

        // Observers may start a new motion from their handlers, so post last. Arrivals
        // of a motion replaced by a handler are not reported.
        for (const auto& arrival : step.arrivals) {
            if (motion_generation_ != generation) {
                break;
            }
            if (arrival.final) {
                env_.post(observer, msg::MotionFinished{arrival.object, arrival.checkpoint});
            } else {
                env_.post(observer, msg::MotionPointReached{arrival.object, arrival.checkpoint});
            }
        }
    }

    sequencer::MotionState CameraOperator::motionState() const {
        return sequence_ ? sequence_->state() : sequencer::MotionState::IDLE;
    }

    glm::vec3 CameraOperator::cameraPosition() const {
        return core::cameraPosition(state_.position, state_.look, state_.zoom);
    }

    glm::vec3 CameraOperator::cameraLook() const {
        return state_.look + glm::vec3(0.0f, 0.0f, state_.ground_alignment);
    }

} // namespace dolly::cam
