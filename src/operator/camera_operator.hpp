/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "attachment.hpp"
#include "core/parameters.hpp"
#include "environment.hpp"
#include "input_mapper.hpp"
#include "look_smoother.hpp"
#include "messages.hpp"
#include "operator_state.hpp"
#include "sequencer/motion_sequence.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dolly::cam {

    // Frame-driven camera operator. Either a motion sequence or the free-look
    // smoother owns the camera in any given frame, never both.
    class CameraOperator {
    public:
        CameraOperator(ObjectId id, Environment& env, core::param::OperatorParameters params = {});

        CameraOperator(const CameraOperator&) = delete;
        CameraOperator& operator=(const CameraOperator&) = delete;

        // Dispatches one inbound message
        std::expected<void, std::string> handle(const InboundMessage& message);

        std::expected<void, std::string> followSequence(const std::vector<sequencer::MotionRequest>& requests,
                                                        ObjectId observer);
        std::expected<void, std::string> followPoint(const sequencer::MotionRequest& request, ObjectId observer);
        void unfollow();

        void activate();
        void deactivate();
        void setGroundNormal(const glm::vec3& normal);
        void manualControl(const ControlDelta& delta);
        void setInternalControl(bool enabled);
        void setDebug(bool enabled);

        // Raw device input, consumed on the next update while internal control is on
        void feedRawInput(const RawInput& input);

        // Places the camera without motion, e.g. on scene start
        void placeAt(const glm::vec3& position, const glm::vec3& look, float zoom);

        std::expected<void, std::string> attach(ObjectId object) { return attachment_.attach(object); }
        void detach();

        void update(float dt);

        [[nodiscard]] ObjectId id() const { return id_; }
        [[nodiscard]] const OperatorState& state() const { return state_; }
        [[nodiscard]] const core::param::OperatorParameters& parameters() const { return params_; }
        [[nodiscard]] sequencer::MotionState motionState() const;
        [[nodiscard]] const sequencer::MotionSequence* activeSequence() const {
            return sequence_ ? &*sequence_ : nullptr;
        }
        [[nodiscard]] std::optional<ObjectId> attachedObject() const { return attachment_.attached(); }
        [[nodiscard]] bool internalControl() const { return internal_control_; }
        [[nodiscard]] bool debug() const { return debug_; }

        // Final camera transform: zoom applied, ground alignment added to roll
        [[nodiscard]] glm::vec3 cameraPosition() const;
        [[nodiscard]] glm::vec3 cameraLook() const;

    private:
        std::expected<sequencer::MotionPoint, std::string> resolve(const sequencer::MotionRequest& request) const;
        void interruptMotion();
        void syncAttachment(const std::optional<ObjectId>& object);
        void applyStep(const sequencer::SequenceStep& step);
        void settleTargets();
        void resetMotion();
        void carrySequenceObjects();

        ObjectId id_;
        Environment& env_;
        core::param::OperatorParameters params_;
        LookSmoother smoother_;
        InputMapper input_mapper_;
        AttachmentTracker attachment_;
        OperatorState state_;

        std::optional<sequencer::MotionSequence> sequence_;
        // Last known position of every object a sequence point rides on
        std::unordered_map<ObjectId, glm::vec3> carriers_;
        ObjectId observer_ = 0;
        // Bumped whenever a motion starts or is interrupted
        uint64_t motion_generation_ = 0;

        RawInput pending_input_;
        bool internal_control_ = false;
        bool debug_ = false;
    };

} // namespace dolly::cam
