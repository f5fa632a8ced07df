/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "attachment.hpp"
#include "core/logger.hpp"

namespace dolly::cam {

    std::expected<void, std::string> AttachmentTracker::attach(const ObjectId object) {
        if (object_ == object) {
            return {};
        }

        const auto position = env_.objectPosition(object);
        if (!position) {
            return std::unexpected("Cannot attach to missing object " + std::to_string(object));
        }

        detach();
        object_ = object;
        last_position_ = *position;
        env_.post(object, msg::OperatorAttached{operator_id_});
        LOG_DEBUG("Operator {} attached to object {}", operator_id_, object);
        return {};
    }

    void AttachmentTracker::detach() {
        if (!object_) {
            return;
        }
        const ObjectId previous = *object_;
        object_.reset();
        if (env_.objectPosition(previous)) {
            env_.post(previous, msg::OperatorDetached{operator_id_});
        }
        LOG_DEBUG("Operator {} detached from object {}", operator_id_, previous);
    }

    glm::vec3 AttachmentTracker::track() {
        if (!object_) {
            return glm::vec3(0.0f);
        }

        const auto position = env_.objectPosition(*object_);
        if (!position) {
            LOG_WARN("Attached object {} is gone, detaching operator {}", *object_, operator_id_);
            object_.reset();
            return glm::vec3(0.0f);
        }

        const glm::vec3 delta = *position - last_position_;
        last_position_ = *position;
        return delta;
    }

} // namespace dolly::cam
