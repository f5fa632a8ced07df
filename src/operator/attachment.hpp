/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/ids.hpp"
#include "environment.hpp"
#include <expected>
#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace dolly::cam {

    // Which scene object the operator rides on. The object is only known by id and is
    // re-resolved through the environment every frame.
    class AttachmentTracker {
    public:
        AttachmentTracker(ObjectId operator_id, Environment& env)
            : operator_id_(operator_id),
              env_(env) {}

        // No-op when already attached to `object`
        std::expected<void, std::string> attach(ObjectId object);

        // No-op when detached
        void detach();

        // World-space movement of the attached object since the last call. Detaches
        // without notification if the object has disappeared.
        glm::vec3 track();

        [[nodiscard]] std::optional<ObjectId> attached() const { return object_; }
        [[nodiscard]] bool isAttached() const { return object_.has_value(); }

    private:
        ObjectId operator_id_;
        Environment& env_;
        std::optional<ObjectId> object_;
        glm::vec3 last_position_{0.0f};
    };

} // namespace dolly::cam
