/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "angles.hpp"
#include <cmath>

namespace dolly::core {

    float wrapDegrees(const float degrees) {
        float wrapped = std::fmod(degrees, 360.0f);
        if (wrapped > 180.0f) {
            wrapped -= 360.0f;
        } else if (wrapped <= -180.0f) {
            wrapped += 360.0f;
        }
        return wrapped;
    }

    float shortRotation(const float from, const float to) {
        return wrapDegrees(to - from);
    }

    glm::vec3 shortRotation(const glm::vec3& from, const glm::vec3& to) {
        return {shortRotation(from.x, to.x),
                shortRotation(from.y, to.y),
                shortRotation(from.z, to.z)};
    }

    glm::quat lookRotation(const glm::vec3& look_degrees) {
        const glm::vec3 r = glm::radians(look_degrees);
        const glm::quat yaw = glm::angleAxis(r.y, glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::quat pitch = glm::angleAxis(r.x, glm::vec3(1.0f, 0.0f, 0.0f));
        const glm::quat roll = glm::angleAxis(r.z, glm::vec3(0.0f, 0.0f, 1.0f));
        return yaw * pitch * roll;
    }

    glm::vec3 rotateByLook(const glm::vec3& look_degrees, const glm::vec3& v) {
        return lookRotation(look_degrees) * v;
    }

    glm::vec3 backVector(const glm::vec3& look_degrees) {
        return rotateByLook(look_degrees, glm::vec3(0.0f, 0.0f, 1.0f));
    }

    glm::vec3 forwardVector(const glm::vec3& look_degrees) {
        return -backVector(look_degrees);
    }

    glm::vec3 cameraPosition(const glm::vec3& anchor, const glm::vec3& look_degrees, const float zoom) {
        if (zoom == 0.0f) {
            return anchor;
        }
        return anchor + rotateByLook(look_degrees, glm::vec3(0.0f, 0.0f, zoom));
    }

    glm::vec3 safeNormalize(const glm::vec3& v) {
        const float len = glm::length(v);
        return len > GEOMETRY_EPSILON ? v / len : glm::vec3(0.0f);
    }

} // namespace dolly::core
