/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "messages.hpp"
#include <type_traits>

namespace dolly::cam {

    std::string_view messageName(const OutboundMessage& message) {
        return std::visit([](const auto& m) -> std::string_view {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, msg::OperatorAttached>) {
                return "operator_attached";
            } else if constexpr (std::is_same_v<T, msg::OperatorDetached>) {
                return "operator_detached";
            } else if constexpr (std::is_same_v<T, msg::MotionPointReached>) {
                return "motion_point";
            } else if constexpr (std::is_same_v<T, msg::MotionFinished>) {
                return "motion_finished";
            } else {
                return "motion_interrupted";
            }
        },
                          message);
    }

} // namespace dolly::cam
