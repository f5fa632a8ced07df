/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>

namespace dolly {

    // Opaque handle of a scene object. Never implies the object is alive.
    using ObjectId = std::uint64_t;

    using CheckpointId = std::string;

} // namespace dolly
