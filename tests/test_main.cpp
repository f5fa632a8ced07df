/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    dolly::core::Logger::get().init(dolly::core::LogLevel::Warn);

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
