/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file test_logging_setup.cpp
 * @brief Global test environment configuring logging for the task tests
 */

#include <gtest/gtest.h>

#include "log/components.hpp"
#include "log/pf_log.hpp"
#include "task/task_log.hpp"

namespace {

namespace pl = ::procflow::log;
namespace pt = ::procflow::task;

/**
 * Configures a console logger once and flushes it after the last test
 *
 * Stress tests produce many benign-race messages at trace level; the task
 * components log at Warn so test output stays readable.
 */
class TaskLoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        pl::Logger::configure(pl::LoggerConfig::console(pl::LogLevel::Info));
        pl::register_component<pt::TaskLog>(pl::LogLevel::Warn);
    }

    void TearDown() override { pl::Logger::flush(); }
};

// NOLINTNEXTLINE(cert-err58-cpp,cppcoreguidelines-owning-memory)
[[maybe_unused]] ::testing::Environment *const logging_environment =
        ::testing::AddGlobalTestEnvironment(new TaskLoggingEnvironment);

} // namespace
