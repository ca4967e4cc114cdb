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

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "task/precondition.hpp"
#include "task/spinlock.hpp"
#include "task/task.hpp"
#include "task/task_log.hpp"

namespace procflow::task {

Precondition::Precondition(std::string name)
        : condition_id_{next_condition_id.fetch_add(1)}, name_{std::move(name)} {}

std::vector<std::shared_ptr<Task>> Precondition::produced_dependencies() const {
    const SpinlockGuard guard(lock_);
    return produced_;
}

void Precondition::add_produced_dependency(std::shared_ptr<Task> dependency) {
    if (!dependency) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Condition, "Condition '{}': produced dependency must not be null", name_);
    }
    const SpinlockGuard guard(lock_);
    produced_.push_back(std::move(dependency));
}

} // namespace procflow::task
