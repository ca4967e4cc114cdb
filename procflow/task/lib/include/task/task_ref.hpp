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

#ifndef PROCFLOW_TASK_TASK_REF_HPP
#define PROCFLOW_TASK_TASK_REF_HPP

#include <cstdint>
#include <memory>

#include "task/task_export.hpp"

namespace procflow::task {

class Task;

/**
 * Non-owning reference to a task
 *
 * Held by preconditions, observer entries and evaluators so that none of them
 * extends the lifetime of the task they serve. Callers must lock() and check
 * the result before touching task state; the task may already be gone.
 */
class TASK_EXPORT TaskRef final {
public:
    TaskRef() = default;

    /**
     * Create a reference to a live task
     *
     * @param[in] task Task to reference, may be null
     */
    explicit TaskRef(const std::shared_ptr<Task> &task);

    /**
     * Obtain a strong reference if the task is still alive
     *
     * @return Owning pointer, or nullptr when the task was destroyed
     */
    [[nodiscard]] std::shared_ptr<Task> lock() const noexcept { return task_.lock(); }

    /**
     * Check whether the task still exists
     *
     * @return true while at least one owner holds the task
     * @note Hint only; use lock() before dereferencing
     */
    [[nodiscard]] bool is_alive() const noexcept { return !task_.expired(); }

    /// Identifier of the referenced task, 0 for an empty reference
    [[nodiscard]] std::uint64_t task_id() const noexcept { return task_id_; }

private:
    std::weak_ptr<Task> task_;
    std::uint64_t task_id_{};
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_TASK_REF_HPP
