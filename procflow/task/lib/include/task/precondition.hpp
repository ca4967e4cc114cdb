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
 * @file precondition.hpp
 * @brief Precondition interface and evaluation outcome
 *
 * A precondition gates the execution of the task it is attached to. It may
 * produce dependency tasks that must finish before it is evaluated. The
 * evaluation protocol is asynchronous: evaluate() receives a completion that
 * must be called exactly once, from any thread.
 */

#ifndef PROCFLOW_TASK_PRECONDITION_HPP
#define PROCFLOW_TASK_PRECONDITION_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "task/spinlock.hpp"
#include "task/task_errors.hpp"
#include "task/task_export.hpp"
#include "task/task_ref.hpp"

namespace procflow::task {

class Task;

/// Outcome kinds of a precondition evaluation
enum class ConditionOutcome : std::uint8_t {
    Ignored,   //!< Does not block and does not contribute errors
    Satisfied, //!< Allows the task to execute
    Failed     //!< Cancels the task with the attached error
};

} // namespace procflow::task

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(procflow::task::ConditionOutcome, Ignored, Satisfied, Failed)

namespace procflow::task {

/**
 * Result of one precondition evaluation
 */
struct TASK_EXPORT ConditionResult final {
    ConditionOutcome outcome{ConditionOutcome::Satisfied}; //!< Outcome kind
    std::optional<TaskError> error; //!< Set only for ConditionOutcome::Failed

    [[nodiscard]] static ConditionResult satisfied() { return ConditionResult{}; }

    [[nodiscard]] static ConditionResult ignored() {
        return ConditionResult{ConditionOutcome::Ignored, std::nullopt};
    }

    /**
     * Create a failed result
     *
     * @param[in] failure Error recorded against the owning task
     * @return Failed result carrying the error
     */
    [[nodiscard]] static ConditionResult failed(TaskError failure) {
        return ConditionResult{ConditionOutcome::Failed, std::move(failure)};
    }

    [[nodiscard]] bool is_failed() const noexcept { return outcome == ConditionOutcome::Failed; }
};

/// Completion handed to Precondition::evaluate
using ConditionCompletion = std::function<void(ConditionResult)>;

/**
 * Base class for task preconditions
 *
 * Subclasses implement evaluate(). The task reference passed to evaluate() is
 * non-owning; by the time the condition inspects it the task may have been
 * cancelled, finished or destroyed, and the condition must cope with all
 * three. Produced dependencies are registered before the owning task is
 * submitted and are submitted to the owning task's queue by the evaluator.
 */
class TASK_EXPORT Precondition {
public:
    /**
     * Create a named precondition
     *
     * @param[in] name Human readable name used in logs and failure messages
     */
    explicit Precondition(std::string name);

    virtual ~Precondition() = default;

    Precondition(const Precondition &) = delete;
    Precondition &operator=(const Precondition &) = delete;
    Precondition(Precondition &&) = delete;
    Precondition &operator=(Precondition &&) = delete;

    /**
     * Evaluate the condition for a task
     *
     * @param[in] task Non-owning reference to the owning task
     * @param[in] completion Must be called exactly once with the outcome
     */
    virtual void evaluate(const TaskRef &task, ConditionCompletion completion) = 0;

    /**
     * Tasks that must finish before evaluate() is called
     *
     * @return Snapshot of the produced dependencies
     */
    [[nodiscard]] virtual std::vector<std::shared_ptr<Task>> produced_dependencies() const;

    /**
     * Add a task that must finish before this condition is evaluated
     *
     * @param[in] dependency Task to produce
     * @throws std::invalid_argument if dependency is null
     */
    void add_produced_dependency(std::shared_ptr<Task> dependency);

    [[nodiscard]] std::string_view get_name() const noexcept { return name_; }
    [[nodiscard]] std::uint64_t get_condition_id() const noexcept { return condition_id_; }

private:
    static inline std::atomic<std::uint64_t> next_condition_id{1}; //!< Global condition ID counter

    std::uint64_t condition_id_{};
    std::string name_;
    mutable Spinlock lock_;
    std::vector<std::shared_ptr<Task>> produced_; //!< Guarded by lock_
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_PRECONDITION_HPP
