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
 * @file condition_evaluator.hpp
 * @brief Evaluates a task's preconditions and reduces them to one decision
 *
 * For each condition the evaluator first submits the condition's produced
 * dependencies and waits for them through finish listeners, never by
 * blocking a thread. It then schedules the condition's evaluation. Conditions
 * evaluate concurrently; the pass resolves exactly once when the last
 * outcome arrives. The evaluator references its task weakly and is kept alive
 * only by its own pending callbacks.
 */

#ifndef PROCFLOW_TASK_CONDITION_EVALUATOR_HPP
#define PROCFLOW_TASK_CONDITION_EVALUATOR_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <system_error>
#include <vector>

#include "task/precondition.hpp"
#include "task/spinlock.hpp"
#include "task/task_errors.hpp"
#include "task/task_export.hpp"
#include "task/task_ref.hpp"

namespace procflow::task {

class Task;

/**
 * One-shot precondition evaluation pass for a single task
 */
class TASK_EXPORT ConditionEvaluator final
        : public std::enable_shared_from_this<ConditionEvaluator> {
public:
    /// Runs a unit of work, typically on a queue worker
    using ScheduleFn = std::function<void(std::function<void()>)>;
    /// Submits a produced dependency to the owning task's queue
    using SubmitFn = std::function<std::error_code(const std::shared_ptr<Task> &)>;
    /// Receives the union of failure errors once all conditions resolved
    using ResolvedFn = std::function<void(TaskErrors)>;

    /**
     * Create an evaluator
     *
     * @param[in] task Task whose conditions are evaluated
     * @param[in] conditions Conditions taken from the task
     * @param[in] schedule Executor for evaluation work
     * @param[in] submit Submission of produced dependencies
     * @param[in] on_resolved Called exactly once with the failures
     * @return Evaluator ready to start()
     */
    [[nodiscard]] static std::shared_ptr<ConditionEvaluator> create(
            TaskRef task,
            std::vector<std::shared_ptr<Precondition>> conditions,
            ScheduleFn schedule,
            SubmitFn submit,
            ResolvedFn on_resolved);

    ~ConditionEvaluator() = default;

    ConditionEvaluator(const ConditionEvaluator &) = delete;
    ConditionEvaluator &operator=(const ConditionEvaluator &) = delete;
    ConditionEvaluator(ConditionEvaluator &&) = delete;
    ConditionEvaluator &operator=(ConditionEvaluator &&) = delete;

    /**
     * Start the pass
     *
     * Resolves immediately when there are no conditions. Must be called once.
     */
    void start();

    /// Whether the pass resolved
    [[nodiscard]] bool is_resolved() const noexcept {
        return resolved_.load(std::memory_order_acquire);
    }

    /// Number of conditions whose outcome has not arrived
    [[nodiscard]] std::size_t remaining() const noexcept {
        return remaining_.load(std::memory_order_acquire);
    }

    /// Number of evaluate() calls made so far
    [[nodiscard]] std::size_t evaluations() const noexcept {
        return evaluations_.load(std::memory_order_acquire);
    }

private:
    ConditionEvaluator(
            TaskRef task,
            std::vector<std::shared_ptr<Precondition>> conditions,
            ScheduleFn schedule,
            SubmitFn submit,
            ResolvedFn on_resolved);

    void prepare(std::size_t index);
    void schedule_evaluation(std::size_t index);
    void evaluate(std::size_t index);
    void record(std::size_t index, ConditionResult result);
    void resolve();

    TaskRef task_;
    std::vector<std::shared_ptr<Precondition>> conditions_;
    ScheduleFn schedule_;
    SubmitFn submit_;
    ResolvedFn on_resolved_;

    std::vector<std::atomic<bool>> reported_; //!< One outcome per condition
    std::atomic<std::size_t> remaining_{0};
    std::atomic<std::size_t> evaluations_{0};
    std::atomic<bool> resolved_{false};

    Spinlock lock_;
    TaskErrors failures_; //!< Guarded by lock_
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_CONDITION_EVALUATOR_HPP
