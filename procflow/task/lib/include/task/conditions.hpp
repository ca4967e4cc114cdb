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
 * @file conditions.hpp
 * @brief Built-in preconditions
 */

#ifndef PROCFLOW_TASK_CONDITIONS_HPP
#define PROCFLOW_TASK_CONDITIONS_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "task/precondition.hpp"
#include "task/task_export.hpp"
#include "task/task_ref.hpp"

namespace procflow::task {

/// Always satisfied
class TASK_EXPORT TrueCondition final : public Precondition {
public:
    TrueCondition();
    void evaluate(const TaskRef &task, ConditionCompletion completion) override;
};

/// Always fails with TaskErrc::ConditionFailed
class TASK_EXPORT FalseCondition final : public Precondition {
public:
    FalseCondition();
    void evaluate(const TaskRef &task, ConditionCompletion completion) override;
};

/**
 * Condition backed by a predicate
 *
 * The predicate runs on a queue worker. Returning false, or throwing, fails
 * the condition with TaskErrc::ConditionFailed.
 */
class TASK_EXPORT BlockCondition final : public Precondition {
public:
    using Predicate = std::function<bool()>;

    /**
     * Create a predicate condition
     *
     * @param[in] predicate Predicate deciding the outcome
     * @param[in] name Condition name
     * @throws std::invalid_argument if predicate is empty
     */
    explicit BlockCondition(Predicate predicate, std::string name = "BlockCondition");

    void evaluate(const TaskRef &task, ConditionCompletion completion) override;

private:
    Predicate predicate_;
};

/**
 * Inverts a wrapped condition
 *
 * Satisfied becomes failed and failed becomes satisfied. Ignored stays
 * ignored. The wrapped condition's produced dependencies are kept.
 */
class TASK_EXPORT NegatedCondition final : public Precondition {
public:
    /**
     * @param[in] inner Condition to invert
     * @throws std::invalid_argument if inner is null
     */
    explicit NegatedCondition(std::shared_ptr<Precondition> inner);

    void evaluate(const TaskRef &task, ConditionCompletion completion) override;
    [[nodiscard]] std::vector<std::shared_ptr<Task>> produced_dependencies() const override;

private:
    std::shared_ptr<Precondition> inner_;
};

/**
 * Wraps a condition and suppresses its produced dependencies
 *
 * The wrapped condition is evaluated as is, but the evaluator does not
 * submit or wait for the dependencies it would otherwise produce.
 */
class TASK_EXPORT SilentCondition final : public Precondition {
public:
    /**
     * @param[in] inner Condition to wrap
     * @throws std::invalid_argument if inner is null
     */
    explicit SilentCondition(std::shared_ptr<Precondition> inner);

    void evaluate(const TaskRef &task, ConditionCompletion completion) override;
    [[nodiscard]] std::vector<std::shared_ptr<Task>> produced_dependencies() const override;

private:
    std::shared_ptr<Precondition> inner_;
};

/**
 * Fails if any dependency of the owning task was cancelled or finished with
 * errors
 *
 * A destroyed owning task is reported as ignored.
 */
class TASK_EXPORT NoFailedDependenciesCondition final : public Precondition {
public:
    /**
     * @param[in] ignore_cancellations Treat cancelled dependencies without
     *                                 errors as successful
     */
    explicit NoFailedDependenciesCondition(bool ignore_cancellations = false);

    void evaluate(const TaskRef &task, ConditionCompletion completion) override;

private:
    bool ignore_cancellations_{};
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_CONDITIONS_HPP
