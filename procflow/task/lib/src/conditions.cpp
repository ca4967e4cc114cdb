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
 * @file conditions.cpp
 * @brief Built-in precondition implementations
 */

#include <exception>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "log/pf_log_macros.hpp"
#include "task/conditions.hpp"
#include "task/task.hpp"
#include "task/task_errors.hpp"
#include "task/task_log.hpp"

namespace procflow::task {

namespace {

std::shared_ptr<Precondition> require_inner(std::shared_ptr<Precondition> inner, const char *who) {
    if (!inner) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Condition, "{} requires a wrapped condition", who);
    }
    return inner;
}

} // namespace

TrueCondition::TrueCondition() : Precondition{"TrueCondition"} {}

void TrueCondition::evaluate(const TaskRef & /*task*/, ConditionCompletion completion) {
    completion(ConditionResult::satisfied());
}

FalseCondition::FalseCondition() : Precondition{"FalseCondition"} {}

void FalseCondition::evaluate(const TaskRef & /*task*/, ConditionCompletion completion) {
    completion(ConditionResult::failed(TaskError{TaskErrc::ConditionFailed, "FalseCondition"}));
}

BlockCondition::BlockCondition(Predicate predicate, std::string name)
        : Precondition{std::move(name)}, predicate_{std::move(predicate)} {
    if (!predicate_) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Condition, "BlockCondition '{}' requires a predicate", get_name());
    }
}

void BlockCondition::evaluate(const TaskRef & /*task*/, ConditionCompletion completion) {
    bool passed = false;
    try {
        passed = predicate_();
    } catch (const std::exception &e) {
        completion(ConditionResult::failed(TaskError{
                TaskErrc::ConditionFailed,
                std::format("{} threw: {}", get_name(), e.what())}));
        return;
    } catch (...) {
        completion(ConditionResult::failed(TaskError{
                TaskErrc::ConditionFailed, std::format("{} threw an unknown exception", get_name())}));
        return;
    }

    if (passed) {
        completion(ConditionResult::satisfied());
    } else {
        completion(ConditionResult::failed(
                TaskError{TaskErrc::ConditionFailed, std::string{get_name()}}));
    }
}

NegatedCondition::NegatedCondition(std::shared_ptr<Precondition> inner)
        : Precondition{"NegatedCondition"},
          inner_{require_inner(std::move(inner), "NegatedCondition")} {}

void NegatedCondition::evaluate(const TaskRef &task, ConditionCompletion completion) {
    inner_->evaluate(
            task, [completion = std::move(completion), inner_name = std::string{inner_->get_name()}](
                          ConditionResult result) {
                switch (result.outcome) {
                case ConditionOutcome::Satisfied:
                    completion(ConditionResult::failed(TaskError{
                            TaskErrc::ConditionFailed,
                            std::format("Negated {} was satisfied", inner_name)}));
                    break;
                case ConditionOutcome::Failed:
                    completion(ConditionResult::satisfied());
                    break;
                case ConditionOutcome::Ignored:
                    completion(ConditionResult::ignored());
                    break;
                }
            });
}

std::vector<std::shared_ptr<Task>> NegatedCondition::produced_dependencies() const {
    return inner_->produced_dependencies();
}

SilentCondition::SilentCondition(std::shared_ptr<Precondition> inner)
        : Precondition{"SilentCondition"},
          inner_{require_inner(std::move(inner), "SilentCondition")} {}

void SilentCondition::evaluate(const TaskRef &task, ConditionCompletion completion) {
    inner_->evaluate(task, std::move(completion));
}

std::vector<std::shared_ptr<Task>> SilentCondition::produced_dependencies() const { return {}; }

NoFailedDependenciesCondition::NoFailedDependenciesCondition(const bool ignore_cancellations)
        : Precondition{"NoFailedDependenciesCondition"},
          ignore_cancellations_{ignore_cancellations} {}

void NoFailedDependenciesCondition::evaluate(
        const TaskRef &task, ConditionCompletion completion) {
    const auto owner = task.lock();
    if (!owner) {
        PF_LOGC_TRACE_L1(
                TaskLog::Condition,
                "{}: task {} is gone, ignoring",
                get_name(),
                task.task_id());
        completion(ConditionResult::ignored());
        return;
    }

    for (const auto &dependency : owner->dependencies()) {
        const TaskErrors dependency_errors = dependency->errors();
        const bool cancelled = dependency->is_cancelled();
        if (cancelled && ignore_cancellations_ && dependency_errors.empty()) {
            continue;
        }
        if (cancelled || !dependency_errors.empty()) {
            completion(ConditionResult::failed(TaskError{
                    TaskErrc::DependencyFailed,
                    std::format(
                            "Dependency '{}' {}",
                            dependency->get_task_name(),
                            cancelled ? "was cancelled" : "finished with errors")}));
            return;
        }
    }
    completion(ConditionResult::satisfied());
}

} // namespace procflow::task
