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

#include <atomic>
#include <cstddef>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "log/pf_log_macros.hpp"
#include "task/condition_evaluator.hpp"
#include "task/task.hpp"
#include "task/task_errors.hpp"
#include "task/task_log.hpp"

namespace procflow::task {

std::shared_ptr<ConditionEvaluator> ConditionEvaluator::create(
        TaskRef task,
        std::vector<std::shared_ptr<Precondition>> conditions,
        ScheduleFn schedule,
        SubmitFn submit,
        ResolvedFn on_resolved) {
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    return std::shared_ptr<ConditionEvaluator>(new ConditionEvaluator(
            std::move(task),
            std::move(conditions),
            std::move(schedule),
            std::move(submit),
            std::move(on_resolved)));
}

ConditionEvaluator::ConditionEvaluator(
        TaskRef task,
        std::vector<std::shared_ptr<Precondition>> conditions,
        ScheduleFn schedule,
        SubmitFn submit,
        ResolvedFn on_resolved)
        : task_{std::move(task)}, conditions_{std::move(conditions)},
          schedule_{std::move(schedule)}, submit_{std::move(submit)},
          on_resolved_{std::move(on_resolved)}, reported_(conditions_.size()),
          remaining_{conditions_.size()} {}

void ConditionEvaluator::start() {
    PF_LOGC_TRACE_L1(
            TaskLog::Condition,
            "Evaluating {} condition(s) for task {}",
            conditions_.size(),
            task_.task_id());

    if (conditions_.empty()) {
        resolve();
        return;
    }
    for (std::size_t index = 0; index < conditions_.size(); ++index) {
        prepare(index);
    }
}

void ConditionEvaluator::prepare(const std::size_t index) {
    const auto &condition = conditions_.at(index);
    const std::vector<std::shared_ptr<Task>> produced = condition->produced_dependencies();
    if (produced.empty()) {
        schedule_evaluation(index);
        return;
    }

    auto outstanding = std::make_shared<std::atomic<std::size_t>>(produced.size());
    for (const auto &dependency : produced) {
        dependency->add_completion_listener(
                [self = shared_from_this(), index, outstanding](
                        const std::shared_ptr<Task> & /*finished*/) {
                    if (outstanding->fetch_sub(1, std::memory_order_acq_rel) == 1) {
                        self->schedule_evaluation(index);
                    }
                });
    }

    const std::error_code already_submitted = make_error_code(TaskErrc::AlreadySubmitted);
    for (const auto &dependency : produced) {
        const std::error_code ec = submit_(dependency);
        if (!ec || ec == already_submitted) {
            continue;
        }
        PF_LOGC_WARN(
                TaskLog::Condition,
                "Produced dependency '{}' of condition '{}' was not submitted: {}",
                dependency->get_task_name(),
                condition->get_name(),
                ec.message());
        TaskErrors failure;
        failure.emplace_back(ec, "Produced dependency could not be submitted");
        dependency->finish(std::move(failure));
    }
}

void ConditionEvaluator::schedule_evaluation(const std::size_t index) {
    schedule_([self = shared_from_this(), index] { self->evaluate(index); });
}

void ConditionEvaluator::evaluate(const std::size_t index) {
    const auto condition = conditions_.at(index);
    evaluations_.fetch_add(1, std::memory_order_acq_rel);

    try {
        condition->evaluate(task_, [self = shared_from_this(), index](ConditionResult result) {
            self->record(index, std::move(result));
        });
    } catch (const std::exception &e) {
        record(index,
               ConditionResult::failed(TaskError{
                       TaskErrc::ConditionFailed,
                       std::format("{} threw: {}", condition->get_name(), e.what())}));
    } catch (...) {
        record(index,
               ConditionResult::failed(TaskError{
                       TaskErrc::ConditionFailed,
                       std::format("{} threw an unknown exception", condition->get_name())}));
    }
}

void ConditionEvaluator::record(const std::size_t index, ConditionResult result) {
    const auto &condition = conditions_.at(index);
    if (reported_.at(index).exchange(true, std::memory_order_acq_rel)) {
        PF_LOGC_WARN(
                TaskLog::Condition,
                "Condition '{}' reported more than one outcome, ignoring the extra one",
                condition->get_name());
        return;
    }

    PF_LOGC_TRACE_L1(
            TaskLog::Condition,
            "Condition '{}' of task {}: {}",
            condition->get_name(),
            task_.task_id(),
            ::wise_enum::to_string(result.outcome));

    if (result.is_failed()) {
        TaskError failure = result.error.value_or(
                TaskError{TaskErrc::ConditionFailed, std::string{condition->get_name()}});
        const SpinlockGuard guard(lock_);
        failures_.push_back(std::move(failure));
    }

    if (remaining_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        resolve();
    }
}

void ConditionEvaluator::resolve() {
    if (resolved_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    TaskErrors failures;
    {
        const SpinlockGuard guard(lock_);
        failures = std::move(failures_);
    }

    PF_LOGC_TRACE_L1(
            TaskLog::Condition,
            "Conditions of task {} resolved with {} failure(s)",
            task_.task_id(),
            failures.size());
    on_resolved_(std::move(failures));
}

} // namespace procflow::task
