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
 * @file task.cpp
 * @brief Task state machine, execution context and builder
 */

#include <any>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "log/pf_log_macros.hpp"
#include "task/task.hpp"
#include "task/task_errors.hpp"
#include "task/task_log.hpp"
#include "task/task_ref.hpp"
#include "task/task_state.hpp"

namespace procflow::task {

namespace {

void append_errors(TaskErrors &target, TaskErrors &&source) {
    target.insert(
            target.end(),
            std::make_move_iterator(source.begin()),
            std::make_move_iterator(source.end()));
}

} // namespace

TaskRef::TaskRef(const std::shared_ptr<Task> &task)
        : task_{task}, task_id_{task ? task->get_task_id() : 0} {}

TaskContext::TaskContext(std::shared_ptr<Task> task) : task_{std::move(task)} {}

bool TaskContext::is_cancelled() const noexcept { return task_->is_cancelled(); }

void TaskContext::finish(TaskErrors errors) const { task_->finish(std::move(errors)); }

void TaskContext::cancel(TaskErrors errors) const { task_->cancel(std::move(errors)); }

Task::Task(std::string task_name, TaskBody body, std::any user_data)
        : task_id_{next_task_id.fetch_add(1)}, task_name_{std::move(task_name)},
          body_{std::move(body)}, user_data_{std::move(user_data)},
          finished_future_{finished_promise_.get_future().share()} {}

Task::~Task() {
    if (state_.load(std::memory_order_acquire) != TaskState::Finished) {
        PF_LOGC_TRACE_L1(
                TaskLog::Task,
                "Task '{}' ({}) destroyed in state {}",
                task_name_,
                task_id_,
                ::wise_enum::to_string(state_.load(std::memory_order_relaxed)));
    }
}

void Task::cancel(TaskError error) {
    TaskErrors errors;
    errors.push_back(std::move(error));
    cancel(std::move(errors));
}

void Task::cancel(TaskErrors errors) {
    const auto self = weak_from_this().lock();
    bool lost = false;
    bool first = false;
    ReadinessHook hook;
    {
        const SpinlockGuard guard(lock_);
        if (state_.load(std::memory_order_acquire) >= TaskState::Finishing) {
            lost = true;
        } else {
            first = !cancelled_.exchange(true, std::memory_order_acq_rel);
            append_errors(errors_, std::move(errors));
            if (first) {
                dispatcher_.enqueue([this, snapshot = errors_] {
                    notify(TaskEvent::DidCancel, snapshot);
                });
                hook = readiness_hook_;
            }
        }
    }

    if (lost) {
        PF_LOGC_TRACE_L1(
                TaskLog::Task, "Cancel of task '{}' lost, finish already claimed", task_name_);
        return;
    }
    if (!first) {
        return;
    }

    PF_LOGC_DEBUG(TaskLog::Task, "Task '{}' ({}) cancelled", task_name_, task_id_);
    dispatcher_.drain();
    if (hook) {
        hook();
    }
}

void Task::finish(TaskErrors errors) {
    const auto self = weak_from_this().lock();
    bool claimed = false;
    TaskState previous{};
    {
        const SpinlockGuard guard(lock_);
        previous = state_.load(std::memory_order_acquire);
        while (previous < TaskState::Finishing) {
            if (state_.compare_exchange_weak(
                        previous,
                        TaskState::Finishing,
                        std::memory_order_acq_rel,
                        std::memory_order_acquire)) {
                claimed = true;
                break;
            }
        }
        if (claimed) {
            append_errors(errors_, std::move(errors));
            dispatcher_.enqueue([this] { complete_finish(); });
        }
    }

    if (!claimed) {
        PF_LOGC_TRACE_L1(
                TaskLog::Task,
                "Finish of task '{}' ignored, state is already {}",
                task_name_,
                ::wise_enum::to_string(previous));
        return;
    }

    PF_LOGC_TRACE_L1(
            TaskLog::Task,
            "Task '{}' ({}) finishing from {}",
            task_name_,
            task_id_,
            ::wise_enum::to_string(previous));
    dispatcher_.drain();
}

void Task::complete_finish() {
    notify(TaskEvent::WillFinish, errors());

    {
        const SpinlockGuard guard(lock_);
        state_.store(TaskState::Finished, std::memory_order_release);
    }

    // errors_ is frozen from here on and read without the lock
    notify(TaskEvent::DidFinish, errors_);

    std::vector<CompletionBlock> blocks;
    std::vector<CompletionListener> listeners;
    {
        const SpinlockGuard guard(lock_);
        blocks = std::move(completion_blocks_);
        listeners = std::move(completion_listeners_);
        listeners_closed_ = true;
        readiness_hook_ = nullptr;
    }

    for (auto &block : blocks) {
        try {
            block();
        } catch (const std::exception &e) {
            PF_LOGC_ERROR(
                    TaskLog::Task, "Completion block of task '{}' threw: {}", task_name_, e.what());
        } catch (...) {
            PF_LOGC_ERROR(
                    TaskLog::Task, "Completion block of task '{}' threw an unknown exception", task_name_);
        }
    }

    if (!errors_.empty()) {
        PF_LOGC_DEBUG(
                TaskLog::Task,
                "Task '{}' ({}) finished with {} error(s), first: {}",
                task_name_,
                task_id_,
                errors_.size(),
                errors_.front().to_string());
    } else {
        PF_LOGC_TRACE_L1(TaskLog::Task, "Task '{}' ({}) finished", task_name_, task_id_);
    }

    const auto self = weak_from_this().lock();
    for (auto &listener : listeners) {
        try {
            listener(self);
        } catch (const std::exception &e) {
            PF_LOGC_ERROR(
                    TaskLog::Task, "Finish listener of task '{}' threw: {}", task_name_, e.what());
        } catch (...) {
            PF_LOGC_ERROR(
                    TaskLog::Task, "Finish listener of task '{}' threw an unknown exception", task_name_);
        }
    }

    finished_promise_.set_value();
}

void Task::add_condition(std::shared_ptr<Precondition> condition) {
    if (!condition) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Task, "Task '{}': precondition must not be null", task_name_);
    }

    bool late = false;
    {
        const SpinlockGuard guard(lock_);
        late = state_.load(std::memory_order_acquire) >= TaskState::EvaluatingConditions;
        if (!late) {
            conditions_.push_back(condition);
        }
    }

    if (late) {
        PF_LOGC_DEBUG(
                TaskLog::Condition,
                "Precondition '{}' added to task '{}' after evaluation started, ignored",
                condition->get_name(),
                task_name_);
    }
}

void Task::add_dependency(const std::shared_ptr<Task> &dependency) {
    if (!dependency) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Task, "Task '{}': dependency must not be null", task_name_);
    }
    if (dependency.get() == this) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Task, "Task '{}' cannot depend on itself", task_name_);
    }

    bool late = false;
    {
        const SpinlockGuard guard(lock_);
        late = state_.load(std::memory_order_acquire) >= TaskState::EvaluatingConditions;
        if (!late) {
            dependencies_.push_back(dependency);
            pending_dependencies_.fetch_add(1, std::memory_order_acq_rel);
        }
    }

    if (late) {
        PF_LOGC_DEBUG(
                TaskLog::Task,
                "Dependency '{}' added to task '{}' after evaluation started, ignored",
                dependency->get_task_name(),
                task_name_);
        return;
    }

    // Registered outside lock_: the listener runs inline if the dependency
    // already finished and takes lock_ itself
    dependency->add_completion_listener(
            [weak_self = weak_from_this()](const std::shared_ptr<Task> & /*finished*/) {
                if (const auto task = weak_self.lock()) {
                    task->on_dependency_finished();
                }
            });
}

void Task::add_observer(const TaskEvent event, ObserverCallback callback) {
    if (!callback) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Observer, "Task '{}': observer callback must not be empty", task_name_);
    }
    static_cast<void>(observers_.add(event, TaskRef{weak_from_this().lock()}, std::move(callback)));
}

void Task::add_completion(CompletionBlock block) {
    if (!block) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Task, "Task '{}': completion block must not be empty", task_name_);
    }

    bool closed = false;
    {
        const SpinlockGuard guard(lock_);
        closed = listeners_closed_;
        if (!closed) {
            completion_blocks_.push_back(std::move(block));
        }
    }

    if (closed) {
        const auto self = weak_from_this().lock();
        dispatcher_.dispatch(std::move(block));
    }
}

void Task::add_completion_listener(CompletionListener listener) {
    bool closed = false;
    {
        const SpinlockGuard guard(lock_);
        closed = listeners_closed_;
        if (!closed) {
            completion_listeners_.push_back(std::move(listener));
        }
    }

    if (closed) {
        listener(weak_from_this().lock());
    }
}

void Task::wait() const { finished_future_.wait(); }

bool Task::wait_for_ns(const Nanos timeout) const {
    return finished_future_.wait_for(timeout) == std::future_status::ready;
}

bool Task::is_ready() const noexcept {
    const TaskState state = get_state();
    if (state >= TaskState::Ready) {
        return true;
    }
    return state >= TaskState::Pending && is_cancelled();
}

TaskErrors Task::errors() const {
    if (state_.load(std::memory_order_acquire) == TaskState::Finished) {
        return errors_;
    }
    const SpinlockGuard guard(lock_);
    return errors_;
}

std::vector<std::shared_ptr<Task>> Task::dependencies() const {
    const SpinlockGuard guard(lock_);
    return dependencies_;
}

std::size_t Task::condition_count() const {
    const SpinlockGuard guard(lock_);
    return conditions_.size();
}

std::size_t Task::observer_count(const TaskEvent event) const { return observers_.count(event); }

bool Task::claim_submission(ReadinessHook hook) {
    {
        const SpinlockGuard guard(lock_);
        TaskState expected = TaskState::Initialized;
        if (!state_.compare_exchange_strong(
                    expected,
                    TaskState::Pending,
                    std::memory_order_acq_rel,
                    std::memory_order_acquire)) {
            return false;
        }
        readiness_hook_ = std::move(hook);
        dispatcher_.enqueue([this] { notify(TaskEvent::DidSubmit, errors()); });
    }

    const auto self = weak_from_this().lock();
    dispatcher_.drain();
    return true;
}

std::optional<std::vector<std::shared_ptr<Precondition>>> Task::begin_condition_evaluation() {
    const SpinlockGuard guard(lock_);
    if (state_.load(std::memory_order_acquire) != TaskState::Pending) {
        return std::nullopt;
    }
    if (pending_dependencies_.load(std::memory_order_acquire) > 0 &&
        !cancelled_.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    TaskState expected = TaskState::Pending;
    if (!state_.compare_exchange_strong(
                expected,
                TaskState::EvaluatingConditions,
                std::memory_order_acq_rel,
                std::memory_order_acquire)) {
        return std::nullopt;
    }
    std::vector<std::shared_ptr<Precondition>> conditions = std::move(conditions_);
    conditions_.clear();
    return conditions;
}

bool Task::try_transition(const TaskState from, const TaskState to) noexcept {
    TaskState expected = from;
    return state_.compare_exchange_strong(
            expected, to, std::memory_order_acq_rel, std::memory_order_acquire);
}

void Task::run_execution() {
    const auto self = shared_from_this();
    dispatcher_.dispatch([this] { execute_step(); });
}

void Task::execute_step() {
    if (get_state() != TaskState::Ready) {
        PF_LOGC_TRACE_L1(
                TaskLog::Task,
                "Task '{}' not executed, state is {}",
                task_name_,
                ::wise_enum::to_string(get_state()));
        return;
    }

    if (is_cancelled()) {
        finish();
        return;
    }

    notify(TaskEvent::WillExecute, errors());

    // A will-execute observer may have cancelled the task
    if (is_cancelled()) {
        finish();
        return;
    }

    if (!try_transition(TaskState::Ready, TaskState::Executing)) {
        return;
    }

    const auto self = shared_from_this();
    if (body_) {
        try {
            body_(TaskContext{self});
        } catch (const std::exception &e) {
            PF_LOGC_WARN(TaskLog::Task, "Body of task '{}' threw: {}", task_name_, e.what());
            TaskErrors failure;
            failure.emplace_back(TaskErrc::ExecutionFailed, e.what());
            finish(std::move(failure));
        } catch (...) {
            PF_LOGC_WARN(TaskLog::Task, "Body of task '{}' threw an unknown exception", task_name_);
            TaskErrors failure;
            failure.emplace_back(TaskErrc::ExecutionFailed, "Unknown exception occurred");
            finish(std::move(failure));
        }
    } else {
        finish();
    }

    notify(TaskEvent::DidExecute, errors());
}

void Task::on_dependency_finished() {
    if (pending_dependencies_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        invoke_readiness_hook();
    }
}

void Task::invoke_readiness_hook() {
    ReadinessHook hook;
    {
        const SpinlockGuard guard(lock_);
        hook = readiness_hook_;
    }
    if (hook) {
        hook();
    }
}

void Task::notify(const TaskEvent event, const TaskErrors &errors) {
    const std::size_t invoked = observers_.notify(event, errors);
    PF_LOGC_TRACE_L1(
            TaskLog::Observer,
            "Task '{}' {}: {} observer(s)",
            task_name_,
            ::wise_enum::to_string(event),
            invoked);
}

TaskBuilder &TaskBuilder::async_function(TaskBody body) {
    body_ = std::move(body);
    return *this;
}

TaskBuilder &TaskBuilder::user_data(std::any data) {
    user_data_ = std::move(data);
    return *this;
}

TaskBuilder &TaskBuilder::depends_on(std::shared_ptr<Task> dependency) {
    dependencies_.push_back(std::move(dependency));
    return *this;
}

TaskBuilder &TaskBuilder::depends_on(const std::vector<std::shared_ptr<Task>> &dependencies) {
    dependencies_.insert(dependencies_.end(), dependencies.begin(), dependencies.end());
    return *this;
}

TaskBuilder &TaskBuilder::condition(std::shared_ptr<Precondition> condition) {
    conditions_.push_back(std::move(condition));
    return *this;
}

TaskBuilder &TaskBuilder::observer(const TaskEvent event, ObserverCallback callback) {
    observers_.emplace_back(event, std::move(callback));
    return *this;
}

TaskBuilder &TaskBuilder::completion(CompletionBlock block) {
    completions_.push_back(std::move(block));
    return *this;
}

std::shared_ptr<Task> TaskBuilder::build_shared() {
    if (task_name_.empty()) {
        log_and_throw<std::invalid_argument>(TaskLog::Task, "Task name must not be empty");
    }

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    std::shared_ptr<Task> task{new Task(task_name_, body_, user_data_)};
    for (const auto &dependency : dependencies_) {
        task->add_dependency(dependency);
    }
    for (const auto &condition : conditions_) {
        task->add_condition(condition);
    }
    for (const auto &[event, callback] : observers_) {
        task->add_observer(event, callback);
    }
    for (const auto &block : completions_) {
        task->add_completion(block);
    }
    return task;
}

} // namespace procflow::task
