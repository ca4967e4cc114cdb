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
 * @file task_queue.cpp
 * @brief Task queue workers, submission and readiness handling
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>
#include <pthread.h>

#include <wise_enum.h>

#include "log/pf_log_macros.hpp"
#include "task/condition_evaluator.hpp"
#include "task/spinlock.hpp"
#include "task/task.hpp"
#include "task/task_errors.hpp"
#include "task/task_log.hpp"
#include "task/task_queue.hpp"
#include "task/task_ref.hpp"
#include "task/task_state.hpp"
#include "task/time.hpp"

namespace procflow::task {

namespace detail {

/**
 * Shared state of a TaskQueue
 *
 * Tasks reference the core weakly through their readiness hooks and finish
 * listeners, so callbacks arriving after the queue is gone are dropped.
 */
class QueueCore final : public std::enable_shared_from_this<QueueCore> {
public:
    using Work = std::function<void()>;

    QueueCore(const std::size_t workers, const Nanos worker_sleep_ns, std::string name)
            : worker_count_{workers}, worker_sleep_ns_{worker_sleep_ns}, name_{std::move(name)} {}

    ~QueueCore() = default;

    QueueCore(const QueueCore &) = delete;
    QueueCore &operator=(const QueueCore &) = delete;
    QueueCore(QueueCore &&) = delete;
    QueueCore &operator=(QueueCore &&) = delete;

    /**
     * Accept a task and start driving it
     *
     * @param[in] task Task to accept
     * @param[in] internal Produced dependencies bypass the accepting check so
     *                     in-flight evaluations can settle during shutdown
     * @return Submission result
     */
    std::error_code submit(const std::shared_ptr<Task> &task, bool internal);

    /// Try to move a task forward after a readiness signal
    void advance(const std::shared_ptr<Task> &task);

    /// Queue a unit of work for the workers
    void enqueue(Work work);

    /**
     * Run one unit of work on the calling thread
     * @return false if the work list was empty
     */
    bool run_one();

    void start_workers();
    void stop_workers();

    /**
     * Stop accepting external submissions
     * @return true if this call closed the queue
     */
    bool close() noexcept { return accepting_.exchange(false, std::memory_order_acq_rel); }

    /// Snapshot of the tasks held by the queue
    [[nodiscard]] std::vector<std::shared_ptr<Task>> in_flight() const;

    [[nodiscard]] std::size_t in_flight_count() const {
        const SpinlockGuard guard(registry_lock_);
        return registry_.size();
    }

    [[nodiscard]] std::uint64_t submitted_count() const noexcept {
        return submitted_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_accepting() const noexcept {
        return accepting_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_running() const noexcept {
        return workers_ready_.load(std::memory_order_acquire) > 0;
    }

    [[nodiscard]] std::size_t worker_count() const noexcept { return worker_count_; }
    [[nodiscard]] std::string_view name() const noexcept { return name_; }

private:
    void worker_function(std::size_t worker_index);
    void make_ready(const std::shared_ptr<Task> &task);
    void evaluate_conditions(
            const std::shared_ptr<Task> &task,
            std::vector<std::shared_ptr<Precondition>> conditions);
    void release(std::uint64_t task_id);

    const std::size_t worker_count_;
    const Nanos worker_sleep_ns_;
    const std::string name_;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> stop_flag_{false};
    std::atomic<std::size_t> workers_ready_{0};
    std::atomic<std::uint64_t> submitted_{0};
    std::vector<std::thread> workers_;

    mutable Spinlock registry_lock_;
    phmap::flat_hash_map<std::uint64_t, std::shared_ptr<Task>> registry_; //!< Guarded by registry_lock_

    Spinlock work_lock_;
    std::deque<Work> work_; //!< Guarded by work_lock_
};

namespace {

void run_work(const QueueCore::Work &work, const std::string_view queue_name) {
    try {
        work();
    } catch (const std::exception &e) {
        PF_LOGC_ERROR(TaskLog::Queue, "Queue '{}': work item threw: {}", queue_name, e.what());
    } catch (...) {
        PF_LOGC_ERROR(TaskLog::Queue, "Queue '{}': work item threw an unknown exception", queue_name);
    }
}

void set_worker_thread_name(const std::string_view queue_name, const std::size_t worker_index) {
    // Linux limits thread names to 15 characters
    static constexpr std::size_t MAX_THREAD_NAME = 15;
    std::string thread_name = std::format("{}-{}", queue_name, worker_index);
    if (thread_name.size() > MAX_THREAD_NAME) {
        thread_name.resize(MAX_THREAD_NAME);
    }
    const int result = pthread_setname_np(pthread_self(), thread_name.c_str());
    if (result != 0) {
        PF_LOGC_DEBUG(
                TaskLog::Queue,
                "Failed to set worker thread name '{}': {}",
                thread_name,
                std::error_code(result, std::system_category()).message());
    }
}

} // namespace

std::error_code QueueCore::submit(const std::shared_ptr<Task> &task, const bool internal) {
    if (!task) {
        PF_LOGC_WARN(TaskLog::Queue, "Queue '{}': cannot submit a null task", name_);
        return make_error_code(TaskErrc::InvalidParameter);
    }
    if (!internal && !is_accepting()) {
        PF_LOGC_DEBUG(
                TaskLog::Queue,
                "Queue '{}' is shut down, rejecting task '{}'",
                name_,
                task->get_task_name());
        return make_error_code(TaskErrc::QueueStopped);
    }

    const std::uint64_t task_id = task->get_task_id();
    {
        const SpinlockGuard guard(registry_lock_);
        if (!registry_.try_emplace(task_id, task).second) {
            return make_error_code(TaskErrc::AlreadySubmitted);
        }
    }

    const std::weak_ptr<QueueCore> weak_core = weak_from_this();
    const std::weak_ptr<Task> weak_task = task;
    const bool claimed = task->claim_submission([weak_core, weak_task] {
        const auto core = weak_core.lock();
        const auto pending = weak_task.lock();
        if (core && pending) {
            core->advance(pending);
        }
    });

    if (!claimed) {
        {
            const SpinlockGuard guard(registry_lock_);
            registry_.erase(task_id);
        }
        PF_LOGC_DEBUG(
                TaskLog::Queue,
                "Task '{}' rejected by queue '{}', state is {}",
                task->get_task_name(),
                name_,
                ::wise_enum::to_string(task->get_state()));
        return make_error_code(TaskErrc::AlreadySubmitted);
    }

    submitted_.fetch_add(1, std::memory_order_acq_rel);
    PF_LOGC_TRACE_L1(
            TaskLog::Queue,
            "Queue '{}' accepted task '{}' ({})",
            name_,
            task->get_task_name(),
            task_id);

    task->add_completion_listener([weak_core, task_id](const std::shared_ptr<Task> & /*finished*/) {
        if (const auto core = weak_core.lock()) {
            core->release(task_id);
        }
    });

    advance(task);
    return make_error_code(TaskErrc::Success);
}

void QueueCore::advance(const std::shared_ptr<Task> &task) {
    auto conditions = task->begin_condition_evaluation();
    if (!conditions.has_value()) {
        return;
    }

    if (task->is_cancelled()) {
        PF_LOGC_TRACE_L1(
                TaskLog::Queue,
                "Task '{}' cancelled before evaluation, skipping {} condition(s)",
                task->get_task_name(),
                conditions->size());
        make_ready(task);
        return;
    }
    if (conditions->empty()) {
        make_ready(task);
        return;
    }

    evaluate_conditions(task, std::move(*conditions));
}

void QueueCore::evaluate_conditions(
        const std::shared_ptr<Task> &task, std::vector<std::shared_ptr<Precondition>> conditions) {
    const std::weak_ptr<QueueCore> weak_core = weak_from_this();
    const std::weak_ptr<Task> weak_task = task;

    auto evaluator = ConditionEvaluator::create(
            TaskRef{task},
            std::move(conditions),
            [weak_core](std::function<void()> work) {
                if (const auto core = weak_core.lock()) {
                    core->enqueue(std::move(work));
                }
            },
            [weak_core](const std::shared_ptr<Task> &dependency) -> std::error_code {
                const auto core = weak_core.lock();
                if (!core) {
                    return make_error_code(TaskErrc::QueueStopped);
                }
                return core->submit(dependency, true);
            },
            [weak_core, weak_task](TaskErrors failures) {
                const auto evaluated = weak_task.lock();
                if (!evaluated) {
                    return;
                }
                if (!failures.empty()) {
                    evaluated->cancel(std::move(failures));
                }
                if (const auto core = weak_core.lock()) {
                    core->make_ready(evaluated);
                }
            });
    evaluator->start();
}

void QueueCore::make_ready(const std::shared_ptr<Task> &task) {
    if (!task->try_transition(TaskState::EvaluatingConditions, TaskState::Ready)) {
        PF_LOGC_TRACE_L1(
                TaskLog::Queue,
                "Task '{}' not made ready, state is {}",
                task->get_task_name(),
                ::wise_enum::to_string(task->get_state()));
        return;
    }
    enqueue([task] { task->run_execution(); });
}

void QueueCore::enqueue(Work work) {
    if (stop_flag_.load(std::memory_order_acquire)) {
        // Workers are gone; settle late work on the caller
        run_work(work, name_);
        return;
    }
    const SpinlockGuard guard(work_lock_);
    work_.push_back(std::move(work));
}

bool QueueCore::run_one() {
    Work work;
    {
        const SpinlockGuard guard(work_lock_);
        if (work_.empty()) {
            return false;
        }
        work = std::move(work_.front());
        work_.pop_front();
    }
    run_work(work, name_);
    return true;
}

void QueueCore::release(const std::uint64_t task_id) {
    const SpinlockGuard guard(registry_lock_);
    registry_.erase(task_id);
}

std::vector<std::shared_ptr<Task>> QueueCore::in_flight() const {
    std::vector<std::shared_ptr<Task>> tasks;
    const SpinlockGuard guard(registry_lock_);
    tasks.reserve(registry_.size());
    for (const auto &[task_id, task] : registry_) {
        tasks.push_back(task);
    }
    return tasks;
}

void QueueCore::worker_function(const std::size_t worker_index) {
    set_worker_thread_name(name_, worker_index);
    PF_LOGC_DEBUG(TaskLog::Queue, "Queue '{}' worker {} starting", name_, worker_index);

    workers_ready_.fetch_add(1, std::memory_order_acq_rel);

    while (!stop_flag_.load(std::memory_order_acquire)) {
        if (!run_one()) {
            Time::sleep_for(worker_sleep_ns_);
        }
    }

    PF_LOGC_DEBUG(TaskLog::Queue, "Queue '{}' worker {} stopping", name_, worker_index);
}

void QueueCore::start_workers() {
    if (is_running()) {
        PF_LOGC_WARN(TaskLog::Queue, "Queue '{}': workers already started, ignoring call", name_);
        return;
    }

    PF_LOGC_INFO(TaskLog::Queue, "Queue '{}': starting {} worker threads", name_, worker_count_);
    stop_flag_.store(false, std::memory_order_release);
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&QueueCore::worker_function, this, i);
    }

    while (workers_ready_.load(std::memory_order_acquire) < worker_count_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    PF_LOGC_DEBUG(TaskLog::Queue, "Queue '{}': all {} workers are ready", name_, worker_count_);
}

void QueueCore::stop_workers() {
    stop_flag_.store(true, std::memory_order_release);
    if (!is_running()) {
        PF_LOGC_DEBUG(TaskLog::Queue, "Queue '{}': no workers running, nothing to join", name_);
        return;
    }

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    workers_ready_.store(0, std::memory_order_release);

    // Work queued between the last poll and the stop flag
    while (run_one()) {
    }

    PF_LOGC_INFO(TaskLog::Queue, "Queue '{}': all worker threads joined", name_);
}

} // namespace detail

TaskQueueBuilder &TaskQueueBuilder::workers(const std::size_t count) {
    workers_ = count;
    return *this;
}

TaskQueueBuilder &TaskQueueBuilder::name(std::string queue_name) {
    name_ = std::move(queue_name);
    return *this;
}

TaskQueueBuilder &TaskQueueBuilder::auto_start() {
    startup_behavior_ = QueueStartupBehavior::AutoStart;
    return *this;
}

TaskQueueBuilder &TaskQueueBuilder::manual_start() {
    startup_behavior_ = QueueStartupBehavior::Manual;
    return *this;
}

TaskQueue TaskQueueBuilder::build() {
    if (workers_ == 0) {
        log_and_throw<std::invalid_argument>(
                TaskLog::Queue, "Queue '{}' needs at least one worker", name_);
    }
    if (name_.empty()) {
        log_and_throw<std::invalid_argument>(TaskLog::Queue, "Queue name must not be empty");
    }
    return TaskQueue{workers_, worker_sleep_ns_, name_, startup_behavior_};
}

TaskQueueBuilder TaskQueue::create() { return TaskQueueBuilder{}; }

TaskQueue::TaskQueue(
        const std::size_t workers,
        const Nanos worker_sleep_ns,
        std::string name,
        const QueueStartupBehavior startup_behavior)
        : core_{std::make_shared<detail::QueueCore>(workers, worker_sleep_ns, std::move(name))} {
    PF_LOGC_INFO(
            TaskLog::Queue,
            "Initializing queue '{}' with {} workers, idle sleep {}ns",
            core_->name(),
            workers,
            worker_sleep_ns.count());

    if (startup_behavior == QueueStartupBehavior::AutoStart) {
        core_->start_workers();
    }
}

TaskQueue::~TaskQueue() {
    try {
        shutdown(QueueShutdownBehavior::CancelPendingTasks);
    } catch (const std::exception &e) {
        PF_LOGC_ERROR(TaskLog::Queue, "Queue '{}' shutdown failed: {}", core_->name(), e.what());
    } catch (...) {
        PF_LOGC_ERROR(TaskLog::Queue, "Queue '{}' shutdown failed: unknown exception", core_->name());
    }
}

std::error_code TaskQueue::submit(const std::shared_ptr<Task> &task) {
    return core_->submit(task, false);
}

std::error_code TaskQueue::submit(const std::vector<std::shared_ptr<Task>> &tasks) {
    std::error_code first_error{};
    for (const auto &task : tasks) {
        const std::error_code ec = core_->submit(task, false);
        if (ec && !first_error) {
            first_error = ec;
        }
    }
    return first_error;
}

void TaskQueue::start_workers() { core_->start_workers(); }

void TaskQueue::shutdown(const QueueShutdownBehavior behavior) {
    if (!core_->close()) {
        PF_LOGC_DEBUG(TaskLog::Queue, "Queue '{}' already shut down", core_->name());
        return;
    }

    PF_LOGC_DEBUG(
            TaskLog::Queue,
            "Shutting down queue '{}' ({})",
            core_->name(),
            ::wise_enum::to_string(behavior));

    if (behavior == QueueShutdownBehavior::CancelPendingTasks) {
        const auto pending = core_->in_flight();
        for (const auto &task : pending) {
            task->cancel(TaskError{TaskErrc::Cancelled, "Queue shutting down"});
        }
        if (!pending.empty()) {
            PF_LOGC_INFO(
                    TaskLog::Queue,
                    "Queue '{}': cancelled {} pending tasks",
                    core_->name(),
                    pending.size());
        }
    }

    // Workers settle the remaining tasks; without workers the caller does
    static constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(1);
    while (core_->in_flight_count() > 0) {
        if (core_->is_running() || !core_->run_one()) {
            std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
        }
    }

    core_->stop_workers();
    PF_LOGC_INFO(TaskLog::Queue, "Queue '{}' shutdown complete", core_->name());
}

bool TaskQueue::wait_until_idle_ns(const Nanos timeout) const {
    static constexpr auto WAIT_POLL_INTERVAL = std::chrono::microseconds(200);
    const auto deadline = Time::now() + timeout;
    while (core_->in_flight_count() > 0) {
        if (Time::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
    return true;
}

std::size_t TaskQueue::in_flight_count() const { return core_->in_flight_count(); }

std::uint64_t TaskQueue::submitted_count() const noexcept { return core_->submitted_count(); }

std::size_t TaskQueue::worker_count() const noexcept { return core_->worker_count(); }

std::string_view TaskQueue::name() const noexcept { return core_->name(); }

bool TaskQueue::is_running() const noexcept { return core_->is_running(); }

bool TaskQueue::is_accepting() const noexcept { return core_->is_accepting(); }

} // namespace procflow::task
