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
 * @file task_queue.hpp
 * @brief Concurrent queue that drives submitted tasks through their lifecycle
 *
 * The queue owns a pool of worker threads polling a shared work list. A
 * submitted task is held by the queue until it finishes. The queue waits for
 * dependencies through finish listeners, evaluates preconditions on its
 * workers, then runs the task's execution step. It never blocks a worker on
 * another task.
 */

#ifndef PROCFLOW_TASK_TASK_QUEUE_HPP
#define PROCFLOW_TASK_TASK_QUEUE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <wise_enum.h>

#include "task/task.hpp"
#include "task/task_export.hpp"
#include "task/time.hpp"

namespace procflow::task {

class TaskQueueBuilder;

namespace detail {
class QueueCore;
} // namespace detail

/**
 * What happens to in-flight tasks when the queue shuts down
 */
enum class QueueShutdownBehavior {
    /// Let every in-flight task run to completion
    FinishPendingTasks,
    /// Cancel every in-flight task, then wait for them to finish
    CancelPendingTasks
};

/// Worker startup behavior for the queue constructor
enum class QueueStartupBehavior {
    AutoStart, //!< Start workers during construction
    Manual     //!< Workers start on start_workers()
};

} // namespace procflow::task

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(procflow::task::QueueShutdownBehavior, FinishPendingTasks, CancelPendingTasks)
WISE_ENUM_ADAPT(procflow::task::QueueStartupBehavior, AutoStart, Manual)

namespace procflow::task {

/**
 * Builder for TaskQueue
 *
 * @code
 * auto queue = TaskQueue::create().workers(4).name("io").build();
 * @endcode
 */
class TASK_EXPORT TaskQueueBuilder final {
public:
    /// Default idle sleep of a worker between polls
    static constexpr Nanos DEFAULT_WORKER_SLEEP_NS{10'000};
    /// Default number of workers
    static constexpr std::size_t DEFAULT_WORKERS = 4;

    TaskQueueBuilder() = default;

    /**
     * Set the number of worker threads
     * @param[in] count Number of workers, must be at least 1
     * @return Reference to this builder for chaining
     */
    TaskQueueBuilder &workers(std::size_t count);

    /**
     * Set the idle sleep between polls of an empty work list
     * @param[in] sleep Sleep duration
     * @return Reference to this builder for chaining
     */
    template <typename Rep, typename Period>
    TaskQueueBuilder &worker_sleep(std::chrono::duration<Rep, Period> sleep) {
        worker_sleep_ns_ = std::chrono::duration_cast<Nanos>(sleep);
        return *this;
    }

    /**
     * Set the queue name used in logs and worker thread names
     * @param[in] queue_name Queue name
     * @return Reference to this builder for chaining
     */
    TaskQueueBuilder &name(std::string queue_name);

    /// Start workers during construction (default)
    TaskQueueBuilder &auto_start();

    /// Defer worker startup to TaskQueue::start_workers()
    TaskQueueBuilder &manual_start();

    /**
     * Build the queue
     * @return Configured queue
     * @throws std::invalid_argument if the configuration is invalid
     */
    [[nodiscard]] TaskQueue build();

private:
    std::size_t workers_{DEFAULT_WORKERS};
    Nanos worker_sleep_ns_{DEFAULT_WORKER_SLEEP_NS};
    std::string name_{"procflow"};
    QueueStartupBehavior startup_behavior_{QueueStartupBehavior::AutoStart};
};

/**
 * Concurrent task queue
 *
 * submit() accepts a task once; the queue then owns a strong reference to it
 * until it finishes. Dependencies must be submitted separately, to this or
 * another queue. The destructor cancels in-flight tasks and waits for them.
 */
class TASK_EXPORT TaskQueue final {
    friend class TaskQueueBuilder;

public:
    /**
     * Create a builder
     * @return Builder with default settings
     */
    [[nodiscard]] static TaskQueueBuilder create();

    ~TaskQueue();

    TaskQueue(const TaskQueue &) = delete;
    TaskQueue &operator=(const TaskQueue &) = delete;
    TaskQueue(TaskQueue &&) = delete;
    TaskQueue &operator=(TaskQueue &&) = delete;

    /**
     * Submit a task
     *
     * @param[in] task Task to submit
     * @return TaskErrc::InvalidParameter for a null task,
     *         TaskErrc::QueueStopped once shutdown started,
     *         TaskErrc::AlreadySubmitted if the task left Initialized,
     *         success otherwise
     */
    [[nodiscard]] std::error_code submit(const std::shared_ptr<Task> &task);

    /**
     * Submit several tasks
     *
     * Every task is attempted even if an earlier one fails.
     *
     * @param[in] tasks Tasks to submit
     * @return First error encountered, success if all were accepted
     */
    [[nodiscard]] std::error_code submit(const std::vector<std::shared_ptr<Task>> &tasks);

    /**
     * Start worker threads
     *
     * Ignored with a warning if workers are already running.
     */
    void start_workers();

    /**
     * Stop accepting tasks, settle in-flight ones and join the workers
     *
     * Blocks until every in-flight task finished. Asynchronous bodies that
     * never finish block this call. Safe to call more than once.
     *
     * @param[in] behavior Whether in-flight tasks are cancelled first
     */
    void shutdown(QueueShutdownBehavior behavior = QueueShutdownBehavior::FinishPendingTasks);

    /**
     * Wait until no task is in flight
     *
     * @param[in] timeout Maximum time to wait
     * @return true if the queue became idle in time
     */
    template <typename Rep, typename Period>
    [[nodiscard]] bool wait_until_idle(std::chrono::duration<Rep, Period> timeout) const {
        return wait_until_idle_ns(std::chrono::duration_cast<Nanos>(timeout));
    }

    /// Number of submitted tasks that have not finished
    [[nodiscard]] std::size_t in_flight_count() const;

    /// Total number of tasks accepted by submit()
    [[nodiscard]] std::uint64_t submitted_count() const noexcept;

    [[nodiscard]] std::size_t worker_count() const noexcept;
    [[nodiscard]] std::string_view name() const noexcept;

    /// Whether worker threads are running
    [[nodiscard]] bool is_running() const noexcept;

    /// Whether submit() still accepts tasks
    [[nodiscard]] bool is_accepting() const noexcept;

private:
    TaskQueue(
            std::size_t workers,
            Nanos worker_sleep_ns,
            std::string name,
            QueueStartupBehavior startup_behavior);

    [[nodiscard]] bool wait_until_idle_ns(Nanos timeout) const;

    std::shared_ptr<detail::QueueCore> core_;
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_TASK_QUEUE_HPP
