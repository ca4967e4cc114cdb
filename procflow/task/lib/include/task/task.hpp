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
 * @file task.hpp
 * @brief Task lifecycle state machine, execution context and builder
 *
 * A task moves through Initialized, Pending, EvaluatingConditions, Ready,
 * Executing, Finishing and Finished exactly once. All transitions are
 * compare-and-swap operations on a single atomic state word; the finish
 * transition can be claimed by exactly one caller no matter how many threads
 * race for it. Cancellation is an orthogonal flag that is checked at the
 * Ready/Executing boundary. Lifecycle observers and the body run on the
 * task's serial dispatcher and never overlap.
 */

#ifndef PROCFLOW_TASK_TASK_HPP
#define PROCFLOW_TASK_TASK_HPP

#include <any>
#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "log/pf_log_macros.hpp"
#include "task/observer_registry.hpp"
#include "task/precondition.hpp"
#include "task/spinlock.hpp"
#include "task/task_errors.hpp"
#include "task/task_export.hpp"
#include "task/task_log.hpp"
#include "task/task_ref.hpp"
#include "task/task_state.hpp"
#include "task/time.hpp"

namespace procflow::task {

class Task;
class TaskQueue;
class ConditionEvaluator;

namespace detail {
class QueueCore;
} // namespace detail

/**
 * Result returned by a synchronous task body
 *
 * An empty error list means success. The errors are handed to finish().
 */
struct TaskResult final {
    TaskErrors errors; //!< Errors to finish the task with

    /// Default constructor creates successful result
    TaskResult() = default;

    /**
     * Create a failed result with one error
     * @param[in] error Error to finish the task with
     */
    explicit TaskResult(TaskError error) { errors.push_back(std::move(error)); }

    /**
     * Create a result from an error list
     * @param[in] errs Errors to finish the task with
     */
    explicit TaskResult(TaskErrors errs) : errors{std::move(errs)} {}

    [[nodiscard]] bool is_success() const noexcept { return errors.empty(); }
};

/**
 * Execution context passed to task bodies
 *
 * Holds a strong reference to the running task for the duration of the body.
 * Asynchronous bodies copy the context to keep the task alive until they
 * call finish().
 */
class TASK_EXPORT TaskContext final {
public:
    /**
     * Constructor
     * @param[in] task Task being executed
     */
    explicit TaskContext(std::shared_ptr<Task> task);

    /**
     * Check whether cancellation was requested
     * @return true once the task's cancellation flag is set
     */
    [[nodiscard]] bool is_cancelled() const noexcept;

    /**
     * Finish the running task
     * @param[in] errors Errors to append to the task's error list
     */
    void finish(TaskErrors errors = {}) const;

    /**
     * Request cancellation of the running task
     * @param[in] errors Errors to append to the task's error list
     */
    void cancel(TaskErrors errors = {}) const;

    /// Task being executed
    [[nodiscard]] const std::shared_ptr<Task> &task() const noexcept { return task_; }

    /**
     * Helper to safely get user data of specific type
     * @return Optional containing the data if type matches, nullopt otherwise
     */
    template <typename T> [[nodiscard]] std::optional<T> get_user_data() const;

private:
    std::shared_ptr<Task> task_;
};

/// Body signature used for every task internally
using TaskBody = std::function<void(const TaskContext &)>;

/// Completion block run after did-finish observers
using CompletionBlock = std::function<void()>;

/// Concept for synchronous task bodies
// clang-format off
template <typename Func>
concept SyncTaskFunction =
    (std::is_invocable_r_v<TaskResult, Func>) ||                              // TaskResult func()
    (std::is_invocable_r_v<TaskResult, Func, const TaskContext&>) ||          // TaskResult func(const TaskContext&)
    (std::is_invocable_v<Func> && std::is_void_v<std::invoke_result_t<Func>>) ||  // void func()
    (std::is_invocable_v<Func, const TaskContext&> &&                             // void func(const TaskContext&)
     std::is_void_v<std::invoke_result_t<Func, const TaskContext&>>);
// clang-format on

/**
 * Unit of asynchronous work with a managed lifecycle
 *
 * Tasks are always owned through std::shared_ptr and created with
 * TaskBuilder. Preconditions, dependencies and observers are attached before
 * submission; a TaskQueue then drives the task through dependency waiting,
 * precondition evaluation and execution. cancel() and finish() are safe from
 * any thread, any number of times, including from inside the task's own
 * observers.
 */
class TASK_EXPORT Task final : public std::enable_shared_from_this<Task> {
public:
    ~Task();

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;
    Task(Task &&) = delete;
    Task &operator=(Task &&) = delete;

    /**
     * Request cooperative cancellation
     *
     * Sets the cancellation flag and appends errors. The first effective
     * cancel fires did-cancel observers once. Once finish has been claimed the
     * call is a lost update: nothing changes and no observer runs.
     *
     * @param[in] errors Errors to append, may be empty
     */
    void cancel(TaskErrors errors = {});

    /**
     * Request cancellation with a single error
     * @param[in] error Error to append
     */
    void cancel(TaskError error);

    /**
     * Finish the task
     *
     * Exactly one caller wins; every other call, concurrent or later, is a
     * silent no-op. The winner appends its errors, runs will-finish
     * observers, freezes the error list, then runs did-finish observers and
     * completion blocks.
     *
     * @param[in] errors Errors to append, may be empty
     */
    void finish(TaskErrors errors = {});

    /**
     * Attach a precondition
     *
     * Ignored with a debug log once condition evaluation has started.
     *
     * @param[in] condition Condition to attach
     * @throws std::invalid_argument if condition is null
     */
    void add_condition(std::shared_ptr<Precondition> condition);

    /**
     * Add a task that must finish before this one becomes ready
     *
     * Ignored with a debug log once condition evaluation has started.
     *
     * @param[in] dependency Task to wait for
     * @throws std::invalid_argument if dependency is null or this task
     */
    void add_dependency(const std::shared_ptr<Task> &dependency);

    /**
     * Register a lifecycle observer
     *
     * @param[in] event Event to observe
     * @param[in] callback Callback receiving the task and its errors
     * @throws std::invalid_argument if callback is empty
     */
    void add_observer(TaskEvent event, ObserverCallback callback);

    /**
     * Add a block to run after the did-finish observers
     *
     * If the task already finished, the block is dispatched on the task's
     * serial dispatcher. It runs on the calling thread when the dispatcher is
     * idle, otherwise after the current event on the thread draining it.
     *
     * @param[in] block Block to run
     */
    void add_completion(CompletionBlock block);

    /**
     * Block until the task finished and completion blocks ran
     *
     * For callers outside the queue; never called by the framework.
     */
    void wait() const;

    /**
     * Block until the task finished or the timeout elapsed
     *
     * @param[in] timeout Maximum time to wait
     * @return true if the task finished in time
     */
    template <typename Rep, typename Period>
    [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        return wait_for_ns(std::chrono::duration_cast<Nanos>(timeout));
    }

    [[nodiscard]] std::uint64_t get_task_id() const noexcept { return task_id_; }
    [[nodiscard]] std::string_view get_task_name() const noexcept { return task_name_; }

    [[nodiscard]] TaskState get_state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_executing() const noexcept {
        return get_state() == TaskState::Executing;
    }

    [[nodiscard]] bool is_finished() const noexcept { return get_state() == TaskState::Finished; }

    /**
     * Readiness predicate
     *
     * @return true once dependencies finished and preconditions resolved, or
     *         once the task was cancelled after submission
     */
    [[nodiscard]] bool is_ready() const noexcept;

    /**
     * Snapshot of the accumulated errors
     *
     * Lock-free once the task is finished.
     *
     * @return Copy of the error list
     */
    [[nodiscard]] TaskErrors errors() const;

    /**
     * Dependencies registered on this task
     * @return Snapshot of the dependency set
     */
    [[nodiscard]] std::vector<std::shared_ptr<Task>> dependencies() const;

    /// Number of dependencies that have not finished yet
    [[nodiscard]] std::size_t pending_dependency_count() const noexcept {
        return pending_dependencies_.load(std::memory_order_acquire);
    }

    /// Number of attached preconditions not yet handed to an evaluator
    [[nodiscard]] std::size_t condition_count() const;

    /**
     * Count observers registered for an event
     * @param[in] event Event to query
     * @return Number of observers
     */
    [[nodiscard]] std::size_t observer_count(TaskEvent event) const;

    /// User data attached by the builder
    [[nodiscard]] const std::any &user_data() const noexcept { return user_data_; }

private:
    friend class TaskBuilder;
    friend class TaskQueue;
    friend class ConditionEvaluator;
    friend class detail::QueueCore;

    using CompletionListener = std::function<void(const std::shared_ptr<Task> &)>;
    using ReadinessHook = std::function<void()>;

    Task(std::string task_name, TaskBody body, std::any user_data);

    [[nodiscard]] bool wait_for_ns(Nanos timeout) const;

    /**
     * Move from Initialized to Pending and install the queue's readiness hook
     *
     * Queues the did-submit notification ahead of any later event.
     *
     * @param[in] hook Called whenever the task may have become ready
     * @return false if the task was not in Initialized
     */
    [[nodiscard]] bool claim_submission(ReadinessHook hook);

    /**
     * Move from Pending to EvaluatingConditions if the task is ready
     *
     * @return Attached preconditions on success, nullopt if the task is not
     *         pending or still waits for dependencies
     */
    [[nodiscard]] std::optional<std::vector<std::shared_ptr<Precondition>>>
    begin_condition_evaluation();

    /**
     * Compare-and-swap between two lifecycle states
     *
     * @param[in] from Expected current state
     * @param[in] to New state
     * @return true if this call performed the transition
     */
    [[nodiscard]] bool try_transition(TaskState from, TaskState to) noexcept;

    /**
     * Run the execution step on the task's dispatcher
     *
     * Called by the queue once the task is Ready.
     */
    void run_execution();

    /**
     * Register an internal finish listener
     *
     * Listeners run after completion blocks, or immediately if the task
     * already finished. Used for queue holds and dependency countdown.
     *
     * @param[in] listener Listener receiving the finished task
     */
    void add_completion_listener(CompletionListener listener);

    void execute_step();
    void complete_finish();
    void on_dependency_finished();
    void invoke_readiness_hook();
    void notify(TaskEvent event, const TaskErrors &errors);

    static inline std::atomic<std::uint64_t> next_task_id{1}; //!< Global task ID counter

    std::uint64_t task_id_{};           //!< Unique task ID assigned at construction
    std::string task_name_;             //!< Task name for identification
    TaskBody body_;                     //!< Body run in the Executing state
    std::any user_data_;                //!< User data exposed through TaskContext
    std::atomic<TaskState> state_{TaskState::Initialized}; //!< Lifecycle state word
    std::atomic<bool> cancelled_{false};                   //!< Cooperative cancellation flag
    std::atomic<std::size_t> pending_dependencies_{0};     //!< Unfinished dependencies

    mutable Spinlock lock_; //!< Guards the fields below
    TaskErrors errors_;     //!< Append-only until Finished, then immutable
    std::vector<std::shared_ptr<Task>> dependencies_;
    std::vector<std::shared_ptr<Precondition>> conditions_;
    std::vector<CompletionBlock> completion_blocks_;
    std::vector<CompletionListener> completion_listeners_;
    bool listeners_closed_{};
    ReadinessHook readiness_hook_;

    ObserverRegistry observers_;
    SerialDispatcher dispatcher_;

    std::promise<void> finished_promise_;
    std::shared_future<void> finished_future_;
};

template <typename T> std::optional<T> TaskContext::get_user_data() const {
    const std::any &data = task_->user_data();
    if (!data.has_value()) {
        return std::nullopt;
    }

    try {
        return std::any_cast<T>(data);
    } catch (const std::bad_any_cast &) {
        PF_LOGC_ERROR(
                TaskLog::Task,
                "TaskContext::get_user_data() bad_any_cast - requested "
                "type does not match stored type");
        return std::nullopt;
    }
}

/**
 * Fluent builder for creating Task objects
 */
class TASK_EXPORT TaskBuilder final {
private:
    std::string task_name_; //!< Task name for identification
    TaskBody body_;         //!< Body, empty means finish immediately
    std::any user_data_;    //!< User-defined data for task context
    std::vector<std::shared_ptr<Task>> dependencies_;
    std::vector<std::shared_ptr<Precondition>> conditions_;
    std::vector<std::pair<TaskEvent, ObserverCallback>> observers_;
    std::vector<CompletionBlock> completions_;

public:
    /**
     * Constructor
     * @param[in] task_name Name for the task
     */
    explicit TaskBuilder(std::string task_name) : task_name_(std::move(task_name)) {}

    /**
     * Set a synchronous body
     *
     * The task finishes automatically when the body returns, with the errors
     * of the returned TaskResult. A thrown exception finishes the task with
     * TaskErrc::ExecutionFailed.
     *
     * @param[in] func Body returning TaskResult or void, with or without a
     *                 TaskContext parameter
     * @return Reference to this builder for chaining
     */
    template <typename Func>
        requires SyncTaskFunction<Func>
    TaskBuilder &function(Func &&func) {
        body_ = [captured_func = std::forward<Func>(func)](const TaskContext &ctx) mutable {
            TaskResult result{};
            if constexpr (std::is_invocable_r_v<TaskResult, Func, const TaskContext &>) {
                result = captured_func(ctx);
            } else if constexpr (std::is_invocable_r_v<TaskResult, Func>) {
                result = captured_func();
            } else if constexpr (std::is_invocable_v<Func, const TaskContext &>) {
                captured_func(ctx);
            } else {
                captured_func();
            }
            ctx.finish(std::move(result.errors));
        };
        return *this;
    }

    /**
     * Set an asynchronous body
     *
     * The task stays Executing after the body returns until finish() is
     * called through the context or the task.
     *
     * @param[in] body Body receiving the execution context
     * @return Reference to this builder for chaining
     */
    TaskBuilder &async_function(TaskBody body);

    /**
     * Set user data for task context
     * @param[in] data User-defined data passed to bodies
     * @return Reference to this builder for chaining
     */
    TaskBuilder &user_data(std::any data);

    TaskBuilder &depends_on(std::shared_ptr<Task> dependency);
    TaskBuilder &depends_on(const std::vector<std::shared_ptr<Task>> &dependencies);

    /**
     * Attach a precondition
     * @param[in] condition Condition to attach
     * @return Reference to this builder for chaining
     */
    TaskBuilder &condition(std::shared_ptr<Precondition> condition);

    /**
     * Attach a lifecycle observer
     * @param[in] event Event to observe
     * @param[in] callback Observer callback
     * @return Reference to this builder for chaining
     */
    TaskBuilder &observer(TaskEvent event, ObserverCallback callback);

    TaskBuilder &completion(CompletionBlock block);

    /**
     * Build the task as a shared_ptr
     * @return Shared pointer to the created Task object
     * @throws std::invalid_argument if task name is empty
     */
    [[nodiscard]] std::shared_ptr<Task> build_shared();
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_TASK_HPP
