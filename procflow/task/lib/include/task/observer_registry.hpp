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
 * @file observer_registry.hpp
 * @brief Per-task lifecycle observers and the serial event dispatcher
 *
 * Every lifecycle notification of a task, and the task body itself, runs as
 * an event on the task's SerialDispatcher. At most one thread drains the
 * dispatcher at a time, so no two callbacks of the same task ever overlap.
 * Events posted while a drain is in progress (from another thread, or
 * re-entrantly from a callback) are queued behind the running one instead of
 * nesting.
 */

#ifndef PROCFLOW_TASK_OBSERVER_REGISTRY_HPP
#define PROCFLOW_TASK_OBSERVER_REGISTRY_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

#include <wise_enum.h>

#include "task/spinlock.hpp"
#include "task/task_errors.hpp"
#include "task/task_export.hpp"
#include "task/task_ref.hpp"
#include "task/task_state.hpp"

namespace procflow::task {

/**
 * Trampolining serial executor
 *
 * dispatch() queues an event and, if nobody is draining, drains the queue on
 * the calling thread. A caller that finds a drain already running returns
 * immediately; its event runs on the draining thread after the current one.
 * The queue and the draining flag share one spinlock so an event can never be
 * stranded between the last pop and the flag reset.
 */
class TASK_EXPORT SerialDispatcher final {
public:
    using Event = std::function<void()>;

    SerialDispatcher() = default;
    ~SerialDispatcher() = default;

    SerialDispatcher(const SerialDispatcher &) = delete;
    SerialDispatcher &operator=(const SerialDispatcher &) = delete;
    SerialDispatcher(SerialDispatcher &&) = delete;
    SerialDispatcher &operator=(SerialDispatcher &&) = delete;

    /**
     * Queue an event and drain if idle
     *
     * @param[in] event Event to run
     */
    void dispatch(Event event);

    /**
     * Queue an event without draining
     *
     * Safe to call while holding other spinlocks; pair with drain() once
     * those are released.
     *
     * @param[in] event Event to run
     */
    void enqueue(Event event);

    /**
     * Drain queued events on the calling thread unless another thread is
     * already draining
     */
    void drain();

    /// Check whether the calling context is inside a drain on any thread
    [[nodiscard]] bool is_draining() const noexcept;

    /// Number of events run so far
    [[nodiscard]] std::uint64_t events_run() const noexcept {
        return events_run_.load(std::memory_order_relaxed);
    }

private:
    mutable Spinlock lock_;
    std::deque<Event> pending_; //!< Guarded by lock_
    bool draining_{};           //!< Guarded by lock_
    std::atomic<std::uint64_t> events_run_{0};
};

/**
 * Lifecycle observer callback
 *
 * Receives the task and a snapshot of its error list at invocation time.
 */
using ObserverCallback = std::function<void(const std::shared_ptr<Task> &, const TaskErrors &)>;

/**
 * One registered observer
 *
 * Bound to exactly one event of exactly one task. The back reference is
 * non-owning; notify() skips the entry if the task is gone.
 */
struct ObserverEntry final {
    TaskEvent event{TaskEvent::DidFinish};      //!< Event this entry listens to
    ObserverCallback callback;                  //!< User callback
    TaskRef owner;                              //!< Task the entry belongs to
    std::atomic<std::uint32_t> invocations{0};  //!< Times the callback ran
};

/**
 * Ordered per-event observer lists for one task
 *
 * Registration order is invocation order. Lists are appended under a
 * spinlock and copied before invocation, so observers may be added from any
 * thread, including from inside a callback. An observer added after its
 * event already fired is kept but never invoked.
 */
class TASK_EXPORT ObserverRegistry final {
public:
    ObserverRegistry() = default;
    ~ObserverRegistry() = default;

    ObserverRegistry(const ObserverRegistry &) = delete;
    ObserverRegistry &operator=(const ObserverRegistry &) = delete;
    ObserverRegistry(ObserverRegistry &&) = delete;
    ObserverRegistry &operator=(ObserverRegistry &&) = delete;

    /**
     * Register an observer
     *
     * @param[in] event Lifecycle event to observe
     * @param[in] owner Task the observer is attached to
     * @param[in] callback Callback to invoke
     * @return Handle to the registered entry
     */
    std::shared_ptr<const ObserverEntry>
    add(TaskEvent event, const TaskRef &owner, ObserverCallback callback);

    /**
     * Invoke all observers of an event in registration order
     *
     * Must be called from the owning task's dispatcher. Exceptions thrown by
     * a callback are logged and do not stop later callbacks.
     *
     * @param[in] event Event being delivered
     * @param[in] errors Error snapshot handed to each callback
     * @return Number of callbacks invoked
     */
    std::size_t notify(TaskEvent event, const TaskErrors &errors);

    /**
     * Count observers registered for an event
     *
     * @param[in] event Event to query
     * @return Number of registered entries
     */
    [[nodiscard]] std::size_t count(TaskEvent event) const;

    /**
     * Check whether an event was delivered
     *
     * @param[in] event Event to query
     * @return true once notify() ran for the event
     */
    [[nodiscard]] bool was_notified(TaskEvent event) const noexcept;

private:
    static constexpr std::size_t NUM_EVENTS = ::wise_enum::size<TaskEvent>;

    mutable Spinlock lock_;
    std::array<std::vector<std::shared_ptr<ObserverEntry>>, NUM_EVENTS> entries_; //!< Guarded by lock_
    std::array<std::atomic<bool>, NUM_EVENTS> notified_{};
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_OBSERVER_REGISTRY_HPP
