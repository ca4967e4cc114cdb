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
 * @file event_concurrency_tracker.hpp
 * @brief Instrumentation that detects overlapping lifecycle callbacks
 *
 * The tracker attaches an observer to every lifecycle event of a task and can
 * wrap the task's body. Each tracked callback marks its start and end; a
 * callback that starts while another one of the same task is still active is
 * recorded as an overlap. Use one tracker per task.
 */

#ifndef PROCFLOW_TASK_EVENT_CONCURRENCY_TRACKER_HPP
#define PROCFLOW_TASK_EVENT_CONCURRENCY_TRACKER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "task/spinlock.hpp"
#include "task/task.hpp"
#include "task/task_export.hpp"
#include "task/time.hpp"

namespace procflow::task {

/**
 * Timing of one tracked callback
 */
struct CallbackRecord final {
    std::string label;      //!< Event name or body label
    Nanos start_time{};     //!< Monotonic start time
    Nanos end_time{};       //!< Monotonic end time
    std::size_t concurrent{}; //!< Callbacks already active when this one started
};

/**
 * Records lifecycle callbacks of one task and reports overlaps
 */
class TASK_EXPORT EventConcurrencyTracker final {
public:
    /**
     * Constructor
     *
     * @param[in] callback_delay Time each tracked callback stays active, which
     *                           widens the window in which an overlap would be
     *                           caught
     */
    explicit EventConcurrencyTracker(Nanos callback_delay = Nanos{0});

    /**
     * Register a tracking observer for every lifecycle event
     *
     * The task references the tracker weakly; records stop once the tracker
     * is destroyed.
     *
     * @param[in] self Tracker handle
     * @param[in] task Task to instrument
     */
    static void attach(const std::shared_ptr<EventConcurrencyTracker> &self, Task &task);

    /**
     * Wrap a body so its execution is tracked like a callback
     *
     * @param[in] self Tracker handle
     * @param[in] label Label stored in the record
     * @param[in] body Body to wrap
     * @return Tracked body
     */
    [[nodiscard]] static TaskBody
    wrap(const std::shared_ptr<EventConcurrencyTracker> &self, std::string label, TaskBody body);

    /**
     * Mark the start of a callback
     *
     * @param[in] label Label stored in the record
     * @return Open record to hand back to end()
     */
    [[nodiscard]] CallbackRecord begin(std::string label);

    /**
     * Mark the end of a callback
     *
     * @param[in] record Record returned by the matching begin()
     */
    void end(CallbackRecord record);

    /// Whether any two tracked callbacks overlapped
    [[nodiscard]] bool has_overlap() const noexcept {
        return overlaps_.load(std::memory_order_acquire) > 0;
    }

    /// Number of callbacks that started while another was active
    [[nodiscard]] std::size_t overlap_count() const noexcept {
        return overlaps_.load(std::memory_order_acquire);
    }

    /// Number of completed callbacks
    [[nodiscard]] std::size_t callback_count() const;

    /// Completed callbacks in completion order
    [[nodiscard]] std::vector<CallbackRecord> records() const;

private:
    Nanos callback_delay_;
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> overlaps_{0};

    mutable Spinlock lock_;
    std::vector<CallbackRecord> records_; //!< Guarded by lock_
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_EVENT_CONCURRENCY_TRACKER_HPP
