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
 * @file event_concurrency_tracker.cpp
 * @brief Lifecycle callback overlap detection
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "log/pf_log_macros.hpp"
#include "task/event_concurrency_tracker.hpp"
#include "task/task.hpp"
#include "task/task_log.hpp"
#include "task/task_state.hpp"
#include "task/time.hpp"

namespace procflow::task {

namespace {

/**
 * Ends a tracked callback when the scope exits, also on exceptions
 */
class TrackedScope final {
public:
    TrackedScope(std::shared_ptr<EventConcurrencyTracker> tracker, std::string label)
            : tracker_{std::move(tracker)} {
        if (tracker_) {
            record_ = tracker_->begin(std::move(label));
        }
    }

    ~TrackedScope() {
        if (tracker_) {
            tracker_->end(std::move(record_));
        }
    }

    TrackedScope(const TrackedScope &) = delete;
    TrackedScope &operator=(const TrackedScope &) = delete;
    TrackedScope(TrackedScope &&) = delete;
    TrackedScope &operator=(TrackedScope &&) = delete;

private:
    std::shared_ptr<EventConcurrencyTracker> tracker_;
    CallbackRecord record_;
};

} // namespace

EventConcurrencyTracker::EventConcurrencyTracker(const Nanos callback_delay)
        : callback_delay_{callback_delay} {}

void EventConcurrencyTracker::attach(
        const std::shared_ptr<EventConcurrencyTracker> &self, Task &task) {
    const std::weak_ptr<EventConcurrencyTracker> weak_tracker = self;
    for (const auto &[event, event_name] : ::wise_enum::range<TaskEvent>) {
        task.add_observer(
                event,
                [weak_tracker, label = std::string{event_name}](
                        const std::shared_ptr<Task> & /*task*/, const TaskErrors & /*errors*/) {
                    const TrackedScope scope{weak_tracker.lock(), label};
                });
    }
}

TaskBody EventConcurrencyTracker::wrap(
        const std::shared_ptr<EventConcurrencyTracker> &self, std::string label, TaskBody body) {
    const std::weak_ptr<EventConcurrencyTracker> weak_tracker = self;
    return [weak_tracker, label = std::move(label), body = std::move(body)](
                   const TaskContext &ctx) {
        const TrackedScope scope{weak_tracker.lock(), label};
        body(ctx);
    };
}

CallbackRecord EventConcurrencyTracker::begin(std::string label) {
    const std::size_t already_active = active_.fetch_add(1, std::memory_order_acq_rel);
    if (already_active != 0) {
        overlaps_.fetch_add(1, std::memory_order_acq_rel);
        PF_LOGC_WARN(
                TaskLog::Observer,
                "Callback '{}' started while {} other callback(s) were active",
                label,
                already_active);
    }

    CallbackRecord record{std::move(label), Time::now_ns(), Nanos{0}, already_active};

    if (callback_delay_.count() > 0) {
        Time::sleep_for(callback_delay_);
    }
    return record;
}

void EventConcurrencyTracker::end(CallbackRecord record) {
    record.end_time = Time::now_ns();
    {
        const SpinlockGuard guard(lock_);
        records_.push_back(std::move(record));
    }
    active_.fetch_sub(1, std::memory_order_acq_rel);
}

std::size_t EventConcurrencyTracker::callback_count() const {
    const SpinlockGuard guard(lock_);
    return records_.size();
}

std::vector<CallbackRecord> EventConcurrencyTracker::records() const {
    const SpinlockGuard guard(lock_);
    return records_;
}

} // namespace procflow::task
