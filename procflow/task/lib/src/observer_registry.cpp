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
 * @file observer_registry.cpp
 * @brief Serial dispatcher drain loop and observer invocation
 */

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "log/pf_log_macros.hpp"
#include "task/observer_registry.hpp"
#include "task/task.hpp"
#include "task/task_log.hpp"

namespace procflow::task {

void SerialDispatcher::dispatch(Event event) {
    enqueue(std::move(event));
    drain();
}

void SerialDispatcher::enqueue(Event event) {
    const SpinlockGuard guard(lock_);
    pending_.push_back(std::move(event));
}

void SerialDispatcher::drain() {
    {
        const SpinlockGuard guard(lock_);
        if (draining_ || pending_.empty()) {
            return;
        }
        draining_ = true;
    }

    while (true) {
        Event next;
        {
            const SpinlockGuard guard(lock_);
            if (pending_.empty()) {
                draining_ = false;
                return;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
        }

        try {
            next();
        } catch (const std::exception &e) {
            PF_LOGC_ERROR(TaskLog::Observer, "Lifecycle event threw: {}", e.what());
        } catch (...) {
            PF_LOGC_ERROR(TaskLog::Observer, "Lifecycle event threw an unknown exception");
        }
        events_run_.fetch_add(1, std::memory_order_relaxed);
    }
}

bool SerialDispatcher::is_draining() const noexcept {
    const SpinlockGuard guard(lock_);
    return draining_;
}

std::shared_ptr<const ObserverEntry>
ObserverRegistry::add(const TaskEvent event, const TaskRef &owner, ObserverCallback callback) {
    auto entry = std::make_shared<ObserverEntry>();
    entry->event = event;
    entry->callback = std::move(callback);
    entry->owner = owner;

    const auto idx = static_cast<std::size_t>(event);
    if (notified_.at(idx).load(std::memory_order_acquire)) {
        PF_LOGC_DEBUG(
                TaskLog::Observer,
                "Observer for {} added to task {} after the event fired, it will not run",
                ::wise_enum::to_string(event),
                owner.task_id());
    }

    const SpinlockGuard guard(lock_);
    entries_.at(idx).push_back(entry);
    return entry;
}

std::size_t ObserverRegistry::notify(const TaskEvent event, const TaskErrors &errors) {
    const auto idx = static_cast<std::size_t>(event);

    std::vector<std::shared_ptr<ObserverEntry>> snapshot;
    {
        const SpinlockGuard guard(lock_);
        notified_.at(idx).store(true, std::memory_order_release);
        snapshot = entries_.at(idx);
    }

    std::size_t invoked = 0;
    for (const auto &entry : snapshot) {
        const auto task = entry->owner.lock();
        if (!task) {
            PF_LOGC_TRACE_L1(
                    TaskLog::Observer,
                    "Skipping {} observer, task {} no longer exists",
                    ::wise_enum::to_string(event),
                    entry->owner.task_id());
            continue;
        }
        if (entry->invocations.fetch_add(1, std::memory_order_acq_rel) != 0) {
            PF_LOGC_WARN(
                    TaskLog::Observer,
                    "{} observer of task '{}' already ran, skipping",
                    ::wise_enum::to_string(event),
                    task->get_task_name());
            continue;
        }
        try {
            entry->callback(task, errors);
        } catch (const std::exception &e) {
            PF_LOGC_ERROR(
                    TaskLog::Observer,
                    "{} observer of task '{}' threw: {}",
                    ::wise_enum::to_string(event),
                    task->get_task_name(),
                    e.what());
        } catch (...) {
            PF_LOGC_ERROR(
                    TaskLog::Observer,
                    "{} observer of task '{}' threw an unknown exception",
                    ::wise_enum::to_string(event),
                    task->get_task_name());
        }
        ++invoked;
    }
    return invoked;
}

std::size_t ObserverRegistry::count(const TaskEvent event) const {
    const SpinlockGuard guard(lock_);
    return entries_.at(static_cast<std::size_t>(event)).size();
}

bool ObserverRegistry::was_notified(const TaskEvent event) const noexcept {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
    return notified_[static_cast<std::size_t>(event)].load(std::memory_order_acquire);
}

} // namespace procflow::task
