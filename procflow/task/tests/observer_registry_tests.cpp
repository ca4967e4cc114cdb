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
 * @file observer_registry_tests.cpp
 * @brief Unit tests for SerialDispatcher, ObserverRegistry and
 * EventConcurrencyTracker
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include <gtest/gtest.h>

#include "task/event_concurrency_tracker.hpp"
#include "task/observer_registry.hpp"
#include "task/task.hpp"
#include "task/task_errors.hpp"
#include "task/task_ref.hpp"
#include "task/task_state.hpp"

namespace {
namespace pt = ::procflow::task;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

/**
 * SerialDispatcher
 */
TEST(SerialDispatcher, RunsEventsInOrder) {
    pt::SerialDispatcher dispatcher;
    std::vector<int> order;
    dispatcher.dispatch([&order] { order.push_back(1); });
    dispatcher.dispatch([&order] { order.push_back(2); });

    ASSERT_EQ(order.size(), 2);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(dispatcher.events_run(), 2);
    EXPECT_FALSE(dispatcher.is_draining());
}

TEST(SerialDispatcher, ReentrantDispatchIsQueuedNotNested) {
    pt::SerialDispatcher dispatcher;
    std::vector<std::string> order;

    dispatcher.dispatch([&dispatcher, &order] {
        order.emplace_back("outer-begin");
        EXPECT_TRUE(dispatcher.is_draining());
        dispatcher.dispatch([&order] { order.emplace_back("inner"); });
        order.emplace_back("outer-end");
    });

    ASSERT_EQ(order.size(), 3);
    EXPECT_EQ(order[0], "outer-begin");
    EXPECT_EQ(order[1], "outer-end");
    EXPECT_EQ(order[2], "inner");
}

TEST(SerialDispatcher, EnqueueWaitsForDrain) {
    pt::SerialDispatcher dispatcher;
    std::atomic<int> runs{0};
    dispatcher.enqueue([&runs] { runs.fetch_add(1); });
    EXPECT_EQ(runs.load(), 0);
    dispatcher.drain();
    EXPECT_EQ(runs.load(), 1);
}

TEST(SerialDispatcher, ThrowingEventDoesNotStopDrain) {
    pt::SerialDispatcher dispatcher;
    std::atomic<int> runs{0};
    dispatcher.enqueue([] { throw std::runtime_error("event failure"); });
    dispatcher.enqueue([&runs] { runs.fetch_add(1); });
    dispatcher.drain();

    EXPECT_EQ(runs.load(), 1);
    EXPECT_FALSE(dispatcher.is_draining());
}

TEST(SerialDispatcher, NonStandardExceptionDoesNotStopDrain) {
    pt::SerialDispatcher dispatcher;
    std::atomic<int> runs{0};
    dispatcher.enqueue([] { throw 3; });
    dispatcher.enqueue([&runs] { runs.fetch_add(1); });
    dispatcher.drain();

    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(dispatcher.events_run(), 2);
    EXPECT_FALSE(dispatcher.is_draining());

    dispatcher.dispatch([&runs] { runs.fetch_add(1); });
    EXPECT_EQ(runs.load(), 2);
}

TEST(SerialDispatcher, ConcurrentDispatchNeverOverlaps) {
    static constexpr int NUM_THREADS = 8;
    static constexpr int EVENTS_PER_THREAD = 500;

    pt::SerialDispatcher dispatcher;
    std::atomic<int> active{0};
    std::atomic<int> overlaps{0};
    std::atomic<int> total{0};

    std::vector<std::thread> threads;
    threads.reserve(NUM_THREADS);
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
                dispatcher.dispatch([&] {
                    if (active.fetch_add(1) != 0) {
                        overlaps.fetch_add(1);
                    }
                    total.fetch_add(1);
                    active.fetch_sub(1);
                });
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    // A dispatch that found a drain in progress leaves its event to the drainer
    dispatcher.drain();

    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_EQ(total.load(), NUM_THREADS * EVENTS_PER_THREAD);
}

/**
 * ObserverRegistry
 */
TEST(ObserverRegistry, NotifiesInRegistrationOrder) {
    auto task = pt::TaskBuilder("registry-order").build_shared();
    pt::ObserverRegistry registry;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        static_cast<void>(registry.add(
                pt::TaskEvent::WillExecute,
                pt::TaskRef{task},
                [&order, i](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &) {
                    order.push_back(i);
                }));
    }

    EXPECT_EQ(registry.count(pt::TaskEvent::WillExecute), 5);
    EXPECT_FALSE(registry.was_notified(pt::TaskEvent::WillExecute));
    EXPECT_EQ(registry.notify(pt::TaskEvent::WillExecute, {}), 5);
    EXPECT_TRUE(registry.was_notified(pt::TaskEvent::WillExecute));
    EXPECT_FALSE(registry.was_notified(pt::TaskEvent::DidExecute));

    ASSERT_EQ(order.size(), 5);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }
}

TEST(ObserverRegistry, EachEntryRunsOnce) {
    auto task = pt::TaskBuilder("registry-once").build_shared();
    pt::ObserverRegistry registry;
    std::atomic<int> calls{0};
    const auto entry = registry.add(
            pt::TaskEvent::DidFinish,
            pt::TaskRef{task},
            [&calls](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &) {
                calls.fetch_add(1);
            });

    EXPECT_EQ(registry.notify(pt::TaskEvent::DidFinish, {}), 1);
    EXPECT_EQ(registry.notify(pt::TaskEvent::DidFinish, {}), 0);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(entry->invocations.load(), 2);
}

TEST(ObserverRegistry, PassesErrorSnapshot) {
    auto task = pt::TaskBuilder("registry-errors").build_shared();
    pt::ObserverRegistry registry;
    pt::TaskErrors seen;
    static_cast<void>(registry.add(
            pt::TaskEvent::DidCancel,
            pt::TaskRef{task},
            [&seen](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                seen = errors;
            }));

    const pt::TaskErrors errors{pt::TaskError{pt::TaskErrc::Cancelled, "why"}};
    static_cast<void>(registry.notify(pt::TaskEvent::DidCancel, errors));
    ASSERT_EQ(seen.size(), 1);
    EXPECT_EQ(seen.front(), errors.front());
}

TEST(ObserverRegistry, SkipsObserverOfDestroyedTask) {
    pt::ObserverRegistry registry;
    std::atomic<int> calls{0};
    {
        auto task = pt::TaskBuilder("registry-gone").build_shared();
        static_cast<void>(registry.add(
                pt::TaskEvent::DidFinish,
                pt::TaskRef{task},
                [&calls](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &) {
                    calls.fetch_add(1);
                }));
    }

    EXPECT_EQ(registry.notify(pt::TaskEvent::DidFinish, {}), 0);
    EXPECT_EQ(calls.load(), 0);
}

/**
 * EventConcurrencyTracker
 */
TEST(EventConcurrencyTracker, DetectsOverlap) {
    pt::EventConcurrencyTracker tracker;
    auto first = tracker.begin("first");
    auto second = tracker.begin("second");
    tracker.end(std::move(first));
    tracker.end(std::move(second));

    EXPECT_TRUE(tracker.has_overlap());
    EXPECT_EQ(tracker.overlap_count(), 1);
    EXPECT_EQ(tracker.callback_count(), 2);

    // Each overlapping callback keeps its own record
    const auto records = tracker.records();
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].label, "first");
    EXPECT_EQ(records[0].concurrent, 0U);
    EXPECT_EQ(records[1].label, "second");
    EXPECT_EQ(records[1].concurrent, 1U);
}

TEST(EventConcurrencyTracker, SequentialCallbacksDoNotOverlap) {
    pt::EventConcurrencyTracker tracker;
    tracker.end(tracker.begin("first"));
    tracker.end(tracker.begin("second"));

    EXPECT_FALSE(tracker.has_overlap());
    const auto records = tracker.records();
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].label, "first");
    EXPECT_EQ(records[1].label, "second");
    EXPECT_LE(records[0].start_time, records[0].end_time);
    EXPECT_LE(records[0].end_time, records[1].start_time);
}

TEST(EventConcurrencyTracker, RecordsTaskLifecycle) {
    auto tracker = std::make_shared<pt::EventConcurrencyTracker>();
    auto task = pt::TaskBuilder("tracked").build_shared();
    pt::EventConcurrencyTracker::attach(tracker, *task);

    for (const auto &[event, name] : ::wise_enum::range<pt::TaskEvent>) {
        EXPECT_EQ(task->observer_count(event), 1) << name;
    }

    task->cancel(pt::TaskError{pt::TaskErrc::Cancelled, "tracked"});
    task->finish();

    EXPECT_FALSE(tracker->has_overlap());
    const auto records = tracker->records();
    ASSERT_EQ(records.size(), 3);
    EXPECT_EQ(records[0].label, "DidCancel");
    EXPECT_EQ(records[1].label, "WillFinish");
    EXPECT_EQ(records[2].label, "DidFinish");
}

TEST(EventConcurrencyTracker, WrappedBodyIsTracked) {
    auto tracker = std::make_shared<pt::EventConcurrencyTracker>(100us);
    std::atomic<int> calls{0};
    const pt::TaskBody body = pt::EventConcurrencyTracker::wrap(
            tracker, "body", [&calls](const pt::TaskContext &) { calls.fetch_add(1); });

    auto task = pt::TaskBuilder("wrapped").build_shared();
    body(pt::TaskContext{task});

    EXPECT_EQ(calls.load(), 1);
    ASSERT_EQ(tracker->callback_count(), 1);
    EXPECT_EQ(tracker->records().front().label, "body");
}

TEST(EventConcurrencyTracker, ThrowingBodyStillEndsCallback) {
    auto tracker = std::make_shared<pt::EventConcurrencyTracker>();
    const pt::TaskBody body = pt::EventConcurrencyTracker::wrap(
            tracker, "body", [](const pt::TaskContext &) { throw std::runtime_error("body failure"); });

    auto task = pt::TaskBuilder("wrapped-throwing").build_shared();
    EXPECT_THROW(body(pt::TaskContext{task}), std::runtime_error);
    EXPECT_EQ(tracker->callback_count(), 1);

    tracker->end(tracker->begin("after"));
    EXPECT_FALSE(tracker->has_overlap());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
