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
 * @file stress_tests.cpp
 * @brief Concurrency stress tests for finish, cancel and precondition races
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "stress_harness.hpp"
#include "task/conditions.hpp"
#include "task/event_concurrency_tracker.hpp"
#include "task/task.hpp"
#include "task/task_errors.hpp"
#include "task/task_queue.hpp"
#include "task/task_state.hpp"

namespace {
namespace pt = ::procflow::task;
namespace ptt = ::procflow::task::testing;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

constexpr auto TASK_TIMEOUT = 30s;

std::string iteration_name(const ptt::StressBatch &batch, const std::size_t iteration) {
    return "Batch " + std::to_string(batch.number()) + ", Iteration " + std::to_string(iteration);
}

/// Leaves the batch group once the task finished
void leave_on_did_finish(pt::Task &task, ptt::StressBatch &batch) {
    task.add_observer(
            pt::TaskEvent::DidFinish,
            [&batch](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &) {
                batch.group().leave();
            });
}

void submit_or_fail(ptt::StressBatch &batch, const std::shared_ptr<pt::Task> &task) {
    const std::error_code ec = batch.queue().submit(task);
    EXPECT_FALSE(ec) << ec.message();
    if (ec) {
        batch.group().leave();
    }
}

TEST(TaskStress, CompletionBlocks) {
    ptt::stress(ptt::StressLevel::minimal(), [](ptt::StressBatch &batch, const std::size_t iteration) {
        batch.group().enter();
        auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                            .function([] {})
                            .completion([&batch] { batch.group().leave(); })
                            .build_shared();
        submit_or_fail(batch, task);
    });
}

TEST(TaskStress, CancelOrFinishWithErrors) {
    // A task may finish before the cancel lands
    ptt::stress(ptt::StressLevel::minimal(), [](ptt::StressBatch &batch, const std::size_t iteration) {
        batch.group().enter();
        auto task = pt::TaskBuilder(iteration_name(batch, iteration)).function([] {}).build_shared();
        leave_on_did_finish(*task, batch);
        submit_or_fail(batch, task);
        task->cancel(pt::TaskError{pt::TaskErrc::Cancelled, "stress"});
    });
}

TEST(TaskStress, CancelWithErrorsPriorToSubmission) {
    ptt::stress(
            ptt::StressLevel::minimal(),
            [](ptt::StressBatch &batch, const std::size_t iteration) {
                batch.group().enter();
                auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                                    .function([&batch] { batch.increment_counter("bodyRan"); })
                                    .build_shared();
                task->add_observer(
                        pt::TaskEvent::DidFinish,
                        [&batch](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                            if (!pt::contains_error(errors, pt::TaskErrc::Cancelled)) {
                                batch.increment_counter("cancelErrorsDropped");
                            }
                            batch.group().leave();
                        });
                task->cancel(pt::TaskError{pt::TaskErrc::Cancelled, "before submit"});
                submit_or_fail(batch, task);
            },
            [](const ptt::StressBatch &batch) {
                EXPECT_EQ(batch.counter("cancelErrorsDropped"), 0);
                EXPECT_EQ(batch.counter("bodyRan"), 0);
            });
}

TEST(TaskStress, CancelWithErrorsFromWillExecuteObserver) {
    ptt::stress(
            ptt::StressLevel::minimal(),
            [](ptt::StressBatch &batch, const std::size_t iteration) {
                batch.group().enter();
                auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                                    .function([&batch] { batch.increment_counter("bodyRan"); })
                                    .build_shared();
                task->add_observer(
                        pt::TaskEvent::DidFinish,
                        [&batch](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                            if (errors.empty()) {
                                batch.increment_counter("cancelErrorsDropped");
                            }
                            batch.group().leave();
                        });
                task->add_observer(
                        pt::TaskEvent::WillExecute,
                        [](const std::shared_ptr<pt::Task> &task_ptr, const pt::TaskErrors &) {
                            task_ptr->cancel(
                                    pt::TaskError{pt::TaskErrc::Cancelled, "from will-execute"});
                        });
                submit_or_fail(batch, task);
            },
            [](const ptt::StressBatch &batch) {
                EXPECT_EQ(batch.counter("cancelErrorsDropped"), 0);
                EXPECT_EQ(batch.counter("bodyRan"), 0);
            });
}

TEST(TaskStress, ManyConditions) {
    static constexpr std::size_t NUM_CONDITIONS = 10'000;
    auto queue = pt::TaskQueue::create().workers(4).build();

    std::atomic<bool> ran{false};
    auto task = pt::TaskBuilder("many-conditions").function([&ran] { ran.store(true); }).build_shared();
    ptt::StressLevel::custom(1, NUM_CONDITIONS).for_each([&task](std::size_t, std::size_t) {
        task->add_condition(std::make_shared<pt::TrueCondition>());
    });
    EXPECT_EQ(task->condition_count(), NUM_CONDITIONS);

    ASSERT_FALSE(queue.submit(task));
    ASSERT_TRUE(task->wait_for(TASK_TIMEOUT));
    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(task->errors().empty());
}

TEST(TaskStress, ManyConditionsEachWithSingleDependency) {
    static constexpr std::size_t NUM_CONDITIONS = 10'000;
    auto queue = pt::TaskQueue::create().workers(4).build();

    std::atomic<std::size_t> evaluations{0};
    std::atomic<std::size_t> produced_runs{0};
    auto task = pt::TaskBuilder("many-produced").function([] {}).build_shared();
    ptt::StressLevel::custom(1, NUM_CONDITIONS).for_each([&](std::size_t, const std::size_t i) {
        auto produced = pt::TaskBuilder("produced-" + std::to_string(i))
                                .function([&produced_runs] { produced_runs.fetch_add(1); })
                                .build_shared();
        auto condition = std::make_shared<pt::BlockCondition>([&evaluations] {
            evaluations.fetch_add(1);
            return true;
        });
        condition->add_produced_dependency(produced);
        task->add_condition(condition);
    });

    ASSERT_FALSE(queue.submit(task));
    ASSERT_TRUE(task->wait_for(TASK_TIMEOUT));
    EXPECT_TRUE(task->errors().empty());
    EXPECT_EQ(evaluations.load(), NUM_CONDITIONS);
    EXPECT_EQ(produced_runs.load(), NUM_CONDITIONS);
    EXPECT_TRUE(queue.wait_until_idle(TASK_TIMEOUT));
}

TEST(TaskStress, FalseConditionWithCancelAndRelease) {
    // The task is released by the test right after cancel; condition
    // callbacks may then find it gone
    ptt::stress(ptt::StressLevel::minimal(), [](ptt::StressBatch &batch, std::size_t /*iteration*/) {
        batch.group().enter();
        auto task = pt::TaskBuilder("false-condition")
                            .condition(std::make_shared<pt::FalseCondition>())
                            .condition(std::make_shared<pt::NoFailedDependenciesCondition>())
                            .build_shared();
        task->add_observer(
                pt::TaskEvent::DidFinish,
                [&batch](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &) {
                    batch.increment_counter("didFinish");
                    batch.group().leave();
                });
        submit_or_fail(batch, task);
        task->cancel();
    }, [](const ptt::StressBatch &batch) {
        EXPECT_EQ(batch.counter("didFinish"), ptt::StressLevel::minimal().iterations);
    });
}

/**
 * Body that finishes from three threads at once
 */
TEST(TaskStress, ConcurrentCallsToFinishOnlyFirstSucceeds) {
    ptt::stress(
            ptt::StressLevel::minimal(),
            [](ptt::StressBatch &batch, const std::size_t iteration) {
                batch.group().enter();
                auto did_finish = std::make_shared<std::atomic<bool>>(false);
                auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                                    .async_function([&batch](const pt::TaskContext &ctx) {
                                        for (int i = 0; i < 3; ++i) {
                                            batch.spawn([ctx, i] {
                                                ctx.finish({pt::TaskError{
                                                        pt::TaskErrc::ExecutionFailed,
                                                        std::to_string(i)}});
                                            });
                                        }
                                    })
                                    .build_shared();
                task->add_observer(
                        pt::TaskEvent::DidFinish,
                        [&batch, did_finish](
                                const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                            if (did_finish->exchange(true)) {
                                batch.increment_counter("finishedMoreThanOnce");
                                return;
                            }
                            if (errors.size() != 1) {
                                batch.increment_counter("unexpectedErrorCount");
                            }
                            batch.group().leave();
                        });
                submit_or_fail(batch, task);
            },
            [](const ptt::StressBatch &batch) {
                EXPECT_EQ(batch.counter("finishedMoreThanOnce"), 0);
                EXPECT_EQ(batch.counter("unexpectedErrorCount"), 0);
            });
}

TEST(TaskStress, CancelledTaskHasNoConcurrentEvents) {
    ptt::stress(
            ptt::StressLevel::custom(2, 100),
            [](ptt::StressBatch &batch, const std::size_t iteration) {
                batch.group().enter();
                auto tracker = std::make_shared<pt::EventConcurrencyTracker>(20us);
                auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                                    .async_function(pt::EventConcurrencyTracker::wrap(
                                            tracker, "body", [](const pt::TaskContext &ctx) {
                                                std::this_thread::sleep_for(1ms);
                                                ctx.finish();
                                            }))
                                    .build_shared();
                pt::EventConcurrencyTracker::attach(tracker, *task);
                task->add_completion([&batch, tracker] {
                    if (tracker->has_overlap()) {
                        batch.increment_counter("overlappingEvents");
                    }
                    batch.group().leave();
                });
                submit_or_fail(batch, task);
                task->cancel();
            },
            [](const ptt::StressBatch &batch) {
                EXPECT_EQ(batch.counter("overlappingEvents"), 0);
            });
}

TEST(TaskStress, FinishFromOtherThreadWhileBodyIsRunning) {
    ptt::stress(
            ptt::StressLevel::custom(2, 100),
            [](ptt::StressBatch &batch, const std::size_t iteration) {
                batch.group().enter();
                auto tracker = std::make_shared<pt::EventConcurrencyTracker>(20us);
                auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                                    .async_function(pt::EventConcurrencyTracker::wrap(
                                            tracker, "body", [](const pt::TaskContext &ctx) {
                                                // Blocks the body until finish() returned elsewhere
                                                std::thread finisher([ctx] { ctx.finish(); });
                                                finisher.join();
                                            }))
                                    .build_shared();
                pt::EventConcurrencyTracker::attach(tracker, *task);
                task->add_completion([&batch, tracker] {
                    if (tracker->has_overlap()) {
                        batch.increment_counter("overlappingEvents");
                    }
                    batch.group().leave();
                });
                submit_or_fail(batch, task);
                task->cancel();
            },
            [](const ptt::StressBatch &batch) {
                EXPECT_EQ(batch.counter("overlappingEvents"), 0);
            });
}

TEST(TaskStress, CancelRacingFinishIsLostUpdateOrApplied) {
    ptt::stress(
            ptt::StressLevel::minimal(),
            [](ptt::StressBatch &batch, const std::size_t iteration) {
                batch.group().enter();
                auto did_cancel = std::make_shared<std::atomic<int>>(0);
                auto task = pt::TaskBuilder(iteration_name(batch, iteration))
                                    .async_function([&batch](const pt::TaskContext &ctx) {
                                        batch.spawn([ctx] { ctx.finish(); });
                                    })
                                    .build_shared();
                task->add_observer(
                        pt::TaskEvent::DidCancel,
                        [did_cancel](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &) {
                            did_cancel->fetch_add(1);
                        });
                task->add_observer(
                        pt::TaskEvent::DidFinish,
                        [&batch, did_cancel](
                                const std::shared_ptr<pt::Task> &task_ptr,
                                const pt::TaskErrors &errors) {
                            // Either the cancel landed before the finish claim or it was lost
                            const bool cancelled = task_ptr->is_cancelled();
                            const bool has_error = pt::contains_error(errors, pt::TaskErrc::Cancelled);
                            if (cancelled != has_error || (cancelled && did_cancel->load() != 1)) {
                                batch.increment_counter("inconsistentCancel");
                            }
                            batch.group().leave();
                        });
                submit_or_fail(batch, task);
                batch.spawn([task] {
                    task->cancel(pt::TaskError{pt::TaskErrc::Cancelled, "racing"});
                });
            },
            [](const ptt::StressBatch &batch) {
                EXPECT_EQ(batch.counter("inconsistentCancel"), 0);
            });
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
