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
 * @file stress_harness.hpp
 * @brief Batch/iteration driver for concurrency stress tests
 *
 * Each batch owns a task queue, a completion group and a set of named
 * counters. The body of a stress run is called once per iteration; the batch
 * waits for its completion group before the next batch starts.
 */

#ifndef PROCFLOW_TASK_TESTS_STRESS_HARNESS_HPP
#define PROCFLOW_TASK_TESTS_STRESS_HARNESS_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include <gtest/gtest.h>

#include "task/spinlock.hpp"
#include "task/task_queue.hpp"

namespace procflow::task::testing {

/**
 * Number of batches and iterations per batch
 */
struct StressLevel final {
    std::size_t batches{1};    //!< Batches run one after another
    std::size_t iterations{1}; //!< Iterations per batch

    /// Quick level used by default in unit test runs
    [[nodiscard]] static constexpr StressLevel minimal() { return StressLevel{2, 200}; }

    [[nodiscard]] static constexpr StressLevel custom(std::size_t batches, std::size_t iterations) {
        return StressLevel{batches, iterations};
    }

    /**
     * Run a callback for every batch and iteration
     * @param[in] fn Callback receiving batch number and iteration
     */
    void for_each(const std::function<void(std::size_t, std::size_t)> &fn) const {
        for (std::size_t batch = 0; batch < batches; ++batch) {
            for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
                fn(batch, iteration);
            }
        }
    }
};

/**
 * Counts outstanding work items and lets a caller wait for all of them
 */
class CompletionGroup final {
public:
    void enter() {
        const std::lock_guard<std::mutex> lock(mutex_);
        ++outstanding_;
    }

    void leave() {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ == 0) {
            ++unbalanced_leaves_;
            return;
        }
        if (--outstanding_ == 0) {
            cv_.notify_all();
        }
    }

    /**
     * Wait until every enter() was matched by a leave()
     * @param[in] timeout Maximum time to wait
     * @return true if the group drained in time
     */
    template <typename Rep, typename Period>
    [[nodiscard]] bool wait_for(const std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
    }

    [[nodiscard]] std::size_t outstanding() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    /// Number of leave() calls without a matching enter()
    [[nodiscard]] std::size_t unbalanced_leaves() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return unbalanced_leaves_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t outstanding_{};
    std::size_t unbalanced_leaves_{};
};

/**
 * State shared by the iterations of one batch
 *
 * Threads started through spawn() belong to the batch and are joined before
 * the batch is checked or destroyed.
 */
class StressBatch final {
public:
    StressBatch(const std::size_t number, const std::size_t workers)
            : number_{number}, queue_{TaskQueue::create()
                                              .workers(workers)
                                              .name("stress-" + std::to_string(number))
                                              .build()} {}

    ~StressBatch() { join_threads(); }

    StressBatch(const StressBatch &) = delete;
    StressBatch &operator=(const StressBatch &) = delete;
    StressBatch(StressBatch &&) = delete;
    StressBatch &operator=(StressBatch &&) = delete;

    [[nodiscard]] std::size_t number() const noexcept { return number_; }
    [[nodiscard]] TaskQueue &queue() noexcept { return queue_; }
    [[nodiscard]] CompletionGroup &group() noexcept { return group_; }

    void increment_counter(const std::string &name) {
        const SpinlockGuard guard(counter_lock_);
        ++counters_[name];
    }

    [[nodiscard]] std::uint64_t counter(const std::string &name) const {
        const SpinlockGuard guard(counter_lock_);
        const auto it = counters_.find(name);
        return it == counters_.end() ? 0 : it->second;
    }

    /**
     * Start a thread owned by this batch
     * @param[in] fn Thread function
     */
    void spawn(std::function<void()> fn) {
        const std::lock_guard<std::mutex> lock(threads_mutex_);
        threads_.emplace_back(std::move(fn));
    }

    /// Join every thread started through spawn(), including ones spawned meanwhile
    void join_threads() {
        for (;;) {
            std::vector<std::thread> pending;
            {
                const std::lock_guard<std::mutex> lock(threads_mutex_);
                pending.swap(threads_);
            }
            if (pending.empty()) {
                return;
            }
            for (auto &thread : pending) {
                thread.join();
            }
        }
    }

private:
    std::size_t number_;
    TaskQueue queue_;
    CompletionGroup group_;
    mutable Spinlock counter_lock_;
    phmap::flat_hash_map<std::string, std::uint64_t> counters_; //!< Guarded by counter_lock_
    std::mutex threads_mutex_;
    std::vector<std::thread> threads_; //!< Guarded by threads_mutex_
};

/// Iteration body of a stress run
using StressBody = std::function<void(StressBatch &, std::size_t)>;

/// Check run after a batch drained
using BatchCheck = std::function<void(const StressBatch &)>;

/**
 * Run a stress scenario
 *
 * @param[in] level Batches and iterations
 * Threads spawned through the batch are joined after the completion group
 * drained, before the batch is checked.
 *
 * @param[in] body Called once per iteration
 * @param[in] ended Optional check run after each batch drained
 * @param[in] workers Worker threads per batch queue
 */
inline void stress(
        const StressLevel level,
        const StressBody &body,
        const BatchCheck &ended = {},
        const std::size_t workers = 4) {
    static constexpr auto BATCH_TIMEOUT = std::chrono::seconds(60);
    for (std::size_t number = 0; number < level.batches; ++number) {
        StressBatch batch{number, workers};
        for (std::size_t iteration = 0; iteration < level.iterations; ++iteration) {
            body(batch, iteration);
        }
        EXPECT_TRUE(batch.group().wait_for(BATCH_TIMEOUT))
                << "batch " << number << " still has " << batch.group().outstanding()
                << " outstanding task(s)";
        batch.join_threads();
        EXPECT_TRUE(batch.queue().wait_until_idle(BATCH_TIMEOUT));
        EXPECT_EQ(batch.group().unbalanced_leaves(), 0U);
        if (ended) {
            ended(batch);
        }
    }
}

} // namespace procflow::task::testing

#endif // PROCFLOW_TASK_TESTS_STRESS_HARNESS_HPP
