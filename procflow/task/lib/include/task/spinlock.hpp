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
 * User-space spinlock guarding short, non-blocking critical sections
 *
 * Used for per-task error lists, observer lists and queue registries. Critical
 * sections never run user code, so contention is brief; after a bounded number
 * of pause rounds the waiter yields its time slice so that an oversubscribed
 * stress run cannot livelock against a preempted holder.
 */

#ifndef PROCFLOW_TASK_SPINLOCK_HPP
#define PROCFLOW_TASK_SPINLOCK_HPP

#include <atomic>
#include <thread>

#include "task/time.hpp"

namespace procflow::task {

/**
 * Test-and-test-and-set spinlock with pause backoff and yield fallback
 *
 * Waiters spin on a relaxed load and only retry the exchange once the lock
 * looks free. Acquire on success and release on unlock order the guarded
 * data on weakly ordered CPUs as well as on x86.
 */
class Spinlock final {
private:
    std::atomic<bool> locked_{false}; //!< Lock state (false = unlocked, true = locked)

public:
    /**
     * Acquire lock (blocking)
     *
     * A single exchange covers the uncontended case. Otherwise the caller
     * spins in lock_slow_path() until the lock is taken.
     */
    void lock() noexcept {
        bool expected = false;
        if (locked_.compare_exchange_weak(
                    expected, true, std::memory_order_acquire, std::memory_order_relaxed)) {
            return;
        }
        lock_slow_path();
    }

    /**
     * Try to acquire lock (non-blocking)
     * @return true if lock acquired, false if already locked
     */
    [[nodiscard]] bool try_lock() noexcept {
        bool expected = false;
        return locked_.compare_exchange_strong(
                expected, true, std::memory_order_acquire, std::memory_order_relaxed);
    }

    /**
     * Release lock
     * @note Must only be called by the current holder
     */
    void unlock() noexcept { locked_.store(false, std::memory_order_release); }

    /**
     * Check if lock is currently held
     * @return true if lock is held, false if available
     * @note Hint only, the state may change immediately after the check
     */
    [[nodiscard]] bool is_locked() const noexcept {
        return locked_.load(std::memory_order_relaxed);
    }

private:
    /**
     * Contended acquisition
     *
     * Pause count doubles per round up to MAX_PAUSE_CYCLES. After
     * SPIN_ROUNDS_BEFORE_YIELD rounds the waiter yields on every check, so a
     * preempted holder gets CPU time back.
     */
    void lock_slow_path() noexcept {
        static constexpr int MAX_PAUSE_CYCLES = 64;
        static constexpr int SPIN_ROUNDS_BEFORE_YIELD = 16;
        int pause_cycles = 1;
        int rounds = 0;

        while (true) {
            while (locked_.load(std::memory_order_relaxed)) {
                if (rounds >= SPIN_ROUNDS_BEFORE_YIELD) {
                    std::this_thread::yield();
                    continue;
                }
                for (int i = 0; i < pause_cycles; ++i) {
                    Time::cpu_pause();
                }
                if (pause_cycles < MAX_PAUSE_CYCLES) {
                    pause_cycles *= 2;
                }
                ++rounds;
            }

            bool expected = false;
            if (locked_.compare_exchange_weak(
                        expected, true, std::memory_order_acquire, std::memory_order_relaxed)) {
                return;
            }
            pause_cycles = 1; // Lost the race to another waiter
        }
    }
};

/**
 * RAII lock guard for Spinlock
 * Acquires on construction and releases on destruction, exceptions included
 */
class SpinlockGuard final {
private:
    Spinlock &spinlock_; //!< Reference to the spinlock

public:
    /**
     * Acquire the lock
     * @param[in] lock Spinlock to hold for the guard's lifetime
     */
    explicit SpinlockGuard(Spinlock &lock) : spinlock_(lock) { spinlock_.lock(); }
    ~SpinlockGuard() { spinlock_.unlock(); }

    SpinlockGuard(const SpinlockGuard &) = delete;
    SpinlockGuard &operator=(const SpinlockGuard &) = delete;
    SpinlockGuard(SpinlockGuard &&) = delete;
    SpinlockGuard &operator=(SpinlockGuard &&) = delete;
};

/**
 * RAII try-lock guard for Spinlock
 * Attempts to acquire lock on construction, provides success status
 */
class SpinlockTryGuard final {
private:
    Spinlock &spinlock_; //!< Reference to the spinlock
    bool acquired_{};    //!< Whether lock was successfully acquired

public:
    explicit SpinlockTryGuard(Spinlock &lock) : spinlock_(lock), acquired_(spinlock_.try_lock()) {}

    ~SpinlockTryGuard() {
        if (acquired_) {
            spinlock_.unlock();
        }
    }

    /**
     * Check whether the guard holds the lock
     * @return true if try_lock() succeeded on construction
     */
    [[nodiscard]] bool owns_lock() const noexcept { return acquired_; }
    [[nodiscard]] explicit operator bool() const noexcept { return acquired_; }

    SpinlockTryGuard(const SpinlockTryGuard &) = delete;
    SpinlockTryGuard &operator=(const SpinlockTryGuard &) = delete;
    SpinlockTryGuard(SpinlockTryGuard &&) = delete;
    SpinlockTryGuard &operator=(SpinlockTryGuard &&) = delete;
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_SPINLOCK_HPP
