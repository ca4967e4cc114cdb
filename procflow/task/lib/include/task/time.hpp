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

#ifndef PROCFLOW_TASK_TIME_HPP
#define PROCFLOW_TASK_TIME_HPP

#include <chrono>
#include <cstdint>
#include <thread>

#if defined(__x86_64__) || defined(__i386__)
#include <emmintrin.h>
#include <immintrin.h>
#endif

namespace procflow::task {

/// Time type for nanosecond precision timing
using Nanos = std::chrono::nanoseconds;

/**
 * Monotonic timing helpers shared by the queue, spinlocks and trackers
 *
 * All measurements use std::chrono::steady_clock so that wall-clock
 * adjustments never shorten or stretch a wait. Values are only meaningful
 * relative to each other within one process.
 */
class Time final {
public:
    /// Monotonic clock time point
    using TimePoint = std::chrono::steady_clock::time_point;

    /**
     * Get current monotonic time in nanoseconds
     *
     * @return Nanoseconds since an unspecified steady-clock epoch
     */
    [[nodiscard]] static Nanos now_ns();

    /**
     * Get current monotonic time point
     *
     * @return Current steady_clock time point
     */
    [[nodiscard]] static TimePoint now();

    /**
     * Sleep the calling thread for the given duration
     *
     * Zero or negative durations yield instead of sleeping.
     *
     * @param[in] duration Time to sleep
     */
    static void sleep_for(Nanos duration);

    /**
     * Architecture-specific CPU pause/yield instruction
     *
     * Issues PAUSE on x86 and YIELD on ARM. Other targets fall back to
     * std::this_thread::yield(). Meant for the body of a spin-wait loop.
     */
    static void cpu_pause() noexcept {
#if defined(__x86_64__) || defined(__i386__)
        _mm_pause(); // x86 PAUSE instruction
#elif defined(__aarch64__) || defined(__arm__)
        // NOLINTNEXTLINE(hicpp-no-assembler)
        asm volatile("yield" ::: "memory");
#else
        std::this_thread::yield();
#endif
    }
};

} // namespace procflow::task

#endif // PROCFLOW_TASK_TIME_HPP
