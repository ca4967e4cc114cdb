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
 * @file task_state.hpp
 * @brief Task lifecycle states and observable lifecycle events
 */

#ifndef PROCFLOW_TASK_TASK_STATE_HPP
#define PROCFLOW_TASK_TASK_STATE_HPP

#include <cstdint>

#include <wise_enum.h>

namespace procflow::task {

/**
 * Task lifecycle states in transition order
 *
 * A task only ever moves forward through this sequence. Cancellation is a
 * separate flag and does not have a state of its own.
 */
enum class TaskState : std::uint8_t {
    Initialized,          //!< Built, not yet submitted
    Pending,              //!< Submitted, waiting for dependencies
    EvaluatingConditions, //!< Preconditions are being evaluated
    Ready,                //!< Cleared to execute
    Executing,            //!< Body is running or an async body has not finished
    Finishing,            //!< Finish claimed, will-finish observers running
    Finished              //!< Terminal, error list frozen
};

/**
 * Lifecycle events observers can subscribe to
 */
enum class TaskEvent : std::uint8_t {
    DidSubmit,   //!< Queue accepted the task
    WillExecute, //!< Body is about to start
    DidExecute,  //!< Body returned
    DidCancel,   //!< First effective cancel
    WillFinish,  //!< Finish claimed, errors may still be appended
    DidFinish    //!< Task finished, errors frozen
};

} // namespace procflow::task

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        procflow::task::TaskState,
        Initialized,
        Pending,
        EvaluatingConditions,
        Ready,
        Executing,
        Finishing,
        Finished)

WISE_ENUM_ADAPT(
        procflow::task::TaskEvent, DidSubmit, WillExecute, DidExecute, DidCancel, WillFinish, DidFinish)

#endif // PROCFLOW_TASK_TASK_STATE_HPP
