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

#ifndef PROCFLOW_LOG_PF_LOG_MACROS_HPP
#define PROCFLOW_LOG_PF_LOG_MACROS_HPP

#include "log/components.hpp"
#include "log/pf_log.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Get the process logger for direct Quill macro use
 */
#define PF_GET_LOGGER() ::procflow::log::detail::get_quill_logger()

/**
 * Helper macro for component logging
 *
 * Checks the component level before formatting so that filtered messages
 * cost one relaxed atomic load.
 *
 * @param level_enum procflow log level enum
 * @param quill_level Corresponding Quill macro suffix
 * @param component Component enum value
 * @param message Format string
 */
#define PF_LOGC_HELPER(level_enum, quill_level, component, message, ...)                           \
    do {                                                                                           \
        if (::procflow::log::ComponentLevelStorage<decltype(component)>::should_log(               \
                    component, ::procflow::log::LogLevel::level_enum)) {                           \
            QUILL_LOG_##quill_level(                                                               \
                    PF_GET_LOGGER(),                                                               \
                    "[{}] " message,                                                               \
                    ::procflow::log::format_component_name(component),                             \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

#define PF_LOG_TRACE_L1(fmt, ...) QUILL_LOG_TRACE_L1(PF_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PF_LOGC_TRACE_L1(c, m, ...) PF_LOGC_HELPER(TraceL1, TRACE_L1, c, m, ##__VA_ARGS__)

#define PF_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(PF_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PF_LOGC_DEBUG(c, m, ...) PF_LOGC_HELPER(Debug, DEBUG, c, m, ##__VA_ARGS__)

#define PF_LOG_INFO(fmt, ...) QUILL_LOG_INFO(PF_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PF_LOGC_INFO(c, m, ...) PF_LOGC_HELPER(Info, INFO, c, m, ##__VA_ARGS__)

#define PF_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(PF_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PF_LOGC_WARN(c, m, ...) PF_LOGC_HELPER(Warn, WARNING, c, m, ##__VA_ARGS__)

#define PF_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(PF_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define PF_LOGC_ERROR(c, m, ...) PF_LOGC_HELPER(Error, ERROR, c, m, ##__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

#endif // PROCFLOW_LOG_PF_LOG_MACROS_HPP
