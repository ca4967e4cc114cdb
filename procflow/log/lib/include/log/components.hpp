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

#ifndef PROCFLOW_LOG_COMPONENTS_HPP
#define PROCFLOW_LOG_COMPONENTS_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <string_view>
#include <unordered_map>

#include <wise_enum.h>

namespace procflow::log {

/**
 * Log severity levels, most verbose first
 *
 * Shared by the global logger and the per-component filters.
 */
enum class LogLevel {
    TraceL3, //!< Most verbose trace level
    TraceL2, //!< Medium trace level
    TraceL1, //!< Least verbose trace level
    Debug,   //!< Debug messages
    Info,    //!< Informational messages
    Notice,  //!< Notice messages
    Warn,    //!< Warning messages
    Error,   //!< Error messages
    Critical //!< Critical error messages
};

} // namespace procflow::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        procflow::log::LogLevel,
        TraceL3,
        TraceL2,
        TraceL1,
        Debug,
        Info,
        Notice,
        Warn,
        Error,
        Critical)

namespace procflow::log {

/**
 * Level given to components that were never registered
 *
 * @return Default component log level (Info)
 */
[[nodiscard]] LogLevel get_logger_default_level() noexcept;

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Declare a log component enum with specified values
 *
 * Creates a wise_enum-based enumeration usable with the PF_LOGC_* macros.
 * Values must be contiguous starting from 0, which WISE_ENUM_CLASS guarantees
 * when no explicit values are given.
 *
 * @param ComponentType Name of the component enum type
 * @param ... List of component values
 */
#define DECLARE_LOG_COMPONENT(ComponentType, ...) WISE_ENUM_CLASS(ComponentType, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

/**
 * Per-component level table
 *
 * One atomic level slot per enum value, indexed directly by the enum's
 * underlying value. Levels are lazily seeded with the default level on first
 * use. Reads happen on every component log statement so the table is a plain
 * array of relaxed atomics.
 *
 * @tparam ComponentType The component enum type
 */
template <typename ComponentType> class ComponentLevelStorage final {
private:
    static constexpr std::size_t NUM_COMPONENTS = ::wise_enum::size<ComponentType>;

    /// Lazily initialized level table
    static std::array<std::atomic<LogLevel>, NUM_COMPONENTS> &levels() {
        static std::array<std::atomic<LogLevel>, NUM_COMPONENTS> table{};
        static const bool seeded = [] {
            for (auto &slot : table) {
                slot.store(get_logger_default_level(), std::memory_order_relaxed);
            }
            return true;
        }();
        static_cast<void>(seeded);
        return table;
    }

public:
    /**
     * Get the current log level for a component
     *
     * @param[in] component Component to query
     * @return Current log level, or the default level for out-of-range values
     */
    [[nodiscard]] static LogLevel get_level(const ComponentType component) {
        const auto idx = static_cast<std::size_t>(component);
        if (idx >= NUM_COMPONENTS) {
            return get_logger_default_level();
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return levels()[idx].load(std::memory_order_relaxed);
    }

    /**
     * Set log level for a specific component
     *
     * @param[in] component Component to configure
     * @param[in] level New log level for the component
     */
    static void set_level(const ComponentType component, const LogLevel level) {
        const auto idx = static_cast<std::size_t>(component);
        if (idx < NUM_COMPONENTS) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            levels()[idx].store(level, std::memory_order_relaxed);
        }
    }

    /// Apply the same level to every component
    static void set_all_levels(const LogLevel level) {
        for (auto &slot : levels()) {
            slot.store(level, std::memory_order_relaxed);
        }
    }

    /**
     * Check if a message should be logged for a component
     *
     * @param[in] component Component being logged to
     * @param[in] message_level Log level of the message
     * @return true if message should be logged
     */
    [[nodiscard]] static bool should_log(const ComponentType component, const LogLevel message_level) {
        return message_level >= get_level(component);
    }
};

/**
 * Get string representation of component name
 *
 * @tparam ComponentType Component enum type
 * @param[in] component Component enum value
 * @return Component name, or "UNKNOWN" for values outside the enum
 */
template <typename ComponentType>
[[nodiscard]] constexpr std::string_view format_component_name(const ComponentType component) {
    const auto name = ::wise_enum::to_string(component);
    if (name.size() == 0) {
        return std::string_view{"UNKNOWN"};
    }
    return std::string_view{name.data(), name.size()};
}

/**
 * Register components with individual log levels
 *
 * @tparam ComponentType Component enum type
 * @param[in] component_levels Map of components to their log levels
 */
template <typename ComponentType>
void register_component(const std::unordered_map<ComponentType, LogLevel> &component_levels) {
    for (const auto &[component, level] : component_levels) {
        ComponentLevelStorage<ComponentType>::set_level(component, level);
    }
}

/**
 * Register all components with the same log level
 *
 * @tparam ComponentType Component enum type
 * @param[in] level Log level to assign to all components
 */
template <typename ComponentType> void register_component(const LogLevel level) {
    ComponentLevelStorage<ComponentType>::set_all_levels(level);
}

/**
 * Get the current log level for a specific component
 *
 * @tparam ComponentType Component enum type
 * @param[in] component Component to query
 * @return Current log level for the component
 */
template <typename ComponentType>
[[nodiscard]] LogLevel get_component_level(const ComponentType component) {
    return ComponentLevelStorage<ComponentType>::get_level(component);
}

} // namespace procflow::log

#endif // PROCFLOW_LOG_COMPONENTS_HPP
