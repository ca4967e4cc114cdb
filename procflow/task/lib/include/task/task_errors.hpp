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
 * @file task_errors.hpp
 * @brief Error codes and error values for task lifecycle operations
 *
 * Provides type-safe error codes compatible with std::error_code and the
 * TaskError value carried in a task's accumulated error list.
 */

#ifndef PROCFLOW_TASK_TASK_ERRORS_HPP
#define PROCFLOW_TASK_TASK_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "task/task_export.hpp"

namespace procflow::task {

/**
 * Task error codes compatible with std::error_code
 */
// clang-format off
enum class TaskErrc : std::uint8_t {
    Success,           //!< Operation succeeded
    Cancelled,         //!< Task was cancelled
    ConditionFailed,   //!< A precondition evaluated to failed
    ExecutionFailed,   //!< Task body threw or reported failure
    DependencyFailed,  //!< A dependency finished with errors
    AlreadySubmitted,  //!< Task was already handed to a queue
    QueueStopped,      //!< Queue no longer accepts tasks
    InvalidParameter   //!< Invalid parameter provided
};
// clang-format on

static_assert(
        static_cast<std::uint32_t>(TaskErrc::InvalidParameter) <=
                std::numeric_limits<std::uint8_t>::max(),
        "TaskErrc enumerator values must fit in std::uint8_t");

} // namespace procflow::task

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        procflow::task::TaskErrc,
        Success,
        Cancelled,
        ConditionFailed,
        ExecutionFailed,
        DependencyFailed,
        AlreadySubmitted,
        QueueStopped,
        InvalidParameter)

// Register TaskErrc as an error code enum to enable implicit conversion to
// std::error_code
// NOTE: This MUST come before any functions that use TaskErrc with
// std::error_code
namespace std {
template <> struct is_error_code_enum<procflow::task::TaskErrc> : true_type {};
} // namespace std

namespace procflow::task {

/**
 * Error category for task lifecycle errors
 */
class TaskErrorCategory final : public std::error_category {
private:
    // Compile-time table indexed by the enum's underlying value
    static constexpr std::array<std::string_view, 8> KMESSAGES{
            "Success: Operation completed successfully",
            "Cancelled: Task was cancelled before it could complete",
            "Condition failed: A precondition of the task was not satisfied",
            "Execution failed: Task body reported an error",
            "Dependency failed: A dependency of the task finished with errors",
            "Already submitted: Task has already been submitted to a queue",
            "Queue stopped: Queue is shut down and does not accept tasks",
            "Invalid parameter: Parameter value is invalid or out of range"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<TaskErrc>,
            "KMESSAGES array size must match the number of TaskErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "procflow::task"; }

    /**
     * Get a descriptive message for the given error code
     *
     * @param[in] condition The error code value
     * @return A descriptive error message
     */
    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown task error: {}", condition);
    }

    /**
     * Map task errors to standard error conditions where applicable
     *
     * @param[in] condition The error code value
     * @return The equivalent standard error condition
     */
    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<TaskErrc>(condition)) {
        case TaskErrc::Success:
            return {};
        case TaskErrc::InvalidParameter:
            return std::errc::invalid_argument;
        case TaskErrc::Cancelled:
            return std::errc::operation_canceled;
        case TaskErrc::AlreadySubmitted:
            return std::errc::operation_in_progress;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Get the singleton instance of the task error category
 *
 * @return Reference to the task error category
 */
[[nodiscard]] inline const TaskErrorCategory &task_category() noexcept {
    static const TaskErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from a TaskErrc value
 *
 * @param[in] errc The task error code
 * @return A std::error_code representing the task error
 */
[[nodiscard]] inline std::error_code make_error_code(const TaskErrc errc) noexcept {
    return {static_cast<int>(errc), task_category()};
}

[[nodiscard]] constexpr bool is_success(const TaskErrc errc) noexcept {
    return errc == TaskErrc::Success;
}

[[nodiscard]] inline bool is_task_success(const std::error_code &errc) noexcept { return !errc; }

/**
 * Get the name of a TaskErrc enum value
 *
 * @param[in] errc The error code
 * @return The enum name as a string
 */
[[nodiscard]] inline const char *get_error_name(const TaskErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

/**
 * Get the name of a TaskErrc from a std::error_code
 *
 * @param[in] ec The error code
 * @return The enum name as a string, or "unknown" if not a task error
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() != task_category()) {
        return "unknown";
    }
    return get_error_name(static_cast<TaskErrc>(ec.value()));
}

/**
 * One entry of a task's accumulated error list
 *
 * The code classifies the error; the message carries caller context such as
 * the failing condition name or the text of a caught exception.
 */
struct TASK_EXPORT TaskError final {
    std::error_code code; //!< Classification of the error
    std::string message;  //!< Human readable context, may be empty

    TaskError() = default;

    /**
     * Create an error from a task error code
     *
     * @param[in] errc Task error code
     * @param[in] msg Optional context message
     */
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    TaskError(const TaskErrc errc, std::string msg = {})
            : code{make_error_code(errc)}, message{std::move(msg)} {}

    /**
     * Create an error from any error code
     *
     * @param[in] ec Error code
     * @param[in] msg Optional context message
     */
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    TaskError(const std::error_code ec, std::string msg = {}) : code{ec}, message{std::move(msg)} {}

    [[nodiscard]] bool operator==(const TaskError &other) const noexcept {
        return code == other.code && message == other.message;
    }

    /**
     * Format the error for logs
     *
     * @return "<name>: <message>" or the category message when empty
     */
    [[nodiscard]] std::string to_string() const {
        if (message.empty()) {
            return std::format("{}: {}", get_error_name(code), code.message());
        }
        return std::format("{}: {}", get_error_name(code), message);
    }
};

/// Ordered list of errors accumulated by a task
using TaskErrors = std::vector<TaskError>;

/**
 * Check whether an error list contains a given code
 *
 * @param[in] errors Error list to search
 * @param[in] errc Task error code to look for
 * @return true if any entry carries errc
 */
[[nodiscard]] inline bool contains_error(const TaskErrors &errors, const TaskErrc errc) {
    const std::error_code wanted = make_error_code(errc);
    for (const auto &error : errors) {
        if (error.code == wanted) {
            return true;
        }
    }
    return false;
}

} // namespace procflow::task

#endif // PROCFLOW_TASK_TASK_ERRORS_HPP
