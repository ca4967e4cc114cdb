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

#ifndef PROCFLOW_LOG_PF_LOG_HPP
#define PROCFLOW_LOG_PF_LOG_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// Disable Quill's non-prefixed macros to avoid conflicts
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <wise_enum.h>

#include "log/components.hpp"

namespace procflow::log {

/**
 * Frontend options for the procflow logger
 *
 * Bounded dropping queue so that a burst of trace messages from worker threads
 * never blocks task execution.
 */
struct ProcflowFrontendOptions final {
    static constexpr quill::QueueType queue_type = // NOLINT(readability-identifier-naming)
            quill::QueueType::BoundedDropping;     //!< Drop instead of blocking when full
    static constexpr uint32_t initial_queue_capacity = // NOLINT(readability-identifier-naming)
            4 * 1024 * 1024;                           //!< 4 MB per-thread queue
    static constexpr uint32_t
            blocking_queue_retry_interval_ns = // NOLINT(readability-identifier-naming)
            0;                                 //!< Unused with dropping queues
    static constexpr size_t unbounded_queue_max_capacity = // NOLINT(readability-identifier-naming)
            0;                                             //!< No unbounded queue limit
    static constexpr quill::HugePagesPolicy
            huge_pages_policy =            // NOLINT(readability-identifier-naming)
            quill::HugePagesPolicy::Never; //!< Disable huge pages for compatibility
};

using ProcflowFrontend = quill::FrontendImpl<ProcflowFrontendOptions>;
using ProcflowLogger = quill::LoggerImpl<ProcflowFrontendOptions>;

/**
 * Supported sink types for log output destinations
 */
enum class SinkType {
    Console, //!< Console output
    File     //!< File output
};

} // namespace procflow::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(procflow::log::SinkType, Console, File)

namespace procflow::log {

/**
 * Configuration structure for logger initialization
 *
 * Contains the sink selection, minimum level, pattern toggles and backend
 * thread tuning used by Logger::configure().
 */
struct LoggerConfig final {
    SinkType sink_type{SinkType::Console}; //!< Type of log output sink to use
    std::string log_file;                  //!< Path to log file (file sink only)
    LogLevel min_level{LogLevel::Info};    //!< Minimum log level to process
    bool enable_colors{true};              //!< Enable color output for console sinks
    bool enable_file_line{true};           //!< Include file and line number in log output
    bool enable_timestamps{true};          //!< Include timestamps in log output
    bool enable_thread_name{true};         //!< Include thread name in log output
    static constexpr int DEFAULT_BACKEND_SLEEP_US = 100; //!< Default backend sleep in microseconds
    std::chrono::nanoseconds backend_sleep_duration{
            std::chrono::microseconds{DEFAULT_BACKEND_SLEEP_US}}; //!< Backend thread sleep duration

    /**
     * Create console logger configuration (default)
     *
     * @param[in] level Minimum log level to process
     * @param[in] colors Enable color output
     * @return LoggerConfig configured for console output
     */
    [[nodiscard]] static LoggerConfig console(LogLevel level = LogLevel::Info, bool colors = true);

    /**
     * Create file logger configuration
     *
     * @param[in] path Path to the log file
     * @param[in] level Minimum log level to process
     * @return LoggerConfig configured for file output
     */
    [[nodiscard]] static LoggerConfig file(std::string path, LogLevel level = LogLevel::Info);

    LoggerConfig &with_file_line(bool enable = true);
    LoggerConfig &with_timestamps(bool enable = true);
    LoggerConfig &with_thread_name(bool enable = true);
    LoggerConfig &with_colors(bool enable = true);

    /**
     * Set backend thread sleep duration
     *
     * @param[in] duration Sleep duration for the backend thread when idle
     * @return Reference to this config for method chaining
     */
    LoggerConfig &with_backend_sleep_duration(std::chrono::nanoseconds duration);
};

namespace detail {
/**
 * Get the internal Quill logger instance
 *
 * @return Pointer to the procflow logger instance
 */
ProcflowLogger *get_quill_logger();
} // namespace detail

/**
 * Process-wide logger
 *
 * Singleton wrapping a Quill frontend logger and its backend thread. The
 * default instance logs to the console at Info level; configure() replaces it.
 */
class Logger final {
public:
    /**
     * Replace the process logger with one built from config
     *
     * Not safe to call while other threads are logging; intended for program
     * start-up and test environments.
     *
     * @param[in] config Logger configuration
     * @throws std::invalid_argument if a file sink has no path
     */
    static void configure(const LoggerConfig &config);

    /**
     * Set the global log level
     *
     * @param[in] level New log level to set
     */
    static void set_level(LogLevel level);

    /**
     * Flush all pending log messages, blocking until the backend wrote them
     */
    static void flush();

    [[nodiscard]] static SinkType get_sink_type();
    [[nodiscard]] static LogLevel get_current_level();

    /**
     * Get the actual log file path being used
     *
     * @return Path to the log file, or empty string for the console sink
     */
    [[nodiscard]] static std::string get_actual_log_file();

    ~Logger() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    explicit Logger(const LoggerConfig &config);

    [[nodiscard]] static std::unique_ptr<Logger> &get_instance();

    [[nodiscard]] static quill::LogLevel to_quill_level(LogLevel level);
    [[nodiscard]] static LogLevel from_quill_level(quill::LogLevel level);

    [[nodiscard]] std::shared_ptr<quill::Sink> create_sink(const LoggerConfig &config);

    [[nodiscard]] static std::string build_pattern(const LoggerConfig &config);

    friend ProcflowLogger *detail::get_quill_logger();

    SinkType sink_type_{SinkType::Console}; //!< Currently configured sink type
    std::string actual_log_file_;           //!< File written by the file sink
    ProcflowLogger *quill_logger_{nullptr}; //!< Quill logger owned by the frontend
};

} // namespace procflow::log

#endif // PROCFLOW_LOG_PF_LOG_HPP
