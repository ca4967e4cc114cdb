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

#include <algorithm>  // for find
#include <array>      // for array
#include <atomic>     // for atomic
#include <chrono>     // for microseconds, nanoseconds
#include <cstddef>    // for size_t, ptrdiff_t
#include <format>     // for format
#include <iterator>   // for next, distance
#include <memory>     // for shared_ptr, unique_ptr
#include <mutex>      // for mutex, lock_guard
#include <stdexcept>  // for invalid_argument
#include <string>     // for string, to_string
#include <utility>    // for move
#include <vector>     // for vector

#include <quill/Backend.h>                      // for Backend
#include <quill/LogMacros.h>                    // for QUILL_LOG_INFO
#include <quill/backend/BackendOptions.h>       // for BackendOptions
#include <quill/core/Common.h>                  // for Timezone, ClockSourceType
#include <quill/core/LogLevel.h>                // for LogLevel
#include <quill/core/PatternFormatterOptions.h> // for PatternFormatterOptions
#include <quill/sinks/ConsoleSink.h>            // for ConsoleSink
#include <quill/sinks/FileSink.h>               // for FileSink
#include <quill/sinks/Sink.h>                   // for Sink
#include <quill/sinks/StreamSink.h>             // for FileEventNotifier

#include <wise_enum.h> // for to_string

#include "log/components.hpp" // for LogLevel
#include "log/pf_log.hpp"     // for LoggerConfig, Logger

namespace procflow::log {

namespace {

// Indexed by procflow::log::LogLevel
constexpr std::array<quill::LogLevel, ::wise_enum::size<LogLevel>> LEVEL_TABLE{
        quill::LogLevel::TraceL3,
        quill::LogLevel::TraceL2,
        quill::LogLevel::TraceL1,
        quill::LogLevel::Debug,
        quill::LogLevel::Info,
        quill::LogLevel::Notice,
        quill::LogLevel::Warning,
        quill::LogLevel::Error,
        quill::LogLevel::Critical};

} // namespace

LoggerConfig LoggerConfig::console(LogLevel level, bool colors) {
    LoggerConfig config{};
    config.sink_type = SinkType::Console;
    config.min_level = level;
    config.enable_colors = colors;
    return config;
}

LoggerConfig LoggerConfig::file(std::string path, LogLevel level) {
    LoggerConfig config{};
    config.sink_type = SinkType::File;
    config.min_level = level;
    config.enable_colors = false;
    config.log_file = std::move(path);
    return config;
}

LoggerConfig &LoggerConfig::with_file_line(bool enable) {
    enable_file_line = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_timestamps(bool enable) {
    enable_timestamps = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_thread_name(bool enable) {
    enable_thread_name = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_colors(bool enable) {
    enable_colors = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_backend_sleep_duration(std::chrono::nanoseconds duration) {
    backend_sleep_duration = duration;
    return *this;
}

Logger::Logger(const LoggerConfig &config) : sink_type_{config.sink_type} {
    // Only one backend per process; a reconfigure restarts it
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }

    quill::BackendOptions backend_options;
    backend_options.thread_name = "PfLogBackend";
    backend_options.enable_yield_when_idle = true;
    backend_options.sleep_duration = config.backend_sleep_duration;
    backend_options.log_timestamp_ordering_grace_period = std::chrono::microseconds{0};

    quill::Backend::start(backend_options);

    auto sink = create_sink(config);
    const std::string pattern = build_pattern(config);

    const quill::PatternFormatterOptions formatter_opts{
            pattern, "%H:%M:%S.%Qns", quill::Timezone::LocalTime};

    static std::atomic<int> logger_counter{0};
    const std::string logger_name = "pf_logger_" + std::to_string(logger_counter.fetch_add(1));

    quill_logger_ = ProcflowFrontend::create_or_get_logger(
            logger_name, std::move(sink), formatter_opts, quill::ClockSourceType::Tsc);
    quill_logger_->set_log_level(to_quill_level(config.min_level));

    QUILL_LOG_DEBUG(
            quill_logger_,
            "procflow logger configured - Sink: {}, Level: {}, Pattern: '{}', File: '{}'",
            ::wise_enum::to_string(config.sink_type),
            ::wise_enum::to_string(config.min_level),
            pattern,
            actual_log_file_.empty() ? "none" : actual_log_file_);
}

Logger::~Logger() noexcept {
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }
}

std::unique_ptr<Logger> &Logger::get_instance() {
    static std::unique_ptr<Logger> instance =
            std::unique_ptr<Logger>(new Logger(LoggerConfig::console()));
    return instance;
}

void Logger::configure(const LoggerConfig &config) {
    static std::mutex configure_mutex;
    const std::lock_guard<std::mutex> lock(configure_mutex);
    auto &instance = get_instance();
    if (instance != nullptr && instance->quill_logger_ != nullptr) {
        instance->quill_logger_->flush_log();
    }
    instance.reset();
    instance = std::unique_ptr<Logger>(new Logger(config));
}

void Logger::set_level(LogLevel level) {
    auto *logger = get_instance()->quill_logger_;
    if (logger != nullptr) {
        logger->set_log_level(to_quill_level(level));
    }
}

void Logger::flush() {
    auto *logger = get_instance()->quill_logger_;
    if (logger != nullptr) {
        logger->flush_log();
    }
}

SinkType Logger::get_sink_type() { return get_instance()->sink_type_; }

LogLevel Logger::get_current_level() {
    const auto *logger = get_instance()->quill_logger_;
    if (logger != nullptr) {
        return from_quill_level(logger->get_log_level());
    }
    return LogLevel::Info;
}

std::string Logger::get_actual_log_file() { return get_instance()->actual_log_file_; }

std::string Logger::build_pattern(const LoggerConfig &config) {
    std::vector<std::string> components;
    if (config.enable_timestamps) {
        components.emplace_back("%(time)");
    }
    components.emplace_back("[%(log_level)]");
    if (config.enable_thread_name) {
        components.emplace_back("[%(thread_name)]");
    }
    if (config.enable_file_line) {
        components.emplace_back("[%(short_source_location)]");
    }
    components.emplace_back("%(message)");

    std::string pattern = components.front();
    for (auto it = std::next(components.begin()); it != components.end(); ++it) {
        pattern += std::format(" {}", *it);
    }
    return pattern;
}

std::shared_ptr<quill::Sink> Logger::create_sink(const LoggerConfig &config) {
    switch (config.sink_type) {
    case SinkType::Console: {
        quill::ConsoleSinkConfig console_config;
        console_config.set_colour_mode(
                config.enable_colors ? quill::ConsoleSinkConfig::ColourMode::Always
                                     : quill::ConsoleSinkConfig::ColourMode::Never);
        actual_log_file_.clear();
        return std::make_shared<quill::ConsoleSink>(console_config);
    }

    case SinkType::File: {
        if (config.log_file.empty()) {
            throw std::invalid_argument("File sink requires a log file path");
        }
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        auto file_sink = std::make_shared<quill::FileSink>(
                config.log_file, cfg, quill::FileEventNotifier{});
        actual_log_file_ = file_sink->get_filename().string();
        return file_sink;
    }

    default:
        throw std::invalid_argument("Unknown sink type");
    }
}

quill::LogLevel Logger::to_quill_level(const LogLevel level) {
    const auto idx = static_cast<std::size_t>(level);
    if (idx >= LEVEL_TABLE.size()) {
        return quill::LogLevel::Info;
    }
    return *std::next(LEVEL_TABLE.begin(), static_cast<std::ptrdiff_t>(idx));
}

LogLevel Logger::from_quill_level(const quill::LogLevel level) {
    const auto it = std::find(LEVEL_TABLE.begin(), LEVEL_TABLE.end(), level);
    if (it == LEVEL_TABLE.end()) {
        return LogLevel::Info;
    }
    return static_cast<LogLevel>(std::distance(LEVEL_TABLE.begin(), it));
}

LogLevel get_logger_default_level() noexcept { return LogLevel::Info; }

namespace detail {
ProcflowLogger *get_quill_logger() { return Logger::get_instance()->quill_logger_; }
} // namespace detail

} // namespace procflow::log
