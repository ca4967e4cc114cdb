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
 * @file pf_log_tests.cpp
 * @brief Unit tests for the procflow logger and component levels
 */

#include <atomic>        // for atomic
#include <filesystem>    // for exists, path, temp_directory_path
#include <fstream>       // for ifstream
#include <iterator>      // for istreambuf_iterator
#include <stdexcept>     // for invalid_argument
#include <string>        // for string, to_string
#include <system_error>  // for error_code
#include <unordered_map> // for unordered_map
#include <utility>       // for move

#include <gtest/gtest.h>

#include "log/components.hpp"
#include "log/pf_log.hpp"
#include "log/pf_log_macros.hpp"

namespace {

namespace pl = ::procflow::log;

DECLARE_LOG_COMPONENT(TestComponent, Alpha, Beta, Gamma);

/**
 * RAII temporary log path removed on destruction
 *
 * The file sink appends a start timestamp to the file name, so cleanup uses
 * the path reported by the logger.
 */
class TempLogFile final {
public:
    explicit TempLogFile(const std::string &stem) {
        static std::atomic<int> counter{0};
        path_ = (std::filesystem::temp_directory_path() /
                 (stem + "_" + std::to_string(counter.fetch_add(1)) + ".log"))
                        .string();
    }

    ~TempLogFile() {
        std::error_code ec;
        if (!actual_.empty()) {
            std::filesystem::remove(actual_, ec);
        }
        std::filesystem::remove(path_, ec);
    }

    TempLogFile(const TempLogFile &) = delete;
    TempLogFile &operator=(const TempLogFile &) = delete;
    TempLogFile(TempLogFile &&) = delete;
    TempLogFile &operator=(TempLogFile &&) = delete;

    [[nodiscard]] const std::string &path() const { return path_; }
    void set_actual(std::string actual) { actual_ = std::move(actual); }

private:
    std::string path_;
    std::string actual_;
};

std::string read_file(const std::string &path) {
    std::ifstream in(path);
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

class PfLogTest : public ::testing::Test {
protected:
    void TearDown() override {
        pl::Logger::configure(pl::LoggerConfig::console(pl::LogLevel::Info));
        pl::register_component<TestComponent>(pl::LogLevel::Info);
    }
};

TEST_F(PfLogTest, DefaultConsoleLogging) {
    PF_LOG_DEBUG("Debug message: {}", 42);
    PF_LOG_INFO("Info message: {}", "test");
    PF_LOG_WARN("Warning message");
    PF_LOG_ERROR("Error message");
    pl::Logger::flush();
    EXPECT_EQ(pl::Logger::get_sink_type(), pl::SinkType::Console);
    EXPECT_TRUE(pl::Logger::get_actual_log_file().empty());
}

TEST_F(PfLogTest, FileSinkWritesMessages) {
    TempLogFile temp{"pf_log_file"};
    pl::Logger::configure(pl::LoggerConfig::file(temp.path(), pl::LogLevel::Debug));
    const std::string actual = pl::Logger::get_actual_log_file();
    temp.set_actual(actual);

    PF_LOG_DEBUG("Debug file message: {}", 123);
    PF_LOG_INFO("Info file message: {}", "testing");
    PF_LOG_ERROR("Error file message");
    pl::Logger::flush();

    ASSERT_TRUE(std::filesystem::exists(actual));
    const std::string contents = read_file(actual);
    EXPECT_NE(contents.find("Debug file message: 123"), std::string::npos);
    EXPECT_NE(contents.find("Info file message: testing"), std::string::npos);
    EXPECT_NE(contents.find("Error file message"), std::string::npos);
}

TEST_F(PfLogTest, FileSinkWithoutPathThrows) {
    EXPECT_THROW(pl::Logger::configure(pl::LoggerConfig::file("")), std::invalid_argument);
}

TEST_F(PfLogTest, GlobalLevelFiltersMessages) {
    TempLogFile temp{"pf_log_level"};
    pl::Logger::configure(pl::LoggerConfig::file(temp.path(), pl::LogLevel::Warn));
    temp.set_actual(pl::Logger::get_actual_log_file());
    EXPECT_EQ(pl::Logger::get_current_level(), pl::LogLevel::Warn);

    PF_LOG_INFO("filtered info message");
    PF_LOG_WARN("kept warning message");
    pl::Logger::flush();

    const std::string contents = read_file(pl::Logger::get_actual_log_file());
    EXPECT_EQ(contents.find("filtered info message"), std::string::npos);
    EXPECT_NE(contents.find("kept warning message"), std::string::npos);

    pl::Logger::set_level(pl::LogLevel::Debug);
    EXPECT_EQ(pl::Logger::get_current_level(), pl::LogLevel::Debug);
}

TEST_F(PfLogTest, ComponentLevelsAreIndependent) {
    pl::register_component<TestComponent>(pl::LogLevel::Info);
    pl::register_component<TestComponent>(
            std::unordered_map<TestComponent, pl::LogLevel>{
                    {TestComponent::Alpha, pl::LogLevel::Debug},
                    {TestComponent::Gamma, pl::LogLevel::Error}});

    EXPECT_EQ(pl::get_component_level(TestComponent::Alpha), pl::LogLevel::Debug);
    EXPECT_EQ(pl::get_component_level(TestComponent::Beta), pl::LogLevel::Info);
    EXPECT_EQ(pl::get_component_level(TestComponent::Gamma), pl::LogLevel::Error);

    using Storage = pl::ComponentLevelStorage<TestComponent>;
    EXPECT_TRUE(Storage::should_log(TestComponent::Alpha, pl::LogLevel::Debug));
    EXPECT_FALSE(Storage::should_log(TestComponent::Gamma, pl::LogLevel::Warn));
    EXPECT_TRUE(Storage::should_log(TestComponent::Gamma, pl::LogLevel::Critical));
}

TEST_F(PfLogTest, ComponentMessagesCarryComponentName) {
    TempLogFile temp{"pf_log_component"};
    pl::Logger::configure(pl::LoggerConfig::file(temp.path(), pl::LogLevel::Debug));
    temp.set_actual(pl::Logger::get_actual_log_file());
    pl::register_component<TestComponent>(
            std::unordered_map<TestComponent, pl::LogLevel>{
                    {TestComponent::Alpha, pl::LogLevel::Debug},
                    {TestComponent::Beta, pl::LogLevel::Error}});

    PF_LOGC_DEBUG(TestComponent::Alpha, "alpha says {}", 7);
    PF_LOGC_INFO(TestComponent::Beta, "beta is filtered");
    pl::Logger::flush();

    const std::string contents = read_file(pl::Logger::get_actual_log_file());
    EXPECT_NE(contents.find("[Alpha] alpha says 7"), std::string::npos);
    EXPECT_EQ(contents.find("beta is filtered"), std::string::npos);
}

TEST(PfLogComponents, FormatComponentName) {
    EXPECT_EQ(pl::format_component_name(TestComponent::Beta), "Beta");
    EXPECT_EQ(pl::get_logger_default_level(), pl::LogLevel::Info);
}

} // namespace
