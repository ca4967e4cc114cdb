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
 * @file stress_sample.cpp
 * @brief Command line driver running task lifecycle stress scenarios
 */

#include <atomic>    // for atomic
#include <chrono>    // for chrono::seconds, chrono::microseconds
#include <cstddef>   // for size_t
#include <cstdlib>   // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception> // for exception
#include <format>    // for format
#include <iostream>  // for cerr
#include <memory>    // for shared_ptr, make_shared
#include <string>    // for string, to_string
#include <thread>    // for thread, this_thread::sleep_for
#include <vector>    // for vector

#include <tl/expected.hpp> // for expected, unexpected
#include <wise_enum.h>     // for from_string

#include <CLI/CLI.hpp> // for App, Range, IsMember, ParseError

#include "internal_use_only/config.hpp"       // for project_name, project_version
#include "log/components.hpp"                 // for register_component
#include "log/pf_log.hpp"                     // for Logger, LoggerConfig, LogLevel
#include "log/pf_log_macros.hpp"              // for PF_LOG_INFO, PF_LOG_ERROR
#include "task/conditions.hpp"                // for FalseCondition, TrueCondition
#include "task/event_concurrency_tracker.hpp" // for EventConcurrencyTracker
#include "task/task.hpp"                      // for TaskBuilder, TaskContext
#include "task/task_errors.hpp"               // for TaskError, TaskErrc
#include "task/task_log.hpp"                  // for TaskLog
#include "task/task_queue.hpp"                // for TaskQueue

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

namespace {
namespace pl = ::procflow::log;
namespace pt = ::procflow::task;

using namespace std::chrono_literals;

struct AppConfig {
    std::string scenario{"all"};
    std::size_t batches{2};
    std::size_t iterations{1000};
    std::size_t workers{4};
    std::string log_level{"Info"};
};

/**
 * Counters accumulated by one scenario run
 */
struct ScenarioStats {
    std::atomic<std::size_t> finished{0};
    std::atomic<std::size_t> cancelled{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> duplicate_finishes{0};
    std::atomic<std::size_t> overlapping_events{0};
};

/**
 * Parse command line arguments
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return Parsed configuration on success, empty string if --help or --version shown, error message
 * on failure
 */
tl::expected<AppConfig, std::string> parse_arguments(const int argc, const char **argv) {
    CLI::App app{std::format(
            "Task Stress Runner - {} version {}",
            procflow::cmake::project_name,
            procflow::cmake::project_version)};

    AppConfig config{};
    app.add_option("-s,--scenario", config.scenario, "Scenario to run")
            ->check(CLI::IsMember({"all", "cancel", "finish-race", "conditions", "overlap"}));
    app.add_option("-b,--batches", config.batches, "Number of batches")->check(CLI::Range(1, 1000));
    app.add_option("-i,--iterations", config.iterations, "Tasks per batch")
            ->check(CLI::Range(1, 1000000));
    app.add_option("-w,--workers", config.workers, "Number of worker threads")
            ->check(CLI::Range(1, 128));
    app.add_option("-l,--level", config.log_level, "Log level")
            ->check(CLI::IsMember({"TraceL1", "Debug", "Info", "Warn", "Error"}));

    app.set_version_flag(
            "--version",
            std::string{procflow::cmake::project_version},
            "Show version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        const int exit_code = app.exit(e);
        if (exit_code == 0) {
            return tl::unexpected("");
        }
        return tl::unexpected(std::format("Argument parsing failed: {}", e.what()));
    }

    return config;
}

/**
 * Setup logging
 *
 * @param[in] level_name Log level name accepted by wise_enum
 */
void setup_logging(const std::string &level_name) {
    const auto level = wise_enum::from_string<pl::LogLevel>(level_name).value_or(pl::LogLevel::Info);
    pl::Logger::configure(pl::LoggerConfig::console(level));
    pl::register_component<pt::TaskLog>(level);
}

void count_outcome(ScenarioStats &stats, const pt::TaskErrors &errors) {
    stats.finished.fetch_add(1);
    if (pt::contains_error(errors, pt::TaskErrc::Cancelled) ||
        pt::contains_error(errors, pt::TaskErrc::ConditionFailed)) {
        stats.cancelled.fetch_add(1);
    } else if (!errors.empty()) {
        stats.failed.fetch_add(1);
    }
}

/**
 * Create a task for the given scenario
 *
 * @param[in] scenario Scenario name
 * @param[in] index Task index within the batch
 * @param[in] stats Counters updated by the task's observers
 * @return Task ready for submission
 */
std::shared_ptr<pt::Task>
make_task(const std::string &scenario, const std::size_t index, ScenarioStats &stats) {
    const std::string name = std::format("{}-{}", scenario, index);

    if (scenario == "finish-race") {
        auto finished_once = std::make_shared<std::atomic<bool>>(false);
        auto task = pt::TaskBuilder(name)
                            .async_function([](const pt::TaskContext &ctx) {
                                std::vector<std::thread> finishers;
                                finishers.reserve(3);
                                for (int i = 0; i < 3; ++i) {
                                    finishers.emplace_back([ctx] { ctx.finish(); });
                                }
                                // finish() only queues work while this body drains
                                for (auto &finisher : finishers) {
                                    finisher.join();
                                }
                            })
                            .build_shared();
        task->add_observer(
                pt::TaskEvent::DidFinish,
                [&stats, finished_once](
                        const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                    if (finished_once->exchange(true)) {
                        stats.duplicate_finishes.fetch_add(1);
                    }
                    count_outcome(stats, errors);
                });
        return task;
    }

    if (scenario == "conditions") {
        pt::TaskBuilder builder(name);
        builder.function([] {});
        if (index % 2 == 0) {
            builder.condition(std::make_shared<pt::TrueCondition>());
        } else {
            builder.condition(std::make_shared<pt::FalseCondition>());
        }
        builder.observer(
                pt::TaskEvent::DidFinish,
                [&stats](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                    count_outcome(stats, errors);
                });
        return builder.build_shared();
    }

    if (scenario == "overlap") {
        auto tracker = std::make_shared<pt::EventConcurrencyTracker>(10us);
        auto task = pt::TaskBuilder(name)
                            .async_function(pt::EventConcurrencyTracker::wrap(
                                    tracker, "body", [](const pt::TaskContext &ctx) {
                                        std::this_thread::sleep_for(100us);
                                        ctx.finish();
                                    }))
                            .build_shared();
        pt::EventConcurrencyTracker::attach(tracker, *task);
        task->add_observer(
                pt::TaskEvent::DidFinish,
                [&stats](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                    count_outcome(stats, errors);
                });
        task->add_completion([&stats, tracker] {
            if (tracker->has_overlap()) {
                stats.overlapping_events.fetch_add(1);
            }
        });
        return task;
    }

    // cancel
    return pt::TaskBuilder(name)
            .function([] { std::this_thread::sleep_for(10us); })
            .observer(
                    pt::TaskEvent::DidFinish,
                    [&stats](const std::shared_ptr<pt::Task> &, const pt::TaskErrors &errors) {
                        count_outcome(stats, errors);
                    })
            .build_shared();
}

/**
 * Run one scenario for all batches
 *
 * @param[in] scenario Scenario name
 * @param[in] config Application configuration
 * @return true if no invariant violation was observed
 */
bool run_scenario(const std::string &scenario, const AppConfig &config) {
    ScenarioStats stats{};
    std::size_t submitted = 0;

    for (std::size_t batch = 0; batch < config.batches; ++batch) {
        auto queue = pt::TaskQueue::create()
                             .workers(config.workers)
                             .name(std::format("{}-{}", scenario, batch))
                             .build();

        std::vector<std::shared_ptr<pt::Task>> tasks;
        tasks.reserve(config.iterations);
        for (std::size_t i = 0; i < config.iterations; ++i) {
            auto task = make_task(scenario, i, stats);
            if (const auto ec = queue.submit(task); ec) {
                PF_LOG_ERROR("Failed to submit {}: {}", task->get_task_name(), ec.message());
                continue;
            }
            ++submitted;
            if (scenario == "cancel" || scenario == "overlap") {
                task->cancel(pt::TaskError{pt::TaskErrc::Cancelled, "stress"});
            }
            tasks.push_back(std::move(task));
        }

        for (const auto &task : tasks) {
            if (!task->wait_for(60s)) {
                PF_LOG_ERROR("Task {} did not finish in time", task->get_task_name());
                return false;
            }
        }
        queue.shutdown();
    }

    PF_LOG_INFO(
            "Scenario '{}': submitted={}, finished={}, cancelled={}, failed={}, "
            "duplicate_finishes={}, overlapping_events={}",
            scenario,
            submitted,
            stats.finished.load(),
            stats.cancelled.load(),
            stats.failed.load(),
            stats.duplicate_finishes.load(),
            stats.overlapping_events.load());

    return stats.finished.load() == submitted && stats.duplicate_finishes.load() == 0 &&
           stats.overlapping_events.load() == 0;
}

} // namespace

/**
 * Main application entry point
 *
 * Runs the selected stress scenarios against a task queue and reports
 * whether every task finished exactly once without overlapping events.
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return EXIT_SUCCESS if every scenario passed, EXIT_FAILURE otherwise
 */
int main(int argc, const char **argv) {
    try {
        const auto config = parse_arguments(argc, argv);
        if (!config.has_value()) {
            // Empty error string means --help or --version was shown (success)
            if (!config.error().empty()) {
                std::cerr << config.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        setup_logging(config->log_level);
        PF_LOG_INFO(
                "Task Stress: scenario={}, batches={}, iterations={}, workers={}",
                config->scenario,
                config->batches,
                config->iterations,
                config->workers);

        std::vector<std::string> scenarios{config->scenario};
        if (config->scenario == "all") {
            scenarios = {"cancel", "finish-race", "conditions", "overlap"};
        }

        bool passed = true;
        for (const auto &scenario : scenarios) {
            if (!run_scenario(scenario, *config)) {
                PF_LOG_ERROR("Scenario '{}' failed", scenario);
                passed = false;
            }
        }

        pl::Logger::flush();
        return passed ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unknown exception occurred\n";
        return EXIT_FAILURE;
    }
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
