// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * DLock a distributed lock manager for shared file-backed stores.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/cfg/env.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "common/Settings.hpp"

namespace {

// Retry loops log every attempt; keep the console to warnings and
// send the full trace to the file.
std::shared_ptr<spdlog::logger> makeTestLogger(const std::string& logFile) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::warn);
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 1024 * 1024 * 2, 2);
    fileSink->set_level(spdlog::level::trace);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    auto logger = std::make_shared<spdlog::async_logger>(
        "dlockTest", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::err);
    return logger;
}

} // namespace

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    const dlock::Settings settings {};
    spdlog::init_thread_pool(8192, 1);
    const auto logger = makeTestLogger(settings.get("DLOCK_TEST_LOG", "logs/dlock-tests.txt"));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::cfg::load_env_levels();
    const int result = RUN_ALL_TESTS();
    spdlog::shutdown();
    return result;
}
