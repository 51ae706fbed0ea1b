/*
 * TrackShield - Tracker Blocking Engine
 * Copyright (C) 2026 TrackShield Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>
#include "../../../src/Utils/Logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace TrackShield::Utils;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = fs::temp_directory_path() /
            ("trackshield_log_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    void TearDown() override {
        // Back to the settings TestMain installs
        LoggerConfig cfg{};
        cfg.toConsole = true;
        cfg.toFile = false;
        cfg.async = false;
        cfg.minimalLevel = LogLevel::Warn;
        cfg.flushLevel = LogLevel::Error;
        Logger::Instance().Initialize(cfg);

        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path testDir;
};

// ============================================================================
// Level names
// ============================================================================

TEST_F(LoggerTest, ParseLogLevel_Names) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_TRUE(ParseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("Warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("fatal", level));
    EXPECT_EQ(level, LogLevel::Fatal);

    level = LogLevel::Error;
    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_FALSE(ParseLogLevel("", level));
    EXPECT_EQ(level, LogLevel::Error);
}

TEST_F(LoggerTest, GetLogLevelName) {
    EXPECT_STREQ(GetLogLevelName(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(GetLogLevelName(LogLevel::Info), "INFO");
    EXPECT_STREQ(GetLogLevelName(LogLevel::Warn), "WARN");
    EXPECT_STREQ(GetLogLevelName(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Filtering
// ============================================================================

TEST_F(LoggerTest, IsEnabled_FollowsMinimalLevel) {
    auto& logger = Logger::Instance();
    ASSERT_TRUE(logger.IsInitialized());

    logger.setMinimalLevel(LogLevel::Error);
    EXPECT_FALSE(logger.IsEnabled(LogLevel::Warn));
    EXPECT_TRUE(logger.IsEnabled(LogLevel::Error));
    EXPECT_TRUE(logger.IsEnabled(LogLevel::Fatal));

    logger.setMinimalLevel(LogLevel::Trace);
    EXPECT_TRUE(logger.IsEnabled(LogLevel::Trace));
}

// ============================================================================
// File sink
// ============================================================================

TEST_F(LoggerTest, FileSink_JsonLines) {
    LoggerConfig cfg{};
    cfg.toConsole = false;
    cfg.toFile = true;
    cfg.async = false;
    cfg.jsonLines = true;
    cfg.logDirectory = testDir.string();
    cfg.baseFileName = "logger_test";
    cfg.minimalLevel = LogLevel::Info;
    Logger::Instance().Initialize(cfg);

    TS_LOG_DEBUG("LoggerTest", "filtered out");
    TS_LOG_ERROR("LoggerTest", "blocked \"%s\" (%d)", "tracker.com", 3);
    Logger::Instance().Flush();

    std::ifstream in(testDir / "logger_test.log");
    ASSERT_TRUE(in.is_open());

    std::string line;
    size_t lines = 0;
    std::string last;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        ++lines;
        last = line;
    }
    ASSERT_EQ(lines, 1u);

    const auto j = nlohmann::json::parse(last);
    EXPECT_EQ(j["lvl"], "ERROR");
    EXPECT_EQ(j["cat"], "LoggerTest");
    EXPECT_EQ(j["msg"], "blocked \"tracker.com\" (3)");
    EXPECT_TRUE(j.contains("ts"));
    EXPECT_TRUE(j.contains("line"));
}
