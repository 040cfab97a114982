/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include "../../src/util/log.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>
#include <thread>
#include <unistd.h>

namespace arbor {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;
    std::string test_log_file;

    void SetUp() override {
        // Save original log level
        original_log_level = logLevel;

        test_log_dir = "/tmp/arbor_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
        test_log_file = test_log_dir + "/test.log";
    }

    void TearDown() override {
        // Restore original log level and stderr output
        logLevel = original_log_level;
        Logger::setLogFile(nullptr);

        std::filesystem::remove_all(test_log_dir);
    }

    bool containsLogMessage(const std::string& log_content, const std::string& level, const std::string& message) {
        // Look for pattern: [LEVEL] ... message
        std::string pattern = "\\[" + level + "\\].*" + message;
        std::regex re(pattern);
        return std::regex_search(log_content, re);
    }

    std::string captureLogOutput(std::function<void()> func) {
        FILE* f = fopen(test_log_file.c_str(), "w");
        if (!f) return "";
        Logger::setLogFile(f);

        func();

        Logger::setLogFile(nullptr);
        fclose(f);

        std::ifstream file(test_log_file);
        std::string content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
        std::filesystem::remove(test_log_file);
        return content;
    }
};

TEST_F(LoggingTest, LogLevelFiltering) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        trace() << "trace message";
        debug() << "debug message";
        info() << "info message";
        warning() << "warning message";
        error() << "error message";
        severe() << "severe message";
    });

    EXPECT_FALSE(containsLogMessage(output, "TRACE", "trace message"));
    EXPECT_FALSE(containsLogMessage(output, "DEBUG", "debug message"));
    EXPECT_TRUE(containsLogMessage(output, "INFO", "info message"));
    EXPECT_TRUE(containsLogMessage(output, "WARNING", "warning message"));
    EXPECT_TRUE(containsLogMessage(output, "ERROR", "error message"));
    EXPECT_TRUE(containsLogMessage(output, "SEVERE", "severe message"));
}

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("TRACE"));
    EXPECT_EQ(logLevel, LOG_TRACE);

    EXPECT_TRUE(setLogLevelFromString("DEBUG"));
    EXPECT_EQ(logLevel, LOG_DEBUG);

    EXPECT_TRUE(setLogLevelFromString("INFO"));
    EXPECT_EQ(logLevel, LOG_INFO);

    EXPECT_TRUE(setLogLevelFromString("WARN")); // Alias
    EXPECT_EQ(logLevel, LOG_WARNING);

    EXPECT_TRUE(setLogLevelFromString("ERROR"));
    EXPECT_EQ(logLevel, LOG_ERROR);

    EXPECT_TRUE(setLogLevelFromString("FATAL")); // Alias
    EXPECT_EQ(logLevel, LOG_SEVERE);

    // Case insensitive
    EXPECT_TRUE(setLogLevelFromString("DeBuG"));
    EXPECT_EQ(logLevel, LOG_DEBUG);

    // Invalid level leaves the current one alone
    EXPECT_FALSE(setLogLevelFromString("INVALID"));
    EXPECT_EQ(logLevel, LOG_DEBUG);
}

TEST_F(LoggingTest, ParseLogLevel) {
    boost::optional<LogLevel> level = parseLogLevel("warning");
    ASSERT_TRUE(level);
    EXPECT_EQ(*level, LOG_WARNING);
    EXPECT_FALSE(parseLogLevel("verbose"));
    EXPECT_FALSE(parseLogLevel(""));
}

TEST_F(LoggingTest, LogMessageFormatting) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        info() << "number " << 42 << " and string " << std::string("abc");
        warning() << "double " << 1.5;
        error() << "flag " << true;
    });

    EXPECT_TRUE(containsLogMessage(output, "INFO", "number 42 and string abc"));
    EXPECT_TRUE(containsLogMessage(output, "WARNING", "double 1.5"));
    EXPECT_TRUE(containsLogMessage(output, "ERROR", "flag 1"));
}

TEST_F(LoggingTest, ThreadNamePrefix) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        info() << "default name";
        std::thread t([]() {
            Logger::get().setThreadName("worker");
            info() << "renamed";
        });
        t.join();
    });

    EXPECT_NE(output.find("[ARBOR] [INFO] default name"), std::string::npos);
    EXPECT_NE(output.find("[worker] [INFO] renamed"), std::string::npos);
}

TEST_F(LoggingTest, IndentLevel) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        LogIndentLevel indent;
        info() << "nested";
    });

    EXPECT_NE(output.find("[INFO] \tnested"), std::string::npos);
}

TEST_F(LoggingTest, ProductionLevels) {
    logLevel = LOG_WARNING;

    // Verify filtering logic
    EXPECT_TRUE(LOG_INFO < logLevel);      // INFO should be filtered
    EXPECT_FALSE(LOG_WARNING < logLevel);  // WARNING should pass
    EXPECT_FALSE(LOG_ERROR < logLevel);    // ERROR should pass
    EXPECT_FALSE(LOG_SEVERE < logLevel);   // SEVERE should pass
}

TEST_F(LoggingTest, ThreadSafety) {
    logLevel = LOG_INFO;
    const int num_threads = 10;
    const int messages_per_thread = 100;

    auto output = captureLogOutput([&]() {
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([i, messages_per_thread]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    info() << "Thread " << i << " message " << j;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    });

    // Every message lands on its own line
    size_t lines = static_cast<size_t>(std::count(output.begin(), output.end(), '\n'));
    EXPECT_EQ(lines, static_cast<size_t>(num_threads * messages_per_thread));
}

TEST_F(LoggingTest, NoSpamAtHighLevels) {
    logLevel = LOG_SEVERE;

    auto output = captureLogOutput([]() {
        for (int i = 0; i < 100; ++i) {
            trace() << "trace " << i;
            debug() << "debug " << i;
            info() << "info " << i;
            warning() << "warning " << i;
        }
    });

    EXPECT_TRUE(output.empty());
}

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(logLevelToString(LOG_TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LOG_WARNING), "WARNING");
    EXPECT_STREQ(logLevelToString(LOG_SEVERE), "SEVERE");
}

TEST_F(LoggingTest, LinePrefixFormat) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        info() << "prefixed";
    });

    // <ctime without newline> [thread] [LEVEL] message
    EXPECT_EQ(Logger::time_t_to_String(0).size(), 24u);
    EXPECT_TRUE(std::regex_search(output, std::regex("^.{24} \\[ARBOR\\] \\[INFO\\] prefixed\n$")));
}

} // namespace arbor
