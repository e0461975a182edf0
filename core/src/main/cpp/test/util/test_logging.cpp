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
#include "../../src/util/logmanager.h"
#include "../../src/funcs/sensitive.h"
#include "../../src/marks/marks.h"
#include <algorithm>
#include <fstream>
#include <filesystem>
#include <functional>
#include <thread>
#include <regex>
#include <unistd.h>  // for dup, dup2
#include <cstdio>    // for fileno

namespace cval {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;

    void SetUp() override {
        original_log_level = logLevel.load();

        test_log_dir = "/tmp/cval_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        logLevel = original_log_level;
        Logger::setLogFile(nullptr);

        std::filesystem::remove_all(test_log_dir);

        unsetenv("LOG_LEVEL");
    }

    bool containsLogMessage(const std::string& log_content, const std::string& level, const std::string& message) {
        // Look for pattern: [LEVEL] ... message
        std::string pattern = "\\[" + level + "\\].*" + message;
        std::regex re(pattern);
        return std::regex_search(log_content, re);
    }

    std::string captureLogOutput(std::function<void()> func) {
        // Logger writes to stderr when no log file is installed
        std::string tmp_file = test_log_dir + "/capture.log";

        fflush(stderr);
        int saved_stderr = dup(STDERR_FILENO);

        FILE* temp = fopen(tmp_file.c_str(), "w");
        if (!temp) return "";
        dup2(fileno(temp), STDERR_FILENO);

        func();

        fflush(stderr);
        fclose(temp);

        dup2(saved_stderr, STDERR_FILENO);
        close(saved_stderr);

        std::ifstream file(tmp_file);
        std::string content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());

        std::filesystem::remove(tmp_file);
        return content;
    }

    std::string readFile(const std::string& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
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

    EXPECT_EQ(output.find("trace message"), std::string::npos);
    EXPECT_EQ(output.find("debug message"), std::string::npos);
    EXPECT_TRUE(containsLogMessage(output, "INFO", "info message"));
    EXPECT_TRUE(containsLogMessage(output, "WARNING", "warning message"));
    EXPECT_TRUE(containsLogMessage(output, "ERROR", "error message"));
    EXPECT_TRUE(containsLogMessage(output, "SEVERE", "severe message"));
}

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("TRACE"));
    EXPECT_EQ(logLevel.load(), LOG_TRACE);

    EXPECT_TRUE(setLogLevelFromString("DEBUG"));
    EXPECT_EQ(logLevel.load(), LOG_DEBUG);

    EXPECT_TRUE(setLogLevelFromString("INFO"));
    EXPECT_EQ(logLevel.load(), LOG_INFO);

    EXPECT_TRUE(setLogLevelFromString("WARN")); // Alias
    EXPECT_EQ(logLevel.load(), LOG_WARNING);

    EXPECT_TRUE(setLogLevelFromString("FATAL")); // Alias
    EXPECT_EQ(logLevel.load(), LOG_SEVERE);

    EXPECT_TRUE(setLogLevelFromString("DeBuG"));
    EXPECT_EQ(logLevel.load(), LOG_DEBUG);

    EXPECT_FALSE(setLogLevelFromString("INVALID"));
    EXPECT_EQ(logLevel.load(), LOG_DEBUG);
}

TEST_F(LoggingTest, SetLogLevelFromEnvironment) {
    setenv("LOG_LEVEL", "DEBUG", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel.load(), LOG_DEBUG);

    setenv("LOG_LEVEL", "ERROR", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel.load(), LOG_ERROR);

    // Invalid level should not change current level
    int current_level = logLevel.load();
    setenv("LOG_LEVEL", "INVALID_LEVEL", 1);
    auto output = captureLogOutput([&]() {
        initLoggingFromEnv();
    });
    EXPECT_EQ(logLevel.load(), current_level);
    EXPECT_NE(output.find("Invalid LOG_LEVEL"), std::string::npos);
}

TEST_F(LoggingTest, ThreadNameInPrefix) {
    logLevel = LOG_INFO;
    auto output = captureLogOutput([]() {
        info() << "named";
    });
    EXPECT_NE(output.find("[CVAL_NATIVE]"), std::string::npos);
}

TEST_F(LoggingTest, ThreadSafety) {
    logLevel = LOG_INFO;
    const int num_threads = 8;
    const int messages_per_thread = 50;

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

    // One whole line per message
    size_t lines = std::count(output.begin(), output.end(), '\n');
    EXPECT_EQ(lines, static_cast<size_t>(num_threads * messages_per_thread));
}

TEST_F(LoggingTest, SensitivityOperationsLogAtDebug) {
    logLevel = LOG_DEBUG;
    auto output = captureLogOutput([]() {
        funcs::makeSensitive(StringVal("x").mark(Mark("custom")));
    });
    EXPECT_TRUE(containsLogMessage(output, "DEBUG", "keeping non-standard marks"));

    logLevel = LOG_INFO;
    output = captureLogOutput([]() {
        funcs::makeSensitive(StringVal("x").mark(Mark("custom")));
    });
    EXPECT_TRUE(output.empty());
}

TEST_F(LoggingTest, FunctionCallsLogAtTrace) {
    logLevel = LOG_TRACE;
    auto output = captureLogOutput([]() {
        funcs::sensitivityFunctions().call("issensitive", {NumberIntVal(1)});
    });
    EXPECT_TRUE(containsLogMessage(output, "TRACE", "calling issensitive\\(cval.NumberIntVal\\(1\\)\\)"));
}

TEST_F(LoggingTest, LogManagerFileOutput) {
    logLevel = LOG_INFO;
    {
        LogManager log_mgr(test_log_dir);
        info() << "test message to file";
        warning() << "warning to file";
    }

    std::string log_path = test_log_dir + "/" + CVAL_LOG_FILE_NAME;
    ASSERT_TRUE(std::filesystem::exists(log_path));

    std::string content = readFile(log_path);
    EXPECT_TRUE(containsLogMessage(content, "INFO", "test message to file"));
    EXPECT_TRUE(containsLogMessage(content, "WARNING", "warning to file"));

    // Output goes back to stderr once the manager is gone
    auto output = captureLogOutput([]() {
        info() << "after manager";
    });
    EXPECT_NE(output.find("after manager"), std::string::npos);
}

TEST_F(LoggingTest, LogManagerAppends) {
    logLevel = LOG_INFO;
    {
        LogManager log_mgr(test_log_dir);
        info() << "first run";
    }
    {
        LogManager log_mgr(test_log_dir);
        info() << "second run";
    }

    std::string content = readFile(test_log_dir + "/" + CVAL_LOG_FILE_NAME);
    EXPECT_NE(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("LOG REOPENED"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST_F(LoggingTest, LogRotation) {
    logLevel = LOG_INFO;
    LogManager::RotationConfig config;
    config.max_files = 0;  // keep everything
    {
        LogManager log_mgr(test_log_dir, config);

        info() << "before rotation";
        log_mgr.rotate();
        info() << "after rotation";

        EXPECT_EQ(log_mgr.rotations(), 1u);
        ASSERT_EQ(log_mgr.rotatedFiles().size(), 1u);
        EXPECT_NE(readFile(log_mgr.rotatedFiles()[0].string()).find("before rotation"), std::string::npos);
    }

    std::string current = readFile(test_log_dir + "/" + CVAL_LOG_FILE_NAME);
    EXPECT_NE(current.find("after rotation"), std::string::npos);
    EXPECT_EQ(current.find("before rotation"), std::string::npos);
}

TEST_F(LoggingTest, RotationPrunesOldFiles) {
    logLevel = LOG_INFO;
    LogManager::RotationConfig config;
    config.max_files = 2;

    LogManager log_mgr(test_log_dir, config);
    for (int i = 0; i < 4; ++i) {
        info() << "generation " << i;
        log_mgr.rotate();
    }
    EXPECT_EQ(log_mgr.rotations(), 4u);
    EXPECT_EQ(log_mgr.rotatedFiles().size(), 2u);
}

TEST_F(LoggingTest, SizeTriggeredRotation) {
    logLevel = LOG_INFO;
    LogManager::RotationConfig config;
    config.max_file_size = 64;
    config.max_files = 0;
    config.append = false;

    LogManager log_mgr(test_log_dir, config);
    EXPECT_FALSE(log_mgr.rotateIfNeeded());
    EXPECT_EQ(log_mgr.rotations(), 0u);

    // No explicit rotateIfNeeded(): the write itself triggers rotation
    info() << "a message long enough to push the file past sixty-four bytes";
    EXPECT_EQ(log_mgr.rotations(), 1u);
    ASSERT_EQ(log_mgr.rotatedFiles().size(), 1u);
    EXPECT_NE(readFile(log_mgr.rotatedFiles()[0].string()).find("sixty-four bytes"), std::string::npos);
    EXPECT_TRUE(readFile(log_mgr.path().string()).empty());

    info() << "another message long enough to go past the configured cap";
    EXPECT_EQ(log_mgr.rotations(), 2u);
}

TEST_F(LoggingTest, NoRotationBelowCap) {
    logLevel = LOG_INFO;
    LogManager::RotationConfig config;
    config.max_file_size = 1024 * 1024;

    LogManager log_mgr(test_log_dir, config);
    for (int i = 0; i < 10; ++i)
        info() << "small " << i;
    EXPECT_EQ(log_mgr.rotations(), 0u);
    EXPECT_FALSE(log_mgr.rotateIfNeeded());
}

TEST_F(LoggingTest, NoWritesAfterManagerIsGone) {
    logLevel = LOG_INFO;
    LogManager::RotationConfig config;
    config.max_file_size = 16;
    {
        LogManager log_mgr(test_log_dir, config);
    }
    // The size hook went away with the manager
    auto output = captureLogOutput([]() {
        info() << "a line well past sixteen bytes";
    });
    EXPECT_NE(output.find("sixteen bytes"), std::string::npos);
}

TEST_F(LoggingTest, SensitiveDataNeverLogged) {
    logLevel = LOG_TRACE;
    const Mark custom("custom");
    auto output = captureLogOutput([&]() {
        funcs::makeSensitive(StringVal("hunter2").mark(custom).mark(marks::Sensitive));
        funcs::makeNonsensitive(StringVal("letmein").mark(custom).mark(marks::Sensitive));
        funcs::sensitivityFunctions().call("issensitive", {StringVal("pa55word").mark(marks::Sensitive)});
        funcs::sensitivityFunctions().call("sensitive",
            {ListVal({StringVal("nested-secret").mark(marks::Sensitive)})});
    });

    EXPECT_EQ(output.find("hunter2"), std::string::npos);
    EXPECT_EQ(output.find("letmein"), std::string::npos);
    EXPECT_EQ(output.find("pa55word"), std::string::npos);
    EXPECT_EQ(output.find("nested-secret"), std::string::npos);

    // The lines are still there, with type and mark names only
    EXPECT_TRUE(containsLogMessage(output, "DEBUG", "keeping non-standard marks on string value marked custom sensitive"));
    EXPECT_TRUE(containsLogMessage(output, "TRACE", "calling issensitive\\(\\(sensitive\\)\\)"));
    EXPECT_TRUE(containsLogMessage(output, "TRACE", "calling sensitive\\(\\(sensitive\\)\\)"));
}

TEST_F(LoggingTest, DebugOffSkipsMarkDescription) {
    logLevel = LOG_WARNING;
    auto output = captureLogOutput([]() {
        funcs::makeSensitive(StringVal("quiet").mark(Mark("custom")));
        funcs::sensitivityFunctions().call("togglesensitive", {StringVal("quiet")});
    });
    EXPECT_TRUE(output.empty());
}

TEST_F(LoggingTest, LogManagerRejectsBadPath) {
    EXPECT_THROW(LogManager mgr(""), std::invalid_argument);

    std::string file_path = test_log_dir + "/plain_file";
    std::ofstream(file_path) << "x";
    EXPECT_THROW(LogManager mgr(file_path), std::runtime_error);
}

} // namespace cval
