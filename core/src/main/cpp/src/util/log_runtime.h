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

#pragma once

#include "log.h"
#include "logmanager.h"

namespace cval {

/**
 * LogRuntime owns the process logging setup: initial log level and
 * optional file logging through LogManager.
 *
 * Usage:
 *   - Tests: create one per fixture, it restores nothing on its own,
 *     use LogRuntimeGuard to get the previous level back
 *   - Embedders: LogRuntime runtime(LogRuntime::Config::fromEnvironment());
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;
        LogManager::RotationConfig rotation_config;
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , initial_level(LOG_WARNING) {}

        /**
         * Reads LOG_LEVEL, CVAL_LOG_ENABLE_FILE, CVAL_LOG_DIR,
         * CVAL_LOG_MAX_SIZE_MB and CVAL_LOG_MAX_FILES. Unset variables keep
         * the defaults; malformed numbers throw std::invalid_argument.
         */
        static Config fromEnvironment() {
            Config config;

            if (const char* level = std::getenv("LOG_LEVEL")) {
                LogLevel parsed;
                if (parseLogLevel(level, parsed))
                    config.initial_level = parsed;
                else
                    std::cerr << "Warning: Invalid LOG_LEVEL '" << level
                              << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }

            if (const char* enable = std::getenv("CVAL_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }

            if (const char* dir = std::getenv("CVAL_LOG_DIR")) {
                config.log_dir = dir;
            }

            if (const char* size = std::getenv("CVAL_LOG_MAX_SIZE_MB")) {
                const size_t mb = 1024 * 1024;
                size_t n = parseCount("CVAL_LOG_MAX_SIZE_MB", size);
                if (n > std::numeric_limits<size_t>::max() / mb)
                    throw std::invalid_argument(std::string("CVAL_LOG_MAX_SIZE_MB: '") + size + "' is too large");
                config.rotation_config.max_file_size = n * mb;
            }

            if (const char* files = std::getenv("CVAL_LOG_MAX_FILES")) {
                config.rotation_config.max_files = parseCount("CVAL_LOG_MAX_FILES", files);
            }

            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {
        logLevel.store(config_.initial_level, std::memory_order_relaxed);

        if (config_.enable_file_logging) {
            if (config_.log_dir.empty())
                throw std::invalid_argument("LogRuntime: file logging enabled without CVAL_LOG_DIR");
            log_manager_.reset(new LogManager(config_.log_dir, config_.rotation_config));
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Closes file logging and returns output to stderr.
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        log_manager_.reset();
        Logger::setLogFile(nullptr);
    }

    const Config& config() const { return config_; }

    LogManager* logManager() { return log_manager_.get(); }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    static bool parseLogLevel(const std::string& level, LogLevel& out) {
        int saved = logLevel.load(std::memory_order_relaxed);
        bool ok = setLogLevelFromString(level);
        if (ok)
            out = static_cast<LogLevel>(logLevel.load(std::memory_order_relaxed));
        logLevel.store(saved, std::memory_order_relaxed);
        return ok;
    }

    static size_t parseCount(const char* name, const std::string& text) {
        size_t pos = 0;
        unsigned long long n = 0;
        if (!text.empty() && std::isdigit(static_cast<unsigned char>(text[0]))) {
            try {
                n = std::stoull(text, &pos);
            } catch (const std::out_of_range&) {
                pos = 0;
            }
        }
        if (pos == 0 || pos != text.size())
            throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" + text + "'");
        return static_cast<size_t>(n);
    }

    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: RAII guard restoring the previous log level
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(new LogRuntime(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace cval
