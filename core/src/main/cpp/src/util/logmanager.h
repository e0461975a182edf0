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

#include <boost/filesystem.hpp>

namespace cval {

    /**
     * Routes all Logger output into <logdir>/CVAL_LOG_FILE_NAME for the
     * lifetime of the object. Rotated files are renamed with a timestamp
     * suffix and pruned down to RotationConfig::max_files. When
     * max_file_size is set, every logged line checks the size and
     * rotates once it is reached.
     */
    class LogManager {
    public:
        struct RotationConfig {
            size_t max_file_size;       // 0 disables size-triggered rotation
            size_t max_files;           // rotated files kept, 0 keeps all
            bool append;

            RotationConfig()
                : max_file_size(CVAL_LOG_MAX_FILE_SIZE)
                , max_files(CVAL_LOG_MAX_FILES)
                , append(true) {}
        };

        LogManager(const string& logdir, const RotationConfig& config = RotationConfig())
            : _config(config), _file(0), _rotations(0) {
            if (logdir.empty())
                throw std::invalid_argument("LogManager: log directory must not be empty");

            boost::filesystem::path dir(logdir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec)
                throw std::runtime_error("LogManager: can't create log directory " + logdir + ": " + ec.message());
            if (!boost::filesystem::is_directory(dir))
                throw std::runtime_error("LogManager: logpath [" + logdir + "] should be a directory");

            _path = dir / CVAL_LOG_FILE_NAME;
            open(_config.append);

            if (_config.max_file_size > 0)
                Logger::setWriteHook([this]() { onWrite(); });
        }

        ~LogManager() {
            Logger::setWriteHook(std::function<void()>());
            boost::mutex::scoped_lock lk(_mutex);
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const boost::filesystem::path& path() const { return _path; }

        string terseCurrentTime() {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            char buf[32];
            size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &t);
            return string(buf, n);
        }

        /* Renames the live file to <path>.<timestamp> and reopens a fresh one. */
        void rotate() {
            boost::mutex::scoped_lock lk(_mutex);
            rotateLocked();
        }

        /* Rotates when the live file has grown past max_file_size. */
        bool rotateIfNeeded() {
            boost::mutex::scoped_lock lk(_mutex);
            return rotateIfNeededLocked();
        }

        size_t rotations() const {
            boost::mutex::scoped_lock lk(_mutex);
            return _rotations;
        }

        std::vector<boost::filesystem::path> rotatedFiles() const {
            std::vector<boost::filesystem::path> files;
            const string prefix = _path.filename().string() + ".";
            for (boost::filesystem::directory_iterator it(_path.parent_path()), end; it != end; ++it) {
                string name = it->path().filename().string();
                if (name.compare(0, prefix.size(), prefix) == 0)
                    files.push_back(it->path());
            }
            // Timestamp suffixes sort chronologically
            std::sort(files.begin(), files.end());
            return files;
        }

    private:
        void rotateLocked() {
            if (!_file)
                throw std::logic_error("LogManager: rotate() on a closed log");

            Logger::setLogFile(nullptr);
            fclose(_file);
            _file = 0;

            stringstream ss;
            ss << _path.string() << "." << terseCurrentTime();
            boost::filesystem::path rotated(ss.str());
            // Several rotations within one second must not clobber each other
            for (int i = 1; boost::filesystem::exists(rotated); ++i) {
                stringstream sn;
                sn << ss.str() << "-" << i;
                rotated = boost::filesystem::path(sn.str());
            }
            boost::filesystem::rename(_path, rotated);
            ++_rotations;

            open(false);
            prune();
            debug() << "rotated log to " << rotated;
        }

        bool rotateIfNeededLocked() {
            if (_config.max_file_size == 0 || !_file)
                return false;
            long size = ftell(_file);
            if (size < 0 || static_cast<size_t>(size) < _config.max_file_size)
                return false;
            rotateLocked();
            return true;
        }

        // Write hook. A rotation already in progress, on this thread or
        // another, owns the mutex and the line is simply not checked.
        void onWrite() {
            boost::mutex::scoped_lock lk(_mutex, boost::try_to_lock);
            if (!lk.owns_lock())
                return;
            try {
                rotateIfNeededLocked();
            } catch (const std::exception& e) {
                std::cerr << "LogManager: rotation failed: " << e.what() << std::endl;
            }
        }

        void open(bool append) {
            bool exists = boost::filesystem::exists(_path);
            FILE* f = fopen(_path.string().c_str(), append ? "a" : "w");
            if (!f)
                throw std::runtime_error("LogManager: can't open [" + _path.string() + "] for log file: " + errnoWithDescription());

            if (append && exists) {
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), f) != msg.size()) {
                    int x = errno;
                    fclose(f);
                    throw std::runtime_error("LogManager: can't write to [" + _path.string() + "]: " + errnoWithDescription(x));
                }
            }

            _file = f;
            Logger::setLogFile(_file);
        }

        void prune() {
            if (_config.max_files == 0)
                return;
            std::vector<boost::filesystem::path> files = rotatedFiles();
            while (files.size() > _config.max_files) {
                boost::system::error_code ec;
                boost::filesystem::remove(files.front(), ec);
                if (ec)
                    warning() << "can't remove old log " << files.front() << ": " << ec.message();
                files.erase(files.begin());
            }
        }

        mutable boost::mutex _mutex;
        RotationConfig _config;
        boost::filesystem::path _path;
        FILE* _file;
        size_t _rotations;
    };
}
