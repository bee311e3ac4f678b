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
#include <algorithm>
#include <vector>
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace vstore {

    /**
     * Routes Logger output into <log_dir>/vstore.log.
     *
     * rotate() renames the open file to vstore.log.<timestamp> and keeps at
     * most RotationConfig::max_files rotated files. The destructor hands the
     * logger back to stderr.
     */
    class LogManager {
    public:
        struct RotationConfig {
            size_t max_file_size = 64 * 1024 * 1024;  // rotate_if_needed() threshold
            size_t max_files = 5;                     // rotated files to retain
        };

        explicit LogManager(const std::string& log_dir)
            : LogManager(log_dir, RotationConfig()) {}

        LogManager(const std::string& log_dir, const RotationConfig& config)
            : _config(config), _file(nullptr) {
            boost::filesystem::path dir(log_dir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + log_dir + "]: " + ec.message());
            }
            _path = (dir / "vstore.log").string();
            open(true);
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                std::fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        void rotate() {
            if (_file) {
                std::string rotated = _path + "." + terseCurrentTime();
                // Rotations inside the same second get a numeric suffix
                int n = 1;
                while (boost::filesystem::exists(rotated)) {
                    rotated = _path + "." + terseCurrentTime() + "." + std::to_string(n++);
                }
                Logger::setLogFile(nullptr);
                std::fclose(_file);
                _file = nullptr;
                if (std::rename(_path.c_str(), rotated.c_str()) != 0) {
                    std::cerr << "can't rename " << _path << " to " << rotated
                              << ": " << errnoWithDescription() << std::endl;
                }
            }
            open(false);
            prune_rotated();
        }

        void rotate_if_needed() {
            boost::system::error_code ec;
            auto size = boost::filesystem::file_size(_path, ec);
            if (!ec && size >= _config.max_file_size) {
                rotate();
            }
        }

    private:
        void open(bool append) {
            FILE* f = std::fopen(_path.c_str(), append ? "a" : "w");
            if (!f) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }
            _file = f;
            Logger::setLogFile(f);
        }

        void prune_rotated() {
            boost::filesystem::path dir = boost::filesystem::path(_path).parent_path();
            std::string prefix = boost::filesystem::path(_path).filename().string() + ".";
            std::vector<std::string> rotated;
            boost::system::error_code ec;
            for (boost::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                std::string name = it->path().filename().string();
                if (name.compare(0, prefix.size(), prefix) == 0) {
                    rotated.push_back(it->path().string());
                }
            }
            if (rotated.size() <= _config.max_files) {
                return;
            }
            // Timestamp suffixes sort chronologically
            std::sort(rotated.begin(), rotated.end());
            size_t excess = rotated.size() - _config.max_files;
            for (size_t i = 0; i < excess; ++i) {
                boost::filesystem::remove(rotated[i], ec);
            }
        }

        static std::string terseCurrentTime() {
            std::time_t t = std::time(nullptr);
            struct tm tm_buf;
            gmtime_r(&t, &tm_buf);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm_buf);
            return buf;
        }

        RotationConfig _config;
        std::string _path;
        FILE* _file;
    };
}
