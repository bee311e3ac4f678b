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
#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>

namespace vstore {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        struct TreeUsage {
            uint64_t bytes = 0;
            size_t   files = 0;
        };

        class PlatformFS {
        public:
            static FSResult fsync_file(const std::string& path);
            static FSResult fsync_directory(const std::string& dir_path);

            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            // temp file + fsync + atomic_replace; the only way small metadata files are written
            static FSResult write_file_atomic(const std::string& path, const std::string& contents);
            static FSResult append_line(const std::string& path, const std::string& line);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
            static FSResult truncate(const std::string& path, size_t size);

            // Recursive copy; every copied file and directory is fsynced.
            // dst must not exist.
            static FSResult copy_tree(const std::string& src, const std::string& dst);
            static FSResult remove_tree(const std::string& path);
            static std::pair<FSResult, TreeUsage> tree_usage(const std::string& path);
        };

    }
} // namespace vstore::persist
