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

#include "platform_fs.h"

#ifdef VSTORE_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <cstring>

namespace vstore {
    namespace persist {

        namespace fs = std::filesystem;

        static FSResult write_all(int fd, const char* data, size_t len) {
            while (len > 0) {
                ssize_t n = ::write(fd, data, len);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                data += n;
                len -= static_cast<size_t>(n);
            }
            return {true, 0};
        }

        FSResult PlatformFS::fsync_file(const std::string& path) {
            int fd = ::open(path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);
            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            // Open directory for reading
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
            if (fd < 0) {
                return {false, errno};
            }

            // Fsync the directory to ensure metadata changes are persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            // Works for files and for directories whose destination does not exist
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            // Get parent directory and fsync it
            fs::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        FSResult PlatformFS::write_file_atomic(const std::string& path, const std::string& contents) {
            std::string temp_path = path + ".tmp";

            int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            FSResult res = write_all(fd, contents.data(), contents.size());
            if (res.ok && ::fsync(fd) != 0) {
                res = {false, errno};
            }
            ::close(fd);

            if (!res.ok) {
                ::unlink(temp_path.c_str());
                return res;
            }

            res = atomic_replace(temp_path, path);
            if (!res.ok) {
                ::unlink(temp_path.c_str());
            }
            return res;
        }

        FSResult PlatformFS::append_line(const std::string& path, const std::string& line) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            std::string buf = line;
            buf.push_back('\n');
            FSResult res = write_all(fd, buf.data(), buf.size());
            if (res.ok && ::fdatasync(fd) != 0) {
                res = {false, errno};
            }
            ::close(fd);
            return res;
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            // stat
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            fs::create_directories(path, ec);
            if (ec) {
                if (fs::is_directory(path)) {
                    return {true, 0};
                }
                return {false, ec.value()};
            }
            return {true, 0};
        }

        FSResult PlatformFS::truncate(const std::string& path, size_t size) {
            if (::truncate(path.c_str(), off_t(size)) == 0) {
                return {true, 0};
            }
            return {false, errno};
        }

        FSResult PlatformFS::copy_tree(const std::string& src, const std::string& dst) {
            std::error_code ec;
            if (!fs::is_directory(src, ec)) {
                return {false, ec ? ec.value() : ENOTDIR};
            }
            if (fs::exists(dst, ec)) {
                return {false, EEXIST};
            }

            fs::create_directories(dst, ec);
            if (ec) {
                return {false, ec.value()};
            }

            for (fs::recursive_directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
                fs::path rel = fs::relative(it->path(), src, ec);
                if (ec) break;
                fs::path target = fs::path(dst) / rel;

                if (it->is_directory(ec)) {
                    fs::create_directories(target, ec);
                } else if (it->is_regular_file(ec)) {
                    fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, ec);
                    if (!ec) {
                        FSResult r = fsync_file(target.string());
                        if (!r.ok) return r;
                    }
                }
                if (ec) break;
            }
            if (ec) {
                return {false, ec.value()};
            }

            // Persist the directory entries created above
            for (fs::recursive_directory_iterator it(dst, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_directory(ec)) {
                    FSResult r = fsync_directory(it->path().string());
                    if (!r.ok) return r;
                }
            }
            if (ec) {
                return {false, ec.value()};
            }

            FSResult r = fsync_directory(dst);
            if (!r.ok) return r;

            std::string parent = fs::path(dst).parent_path().string();
            return fsync_directory(parent.empty() ? "." : parent);
        }

        FSResult PlatformFS::remove_tree(const std::string& path) {
            std::error_code ec;
            fs::remove_all(path, ec);
            if (ec) {
                return {false, ec.value()};
            }
            std::string parent = fs::path(path).parent_path().string();
            if (!parent.empty() && fs::is_directory(parent, ec)) {
                return fsync_directory(parent);
            }
            return {true, 0};
        }

        std::pair<FSResult, TreeUsage> PlatformFS::tree_usage(const std::string& path) {
            TreeUsage usage;
            std::error_code ec;
            if (!fs::is_directory(path, ec)) {
                return { {false, ec ? ec.value() : ENOTDIR}, usage };
            }
            for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_regular_file(ec)) {
                    uintmax_t sz = it->file_size(ec);
                    if (ec) break;
                    usage.bytes += sz;
                    usage.files++;
                }
                if (ec) break;
            }
            if (ec) {
                return { {false, ec.value()}, usage };
            }
            return { {true, 0}, usage };
        }

    } // namespace persist
} // namespace vstore
#endif
