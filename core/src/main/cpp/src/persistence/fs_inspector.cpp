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

#include "fs_inspector.h"
#include "collection_record.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "vector_engine.h"
#include "../util/log.h"
#include <algorithm>
#include <cerrno>
#include <filesystem>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

FilesystemInspector::FilesystemInspector(const std::string& data_root)
    : collections_root_((fs::path(data_root) / layout::kCollectionsDir).string()) {}

PhysicalEntry FilesystemInspector::describe(const std::string& collection_id, const std::string& dir) const {
    PhysicalEntry e;
    e.collection_id = collection_id;
    e.dir = dir;

    auto usage = PlatformFS::tree_usage(dir);
    if (!usage.first.ok) {
        if (usage.first.err == ENOENT || usage.first.err == ENOTDIR) {
            throw NotFoundError(dir + " vanished during scan", collection_id);
        }
        throw StorageUnavailableError("cannot stat " + dir + ": " + errnoWithDescription(usage.first.err),
                                      collection_id);
    }
    e.size_bytes = usage.second.bytes;
    e.file_count = usage.second.files;

    std::error_code ec;
    e.has_header = fs::is_regular_file(EngineFiles::header_path(dir), ec);
    e.has_vectors = fs::is_regular_file(EngineFiles::vectors_path(dir), ec);

    if (e.has_header) {
        try {
            EngineHeader h = EngineFiles::read_header(dir);
            e.header_readable = true;
            e.dimension = h.dimension;
            e.header_count = h.item_count;
        } catch (const StoreError& err) {
            e.header_error = err.what();
        }
    }

    if (e.header_count) {
        e.est_count = *e.header_count;
    } else if (e.dimension && e.has_vectors) {
        auto sz = PlatformFS::file_size(EngineFiles::vectors_path(dir));
        if (sz.first.ok) {
            e.est_count = sz.second / (static_cast<uint64_t>(*e.dimension) * sizeof(float) + engine::kItemOverhead);
        }
    }
    return e;
}

std::vector<PhysicalEntry> FilesystemInspector::scan() const {
    std::error_code ec;
    if (!fs::is_directory(collections_root_, ec)) {
        throw StorageUnavailableError("collections root " + collections_root_ + " is not accessible" +
                                      (ec ? ": " + ec.message() : std::string()));
    }

    std::vector<PhysicalEntry> out;
    for (fs::directory_iterator it(collections_root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        // Hidden names are staging directories
        if (name.empty() || name[0] == '.') {
            continue;
        }
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) {
            continue;
        }
        if (!is_valid_collection_id(name)) {
            debug() << "Skipping " << it->path().string() << ": not a collection id";
            continue;
        }
        try {
            out.push_back(describe(name, it->path().string()));
        } catch (const NotFoundError&) {
            // Dropped concurrently
            continue;
        }
    }
    if (ec) {
        throw StorageUnavailableError("cannot list " + collections_root_ + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [](const PhysicalEntry& a, const PhysicalEntry& b) {
        return a.collection_id < b.collection_id;
    });
    return out;
}

std::optional<PhysicalEntry> FilesystemInspector::inspect(const std::string& collection_id) const {
    if (!is_valid_collection_id(collection_id)) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::is_directory(collections_root_, ec)) {
        throw StorageUnavailableError("collections root " + collections_root_ + " is not accessible");
    }
    std::string dir = (fs::path(collections_root_) / collection_id).string();
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }
    try {
        return describe(collection_id, dir);
    } catch (const NotFoundError&) {
        return std::nullopt;
    }
}

} // namespace persist
} // namespace vstore
