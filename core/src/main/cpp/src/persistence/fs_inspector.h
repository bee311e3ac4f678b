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
#include <optional>
#include <string>
#include <vector>

namespace vstore {
namespace persist {

// Directory-level facts about one physical collection. Nothing here
// requires loading the engine.
struct PhysicalEntry {
    std::string collection_id;
    std::string dir;
    uint64_t size_bytes = 0;
    size_t   file_count = 0;
    bool has_header = false;
    bool has_vectors = false;
    bool header_readable = false;
    std::string header_error;                // why the header could not be decoded
    std::optional<uint32_t> dimension;       // from the header
    std::optional<uint64_t> header_count;
    uint64_t est_count = 0;

    bool complete() const { return has_header && has_vectors; }
};

/**
 * FilesystemInspector - lists <data_root>/collections independently of the catalog.
 */
class FilesystemInspector {
public:
    explicit FilesystemInspector(const std::string& data_root);

    // Throws StorageUnavailableError when the collections root is missing or
    // cannot be listed; an unmounted volume must not read as an empty store.
    std::vector<PhysicalEntry> scan() const;

    std::optional<PhysicalEntry> inspect(const std::string& collection_id) const;

    const std::string& collections_root() const { return collections_root_; }

private:
    PhysicalEntry describe(const std::string& collection_id, const std::string& dir) const;

    std::string collections_root_;
};

} // namespace persist
} // namespace vstore
