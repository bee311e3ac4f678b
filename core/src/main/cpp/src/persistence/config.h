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

namespace vstore {
namespace persist {

// Running engine and catalog schema versions
namespace versions {
    constexpr const char* kEngineVersion = "2.1.0";
    constexpr uint32_t kSchemaVersion = 2;
    // Oldest catalog/archive schema that can still be read (and upgraded)
    constexpr uint32_t kMinReadableSchemaVersion = 1;
    // Archive manifest layout
    constexpr uint32_t kArchiveFormatVersion = 1;
}

// Names inside the data root
namespace layout {
    constexpr const char* kCatalogFile = "catalog.json";
    constexpr const char* kCollectionsDir = "collections";
    constexpr const char* kBackupsDir = "backups";
    constexpr const char* kTrashDir = "trash";
    constexpr const char* kVersionFile = "version_info.json";
    constexpr const char* kRecoveryLog = "recovery.log";
    constexpr const char* kOperationsLog = "operations.log";
    constexpr const char* kPendingCleanupFile = "pending_cleanup.json";

    // Archive contents
    constexpr const char* kArchiveManifest = "manifest.json";
    constexpr const char* kArchiveCatalog = "catalog_snapshot.json";
    constexpr const char* kStagingPrefix = ".staging_";
}

// Physical collection files
namespace engine {
    constexpr const char* kHeaderFile = "header.bin";
    constexpr const char* kVectorsFile = "vectors.bin";

    constexpr uint32_t kMagic = 0x31435356;  // "VSC1" little-endian
    constexpr uint32_t kFormatVersion = 1;
    constexpr size_t kHeaderSize = 48;

    // Per item: id_len + dim + crc, plus the id bytes and floats
    constexpr size_t kItemOverhead = 12;
    constexpr uint32_t kMaxDimension = 65536;
    constexpr uint32_t kMaxIdLength = 1024;
}

namespace ids {
    constexpr const char* kCollectionPrefix = "col_";
    constexpr size_t kMaxIdLength = 128;
    // Length of the id fragment used in recovered placeholder names
    constexpr size_t kPlaceholderFragment = 8;
}

} // namespace persist
} // namespace vstore
