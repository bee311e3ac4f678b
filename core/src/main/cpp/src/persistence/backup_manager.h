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
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "catalog_store.h"
#include "store_config.h"
#include "vector_store.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

enum class ArchiveType {
    Full,
    SingleCollection
};

const char* to_string(ArchiveType type);

// State of one collection when the archive was taken. Absence is state too:
// restoring an archive whose source had no record removes the record.
struct ArchiveSource {
    std::string collection_id;
    bool had_record = false;
    bool had_physical = false;
};

struct BackupArchive {
    std::string backup_id;
    ArchiveType type = ArchiveType::SingleCollection;
    std::string path;
    uint64_t size_bytes = 0;
    int64_t created_unix_ms = 0;
    std::vector<ArchiveSource> sources;
    uint32_t schema_version = 0;
    std::string engine_version;
    std::string operation_id;           // empty for explicit backups
    uint32_t snapshot_crc32c = 0;
};

struct RetentionPolicy {
    size_t   retention_count = 10;
    uint32_t retention_days  = 30;

    static RetentionPolicy from(const StoreConfig& cfg) {
        return RetentionPolicy{cfg.retention_count, cfg.retention_days};
    }
};

/**
 * BackupManager - self-contained archives of catalog records plus physical
 * directories.
 *
 * Layout: <backups>/<backup_id>/{manifest.json, catalog_snapshot.json,
 * collections/<id>/...}. An archive is built under .staging_<backup_id> and
 * becomes visible through a single rename, so list() never sees a partial one.
 */
class BackupManager {
public:
    BackupManager(ConfigContext& config,
                  CatalogRepository& catalog,
                  VectorStoreAdapter& vectors,
                  Clock clock = system_clock());

    // Empty ids = full archive of every catalog and physical collection.
    // Throws StorageUnavailableError if the archive cannot be written.
    BackupArchive checkpoint(const std::vector<std::string>& ids,
                             const std::string& operation_id = std::string());

    // Pure overwrite: every source ends exactly as archived. A full archive also
    // removes collections created after it was taken.
    void restore(const std::string& backup_id);

    std::vector<BackupArchive> list() const;      // newest first
    std::optional<BackupArchive> get(const std::string& backup_id) const;
    bool remove(const std::string& backup_id);

    // Deletes archives that are neither among the retention_count newest nor
    // younger than retention_days. Returns what was deleted.
    std::vector<BackupArchive> cleanup(const RetentionPolicy& policy);
    std::vector<BackupArchive> cleanup();

    std::string backups_root() const;

private:
    std::string next_backup_id(int64_t now_ms);
    void restore_source(const BackupArchive& archive,
                        const ArchiveSource& src,
                        const std::vector<CollectionRecord>& snapshot);
    std::optional<BackupArchive> read_manifest(const std::string& dir) const;
    std::string write_manifest_json(const BackupArchive& a) const;

    // Checkpoint serialization: single-collection checkpoints exclude each
    // other per id, a full checkpoint excludes everything
    void acquire_ids(const std::vector<std::string>& ids);
    void release_ids(const std::vector<std::string>& ids);

    ConfigContext& config_;
    CatalogRepository& catalog_;
    VectorStoreAdapter& vectors_;
    Clock clock_;

    std::atomic<uint64_t> seq_{0};

    std::mutex progress_mu_;
    std::condition_variable progress_cv_;
    std::set<std::string> in_progress_;
    bool full_in_progress_ = false;
};

} // namespace persist
} // namespace vstore
