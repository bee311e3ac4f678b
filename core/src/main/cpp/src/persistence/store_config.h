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
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include "config.h"

namespace vstore {
namespace persist {

/**
 * Runtime configuration for a store rooted at data_root.
 * Components never read globals; they are handed a ConfigContext.
 */
struct StoreConfig {
    std::string data_root = "./vstore_data";
    std::string backup_root;                      // empty = <data_root>/backups

    // Backup retention: keep the union of the N newest and everything younger than D days
    size_t   retention_count = 10;
    uint32_t retention_days  = 30;
    bool     keep_checkpoint_after_commit = true;

    // Consistency / sync
    size_t sync_queue_capacity     = 1024;
    size_t consistency_sample_size = 16;          // items sampled per collection in full checks

    // Catalog entries whose directory vanished are only removed when this is set;
    // a failed mount looks exactly like a deleted directory
    bool allow_orphan_catalog_cleanup = false;

    // Operator override for an incompatible on-disk version
    bool allow_incompatible_mutations = false;
    bool auto_migrate = false;

    uint64_t recovery_high_priority_bytes = 10ull * 1024 * 1024;

    std::string log_level = "INFO";
    std::string log_dir;                          // empty = stderr only

    std::string collections_dir() const;
    std::string backups_dir() const;
    std::string path_in_root(const char* name) const;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StoreConfig defaults() {
        StoreConfig cfg;

        if (const char* env = std::getenv("VSTORE_DATA_ROOT")) {
            cfg.data_root = env;
        }
        if (const char* env = std::getenv("VSTORE_BACKUP_ROOT")) {
            cfg.backup_root = env;
        }
        if (const char* env = std::getenv("VSTORE_BACKUP_RETENTION_COUNT")) {
            cfg.retention_count = std::stoull(env);
        }
        if (const char* env = std::getenv("VSTORE_BACKUP_RETENTION_DAYS")) {
            cfg.retention_days = static_cast<uint32_t>(std::stoul(env));
        }
        if (const char* env = std::getenv("VSTORE_SYNC_QUEUE_CAPACITY")) {
            cfg.sync_queue_capacity = std::stoull(env);
        }
        if (const char* env = std::getenv("VSTORE_ALLOW_ORPHAN_CATALOG_CLEANUP")) {
            cfg.allow_orphan_catalog_cleanup = (std::string(env) != "0");
        }
        if (const char* env = std::getenv("VSTORE_ALLOW_INCOMPATIBLE_MUTATIONS")) {
            cfg.allow_incompatible_mutations = (std::string(env) != "0");
        }
        if (const char* env = std::getenv("VSTORE_LOG_DIR")) {
            cfg.log_dir = env;
        }
        if (const char* env = std::getenv("LOG_LEVEL")) {
            cfg.log_level = env;
        }

        return cfg;
    }

    /**
     * Validate configuration. On failure *why names the offending key.
     */
    bool validate(std::string* why = nullptr) const;
};

/**
 * ConfigContext - owns the active StoreConfig snapshot.
 *
 * load() overlays a JSON file on the current snapshot; reload() re-reads the
 * same file. Readers take a shared_ptr snapshot, so a reload never changes a
 * value in the middle of an operation. Only the first load() may move data_root.
 */
class ConfigContext {
public:
    explicit ConfigContext(StoreConfig config = StoreConfig::defaults());

    // Load from a JSON file; returns false (and keeps the current snapshot) on error
    bool load(const std::string& path);
    bool reload();

    // Replace the snapshot programmatically (tests, admin tool)
    bool update(const StoreConfig& config);

    std::shared_ptr<const StoreConfig> current() const;
    uint64_t generation() const;
    const std::string& source_path() const { return source_path_; }
    const std::string& last_error() const { return last_error_; }

private:
    bool install(const StoreConfig& next, bool initial_load);

    mutable std::mutex mu_;
    std::shared_ptr<const StoreConfig> current_;
    uint64_t generation_ = 0;
    std::string source_path_;
    std::string last_error_;
};

} // namespace persist
} // namespace vstore
