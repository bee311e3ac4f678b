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
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "backup_manager.h"
#include "catalog_store.h"
#include "store_config.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

struct MigrationRecord {
    std::string from_engine;
    std::string to_engine;
    uint32_t from_schema = 0;
    uint32_t to_schema = 0;
    int64_t  unix_ms = 0;
    std::string backup_id;
    std::string status;        // success, failed
    std::string message;
};

// Contents of version_info.json
struct VersionInfo {
    std::string engine_version;
    uint32_t schema_version = 0;
    int64_t last_migration_unix_ms = 0;
    std::vector<MigrationRecord> migration_history;
    int64_t last_check_unix_ms = 0;
    bool last_check_compatible = true;
};

struct CompatibilityReport {
    bool compatible = true;
    bool migration_needed = false;
    std::vector<std::string> issues;
    std::string stored_engine_version;
    uint32_t stored_schema_version = 0;
    bool legacy = false;               // no version file next to an existing catalog
};

/**
 * VersionChecker - compares the persisted engine/schema versions with the
 * running ones. An incompatible store stays readable; mutations are refused
 * unless allow_incompatible_mutations is set.
 */
class VersionChecker {
public:
    explicit VersionChecker(ConfigContext& config, Clock clock = system_clock());

    CompatibilityReport check() const;
    bool mutations_allowed() const;
    bool mutations_allowed(const CompatibilityReport& report) const;

    // nullopt when version_info.json is absent; throws StorageUnavailableError if unreadable
    std::optional<VersionInfo> load() const;
    void store(const VersionInfo& info) const;

    // Writes the running versions for a store without a catalog. Returns true if written.
    bool initialize_if_missing() const;

    // Persists the outcome of a check into compatibility_check
    void record_check(const CompatibilityReport& report) const;

    std::string version_file() const;

    // schema_version stamped in catalog.json; nullopt when absent or unparsable
    std::optional<uint32_t> catalog_schema() const;

private:
    ConfigContext& config_;
    Clock clock_;
};

// Major component of "2.1.0"; 0 when unparsable
uint32_t major_version(const std::string& version);

struct MigrationStep {
    uint32_t from_schema = 0;
    uint32_t to_schema = 0;
    std::string description;
    std::string risk;
    std::function<void(const StoreConfig&)> apply;   // throws on failure
};

struct MigrationPlan {
    bool needed = false;
    std::string from_engine;
    std::string to_engine;
    uint32_t from_schema = 0;
    uint32_t to_schema = 0;
    std::vector<MigrationStep> steps;
    std::vector<std::string> risks;
    bool backup_required = false;
    std::string blocker;        // set when no migration path exists
};

struct MigrationOutcome {
    bool success = false;
    std::string backup_id;
    std::vector<std::string> applied;
    std::string error;
    bool restored = false;
};

/**
 * MigrationManager - upgrades a store to the running schema.
 *
 * execute() takes a full archive first, applies every step on the path in
 * order and records the result in version_info.json. Any failing step
 * restores the archive before returning.
 */
class MigrationManager {
public:
    MigrationManager(ConfigContext& config,
                     VersionChecker& checker,
                     BackupManager& backups,
                     CatalogRepository& catalog,
                     Clock clock = system_clock());

    // Replaces any step with the same from_schema
    void register_step(MigrationStep step);

    MigrationPlan plan() const;
    MigrationOutcome execute();

private:
    ConfigContext& config_;
    VersionChecker& checker_;
    BackupManager& backups_;
    CatalogRepository& catalog_;
    Clock clock_;
    std::map<uint32_t, MigrationStep> steps_;
};

// Step 1 -> 2: flat provider/model/dimension catalog fields become the nested embedding object
void migrate_catalog_v1_to_v2(const StoreConfig& cfg);

} // namespace persist
} // namespace vstore
