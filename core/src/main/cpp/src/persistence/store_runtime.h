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
#include <memory>
#include <string>
#include "auto_repair.h"
#include "backup_manager.h"
#include "catalog_store.h"
#include "consistency_checker.h"
#include "fs_inspector.h"
#include "operation_lock.h"
#include "recovery.h"
#include "store_config.h"
#include "sync_events.h"
#include "transactional_ops.h"
#include "vector_store.h"
#include "version_checker.h"
#include "../util/logmanager.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

/**
 * StoreRuntime - one opened data root with every component wired to the
 * same ConfigContext.
 *
 * open() creates the directory layout, retries pending trash removals,
 * writes version_info.json for a fresh store, loads the catalog and, when
 * auto_migrate is set, migrates an older store. An incompatible store still
 * opens; TransactionalOps, RecoveryExecutor and AutoRepair refuse to mutate
 * it. A catalog written with a newer schema opens with an empty in-memory
 * catalog unless allow_incompatible_mutations is set, in which case open()
 * throws IncompatibleVersionError.
 */
class StoreRuntime {
public:
    static std::unique_ptr<StoreRuntime> open(ConfigContext& config, Clock clock = system_clock());

    ~StoreRuntime();

    StoreRuntime(const StoreRuntime&) = delete;
    StoreRuntime& operator=(const StoreRuntime&) = delete;

    inline ConfigContext&       config()      { return config_; }
    inline JsonCatalogStore&    catalog()     { return *catalog_; }
    inline FileVectorStore&     vectors()     { return *vectors_; }
    inline FilesystemInspector& inspector()   { return *inspector_; }
    inline BackupManager&       backups()     { return *backups_; }
    inline ConsistencyChecker&  checker()     { return *checker_; }
    inline OperationLockTable&  locks()       { return locks_; }
    inline SyncEventQueue&      events()      { return *events_; }
    inline RecoveryPlanner&     planner()     { return *planner_; }
    inline RecoveryExecutor&    executor()    { return *executor_; }
    inline AutoRepair&          repair()      { return *repair_; }
    inline VersionChecker&      version()     { return *version_; }
    inline MigrationManager&    migrations()  { return *migrations_; }
    inline TransactionalOps&    ops()         { return *ops_; }

    // Result of the version check performed by open()
    const CompatibilityReport& compatibility_at_open() const { return compat_; }

    // Re-reads the config file; returns false and keeps the old snapshot on error
    bool reload_config();

private:
    StoreRuntime(ConfigContext& config, Clock clock);

    void prepare_layout();
    void wire();

    ConfigContext& config_;
    Clock clock_;
    std::unique_ptr<LogManager> log_manager_;

    std::unique_ptr<JsonCatalogStore>    catalog_;
    std::unique_ptr<FileVectorStore>     vectors_;
    std::unique_ptr<FilesystemInspector> inspector_;
    OperationLockTable                   locks_;
    std::unique_ptr<SyncEventQueue>      events_;
    std::unique_ptr<BackupManager>       backups_;
    std::unique_ptr<ConsistencyChecker>  checker_;
    std::unique_ptr<RecoveryPlanner>     planner_;
    std::unique_ptr<RecoveryExecutor>    executor_;
    std::unique_ptr<AutoRepair>          repair_;
    std::unique_ptr<VersionChecker>      version_;
    std::unique_ptr<MigrationManager>    migrations_;
    std::unique_ptr<TransactionalOps>    ops_;

    CompatibilityReport compat_;
};

} // namespace persist
} // namespace vstore
