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
#include <string>
#include <vector>
#include "backup_manager.h"
#include "catalog_store.h"
#include "consistency_checker.h"
#include "fs_inspector.h"
#include "operation_lock.h"
#include "recovery.h"
#include "store_config.h"
#include "version_checker.h"

namespace vstore {
namespace persist {

struct RepairPolicy {
    bool recover_orphaned_vectors = true;
    // Removes catalog entries whose directory is gone
    bool allow_orphan_catalog_cleanup = false;
    bool dry_run = false;

    static RepairPolicy from(const StoreConfig& cfg) {
        RepairPolicy p;
        p.allow_orphan_catalog_cleanup = cfg.allow_orphan_catalog_cleanup;
        return p;
    }
};

struct RepairAction {
    std::string collection_id;
    std::string issue_kind;
    std::string action;       // recover, remove_catalog_entry, none
    std::string detail;
};

struct RepairResult {
    std::vector<RepairAction> repaired;   // in a dry run: what would have been done
    std::vector<RepairAction> failed;
    std::vector<RepairAction> skipped;
    bool dry_run = false;
};

/**
 * AutoRepair - applies the safe subset of fixes for a consistency report.
 *
 *  - OrphanedVector: recovered through the planner/executor.
 *  - OrphanedCatalogEntry: removed only with allow_orphan_catalog_cleanup,
 *    after a checkpoint, when the collections root is reachable, the
 *    directory is still absent and no operation holds the id.
 *  - DimensionMismatch, UnreadableCollection: never touched.
 *
 * Collections halted by a failed rollback are skipped. Nothing is written
 * while the store version blocks mutations.
 */
class AutoRepair {
public:
    AutoRepair(CatalogRepository& catalog,
               const FilesystemInspector& inspector,
               OperationLockTable& locks,
               BackupManager& backups,
               const RecoveryPlanner& planner,
               RecoveryExecutor& executor,
               const VersionChecker& version);

    // Throws StorageUnavailableError for a report whose status is Error and
    // IncompatibleVersionError for a non dry run while mutations are blocked
    RepairResult repair(const ConsistencyReport& report, const RepairPolicy& policy);

private:
    void repair_orphaned_vectors(const std::vector<OrphanedVector>& orphans,
                                 const RepairPolicy& policy, RepairResult& result);
    void repair_orphaned_entry(const std::string& collection_id,
                               const RepairPolicy& policy, RepairResult& result);

    CatalogRepository& catalog_;
    const FilesystemInspector& inspector_;
    OperationLockTable& locks_;
    BackupManager& backups_;
    const RecoveryPlanner& planner_;
    RecoveryExecutor& executor_;
    const VersionChecker& version_;
};

} // namespace persist
} // namespace vstore
