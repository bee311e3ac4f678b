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

#include "auto_repair.h"
#include "errors.h"
#include "../util/log.h"

namespace vstore {
namespace persist {

AutoRepair::AutoRepair(CatalogRepository& catalog,
                       const FilesystemInspector& inspector,
                       OperationLockTable& locks,
                       BackupManager& backups,
                       const RecoveryPlanner& planner,
                       RecoveryExecutor& executor,
                       const VersionChecker& version)
    : catalog_(catalog), inspector_(inspector), locks_(locks), backups_(backups),
      planner_(planner), executor_(executor), version_(version) {}

RepairResult AutoRepair::repair(const ConsistencyReport& report, const RepairPolicy& policy) {
    if (report.status == ConsistencyStatus::Error) {
        throw StorageUnavailableError("cannot repair from a failed check: " + report.error_message);
    }
    if (!policy.dry_run) {
        CompatibilityReport compat = version_.check();
        if (!version_.mutations_allowed(compat)) {
            std::string why = compat.issues.empty() ? "store version is incompatible" : compat.issues.front();
            throw IncompatibleVersionError("repair blocked: " + why);
        }
    }

    RepairResult result;
    result.dry_run = policy.dry_run;

    std::vector<OrphanedVector> orphans;
    for (const auto& issue : report.issues) {
        const std::string& id = issue_collection_id(issue);
        if (const auto* ov = std::get_if<OrphanedVector>(&issue)) {
            orphans.push_back(*ov);
        } else if (std::holds_alternative<OrphanedCatalogEntry>(issue)) {
            repair_orphaned_entry(id, policy, result);
        } else {
            result.skipped.push_back({id, issue_kind(issue), "none", "requires manual intervention"});
        }
    }
    repair_orphaned_vectors(orphans, policy, result);

    info() << "Repair" << (policy.dry_run ? " (dry run)" : "") << ": "
           << result.repaired.size() << " repaired, " << result.failed.size() << " failed, "
           << result.skipped.size() << " skipped";
    return result;
}

void AutoRepair::repair_orphaned_vectors(const std::vector<OrphanedVector>& orphans,
                                         const RepairPolicy& policy, RepairResult& result) {
    const char* kind = "orphaned_vector";
    std::vector<RecoveryCandidate> candidates;

    for (const auto& ov : orphans) {
        if (!policy.recover_orphaned_vectors) {
            result.skipped.push_back({ov.collection_id, kind, "none", "recovery disabled"});
            continue;
        }
        if (locks_.is_halted(ov.collection_id)) {
            result.skipped.push_back({ov.collection_id, kind, "none", "collection halted"});
            continue;
        }
        if (locks_.is_locked(ov.collection_id)) {
            result.skipped.push_back({ov.collection_id, kind, "none", "operation in progress"});
            continue;
        }
        try {
            RecoveryCandidate c = planner_.evaluate(ov);
            if (!c.recoverable) {
                result.failed.push_back({ov.collection_id, kind, "recover", c.reason_if_not});
                continue;
            }
            candidates.push_back(std::move(c));
        } catch (const StoreError& e) {
            result.failed.push_back({ov.collection_id, kind, "recover", e.what()});
        }
    }
    if (candidates.empty()) {
        return;
    }

    auto plan = planner_.plan(candidates);
    if (policy.dry_run) {
        for (const auto& p : plan) {
            result.repaired.push_back({p.record.collection_id, kind, "recover",
                                       "would register as '" + p.record.display_name + "'"});
        }
        return;
    }

    RecoveryResult rr = executor_.execute(plan);
    for (const auto& rec : rr.succeeded) {
        result.repaired.push_back({rec.collection_id, kind, "recover",
                                   "registered as '" + rec.display_name + "'"});
    }
    for (const auto& f : rr.failed) {
        result.failed.push_back({f.collection_id, kind, "recover", f.reason});
    }
}

void AutoRepair::repair_orphaned_entry(const std::string& collection_id,
                                       const RepairPolicy& policy, RepairResult& result) {
    const char* kind = "orphaned_catalog_entry";
    const char* action = "remove_catalog_entry";

    if (!policy.allow_orphan_catalog_cleanup) {
        result.skipped.push_back({collection_id, kind, "none", "catalog cleanup not enabled"});
        return;
    }
    if (locks_.is_halted(collection_id)) {
        result.skipped.push_back({collection_id, kind, "none", "collection halted"});
        return;
    }
    if (locks_.is_locked(collection_id)) {
        result.skipped.push_back({collection_id, kind, "none", "operation in progress"});
        return;
    }

    try {
        auto guard = locks_.acquire(collection_id);
        if (locks_.is_halted(collection_id)) {
            result.skipped.push_back({collection_id, kind, "none", "collection halted"});
            return;
        }

        // Re-check under the lock; inspect() throws when the root itself is unreachable
        if (inspector_.inspect(collection_id)) {
            result.skipped.push_back({collection_id, kind, "none", "directory present on re-check"});
            return;
        }
        if (!catalog_.contains(collection_id)) {
            result.skipped.push_back({collection_id, kind, "none", "entry already gone"});
            return;
        }
        if (policy.dry_run) {
            result.repaired.push_back({collection_id, kind, action, "would remove catalog entry"});
            return;
        }

        BackupArchive archive = backups_.checkpoint({collection_id}, "repair_" + collection_id);
        catalog_.remove(collection_id);
        result.repaired.push_back({collection_id, kind, action, "removed; record kept in " + archive.backup_id});
        warn() << "Removed orphaned catalog entry " << collection_id << " (backup " << archive.backup_id << ")";
    } catch (const StorageUnavailableError& e) {
        result.skipped.push_back({collection_id, kind, "none", std::string("storage unavailable: ") + e.what()});
    } catch (const StoreError& e) {
        result.failed.push_back({collection_id, kind, action, e.what()});
    }
}

} // namespace persist
} // namespace vstore
