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
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "catalog_store.h"
#include "consistency_checker.h"
#include "fs_inspector.h"
#include "operation_lock.h"
#include "store_config.h"
#include "sync_events.h"
#include "vector_store.h"
#include "version_checker.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

enum class RecoveryPriority {
    Normal,
    High
};

const char* to_string(RecoveryPriority priority);

struct RecoveryCandidate {
    std::string collection_id;
    std::string dir;
    uint64_t est_size = 0;
    uint64_t est_count = 0;
    bool recoverable = false;
    std::string reason_if_not;
    std::optional<uint32_t> inferred_dimension;
    std::vector<std::string> item_ids_sampled;
    RecoveryPriority priority = RecoveryPriority::Normal;
};

struct ProposedCollectionRecord {
    CollectionRecord record;
    std::string source_dir;
    RecoveryPriority priority = RecoveryPriority::Normal;
    uint64_t est_size = 0;
};

struct RecoveryFailure {
    std::string collection_id;
    std::string reason;
};

struct RecoveryResult {
    std::vector<CollectionRecord> succeeded;
    std::vector<RecoveryFailure> failed;
    std::vector<std::string> not_attempted;   // left over after cancellation
    bool cancelled = false;
};

/**
 * RecoveryPlanner - turns orphaned physical directories into proposed
 * catalog records. Read-only.
 */
class RecoveryPlanner {
public:
    RecoveryPlanner(ConfigContext& config,
                    const ConsistencyChecker& checker,
                    const CatalogRepository& catalog,
                    const VectorStoreAdapter& vectors,
                    const FilesystemInspector& inspector,
                    Clock clock = system_clock());

    // Every OrphanedVector of a quick check, with a recoverability verdict.
    // Throws StorageUnavailableError when the check itself fails.
    std::vector<RecoveryCandidate> scan() const;

    RecoveryCandidate evaluate(const OrphanedVector& orphan) const;

    // One record per recoverable candidate, highest priority and largest first
    std::vector<ProposedCollectionRecord> plan(const std::vector<RecoveryCandidate>& candidates) const;

private:
    ConfigContext& config_;
    const ConsistencyChecker& checker_;
    const CatalogRepository& catalog_;
    const VectorStoreAdapter& vectors_;
    const FilesystemInspector& inspector_;
    Clock clock_;
};

/**
 * RecoveryExecutor - writes proposed records one at a time.
 *
 * Each record is gated on a fresh look at its directory and written under
 * the collection's operation lock. Failures are reported per record and do
 * not undo earlier successes. The cancel flag is checked between records.
 * A plan is refused as a whole while the store version blocks mutations.
 */
class RecoveryExecutor {
public:
    RecoveryExecutor(ConfigContext& config,
                     CatalogRepository& catalog,
                     const VectorStoreAdapter& vectors,
                     const FilesystemInspector& inspector,
                     const VersionChecker& version,
                     OperationLockTable& locks,
                     SyncEventQueue* events = nullptr,
                     Clock clock = system_clock());

    // Throws IncompatibleVersionError, before touching the catalog, when mutations are blocked
    RecoveryResult execute(const std::vector<ProposedCollectionRecord>& plan,
                           const std::atomic<bool>* cancel = nullptr);

private:
    void recover_one(const ProposedCollectionRecord& proposal, CollectionRecord* written);
    void log_attempt(const std::string& collection_id, const std::string& status,
                     const std::string& display_name, const std::string& reason);

    ConfigContext& config_;
    CatalogRepository& catalog_;
    const VectorStoreAdapter& vectors_;
    const FilesystemInspector& inspector_;
    const VersionChecker& version_;
    OperationLockTable& locks_;
    SyncEventQueue* events_;
    Clock clock_;
};

// recovered_<8 chars after "col_">
std::string placeholder_display_name(const std::string& collection_id);

} // namespace persist
} // namespace vstore
