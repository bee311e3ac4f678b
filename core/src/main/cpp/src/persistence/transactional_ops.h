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
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "backup_manager.h"
#include "catalog_store.h"
#include "consistency_checker.h"
#include "errors.h"
#include "operation_lock.h"
#include "store_config.h"
#include "sync_events.h"
#include "vector_store.h"
#include "version_checker.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

enum class OperationKind {
    Create,
    Delete,
    Rename,
    Restore
};

const char* to_string(OperationKind kind);

// Outcome of a request-facing mutation. Never thrown; always returned.
struct OperationResult {
    bool success = false;
    std::string operation_id;
    OperationKind kind = OperationKind::Create;
    std::string collection_id;
    std::string new_collection_id;                  // create and rename
    OperationPhase phase_reached = OperationPhase::Pending;
    OperationPhase final_state = OperationPhase::Pending;   // Committed, RolledBack or Failed
    std::string checkpoint_archive_id;
    bool consistency_verified = false;
    bool rollback_performed = false;
    RollbackOutcome rollback_outcome = RollbackOutcome::NotAttempted;
    ErrorKind error_kind = ErrorKind::None;
    std::string message;
    std::map<std::string, std::string> details;
};

/**
 * TransactionalOps - checkpoint -> execute -> verify -> commit/rollback
 * around every structural mutation.
 *
 * Each operation takes the per-id locks of every collection it touches,
 * archives their pre-state, mutates, and runs a scoped consistency check.
 * Any failure after the checkpoint restores the archive before the result is
 * returned. If that restore fails the ids are halted and the result carries
 * ErrorKind::UnrecoverableState.
 *
 * Ordering:
 *   delete - drop physical, then remove the record
 *   rename - copy into a fresh id, write its record, compare counts, then drop the old pair
 *   create - create physical, then write the record
 */
class TransactionalOps {
public:
    struct Stats {
        uint64_t started = 0;
        uint64_t committed = 0;
        uint64_t rolled_back = 0;
        uint64_t failed = 0;
        uint64_t unrecoverable = 0;
    };

    // Called on entering Pending, Checkpointed, Verifying and in the middle
    // of Executing. Throwing from it fails the operation at that point.
    using FaultHook = std::function<void(OperationPhase phase)>;

    TransactionalOps(ConfigContext& config,
                     CatalogRepository& catalog,
                     VectorStoreAdapter& vectors,
                     BackupManager& backups,
                     const ConsistencyChecker& checker,
                     const VersionChecker& version,
                     OperationLockTable& locks,
                     SyncEventQueue& events,
                     Clock clock = system_clock());

    OperationResult create_collection(const std::string& display_name,
                                      const EmbeddingDescriptor& embedding);
    OperationResult delete_collection(const std::string& collection_id);
    OperationResult rename_collection(const std::string& collection_id,
                                      const std::string& new_display_name);
    OperationResult restore_archive(const std::string& archive_id);

    void set_fault_hook(FaultHook hook) { fault_hook_ = std::move(hook); }

    // Operator acknowledgement after manual repair of a halted id
    bool clear_halt(const std::string& collection_id);

    Stats stats() const;

private:
    struct Steps {
        std::vector<std::string> lock_ids;
        std::vector<std::string> checkpoint_ids;    // empty = full checkpoint
        std::vector<std::string> verify_ids;
        bool verify_full = true;
        std::function<void()> precondition;         // under the locks, before the checkpoint
        std::function<void()> execute;
        std::function<void(const ConsistencyReport&)> verify;   // throws to reject
        std::function<void()> commit;               // publishes events
    };

    void run(Steps& steps, OperationResult& result);
    void enter(OperationResult& result, OperationPhase phase);
    void fail(OperationResult& result, ErrorKind kind, const std::string& message);
    void roll_back(OperationResult& result, const std::vector<std::string>& ids);
    void log_operation(const OperationResult& result);
    std::string next_operation_id(OperationKind kind);

    // Throws AlreadyExistsError if another collection uses display_name
    void require_unique_name(const std::string& display_name, const std::string& except_id) const;

    ConfigContext& config_;
    CatalogRepository& catalog_;
    VectorStoreAdapter& vectors_;
    BackupManager& backups_;
    const ConsistencyChecker& checker_;
    const VersionChecker& version_;
    OperationLockTable& locks_;
    SyncEventQueue& events_;
    Clock clock_;
    FaultHook fault_hook_;

    std::atomic<uint64_t> seq_{0};
    std::atomic<uint64_t> started_{0};
    std::atomic<uint64_t> committed_{0};
    std::atomic<uint64_t> rolled_back_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> unrecoverable_{0};
};

} // namespace persist
} // namespace vstore
