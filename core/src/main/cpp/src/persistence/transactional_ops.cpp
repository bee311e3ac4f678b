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

#include "transactional_ops.h"
#include "config.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include <algorithm>
#include <optional>
#include <set>

namespace vstore {
namespace persist {

namespace {

void require_consistent(const ConsistencyReport& post) {
    if (post.consistent()) {
        return;
    }
    std::string what = "post-operation check found " + std::to_string(post.issues.size()) + " issue(s):";
    for (const auto& issue : post.issues) {
        what += std::string(" ") + issue_kind(issue) + "(" + issue_collection_id(issue) + ")";
    }
    std::string id = post.issues.empty() ? std::string() : issue_collection_id(post.issues.front());
    throw IntegrityError(what, id);
}

} // namespace

const char* to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Create:  return "create";
        case OperationKind::Delete:  return "delete";
        case OperationKind::Rename:  return "rename";
        case OperationKind::Restore: return "restore";
    }
    return "unknown";
}

TransactionalOps::TransactionalOps(ConfigContext& config,
                                   CatalogRepository& catalog,
                                   VectorStoreAdapter& vectors,
                                   BackupManager& backups,
                                   const ConsistencyChecker& checker,
                                   const VersionChecker& version,
                                   OperationLockTable& locks,
                                   SyncEventQueue& events,
                                   Clock clock)
    : config_(config), catalog_(catalog), vectors_(vectors), backups_(backups),
      checker_(checker), version_(version), locks_(locks), events_(events),
      clock_(std::move(clock)) {}

std::string TransactionalOps::next_operation_id(OperationKind kind) {
    uint64_t seq = seq_.fetch_add(1, std::memory_order_relaxed) + 1;
    return std::string(to_string(kind)) + "_" + format_compact(clock_()) + "_" + std::to_string(seq);
}

void TransactionalOps::enter(OperationResult& result, OperationPhase phase) {
    result.phase_reached = phase;
    trace() << result.operation_id << " -> " << to_string(phase);
    if (fault_hook_ && phase != OperationPhase::Executing && phase != OperationPhase::Committed) {
        fault_hook_(phase);
    }
}

void TransactionalOps::fail(OperationResult& result, ErrorKind kind, const std::string& message) {
    result.success = false;
    result.error_kind = kind;
    result.message = message;
    result.details["failed_phase"] = to_string(result.phase_reached);
    error() << "Operation " << result.operation_id << " failed in phase "
            << to_string(result.phase_reached) << ": " << message;
}

void TransactionalOps::roll_back(OperationResult& result, const std::vector<std::string>& ids) {
    result.rollback_performed = true;
    try {
        backups_.restore(result.checkpoint_archive_id);
        result.rollback_outcome = RollbackOutcome::Succeeded;
        result.final_state = OperationPhase::RolledBack;
        rolled_back_.fetch_add(1, std::memory_order_relaxed);
        warn() << "Operation " << result.operation_id << " rolled back from "
               << result.checkpoint_archive_id;
    } catch (const std::exception& e) {
        result.rollback_outcome = RollbackOutcome::Failed;
        result.final_state = OperationPhase::Failed;
        result.error_kind = ErrorKind::UnrecoverableState;
        result.message += std::string("; rollback failed: ") + e.what();
        unrecoverable_.fetch_add(1, std::memory_order_relaxed);
        for (const auto& id : ids) {
            locks_.halt(id, result.operation_id + ": " + result.message);
        }
    }
}

void TransactionalOps::run(Steps& steps, OperationResult& result) {
    started_.fetch_add(1, std::memory_order_relaxed);
    if (result.operation_id.empty()) {
        result.operation_id = next_operation_id(result.kind);
    }

    OperationLockTable::Guard guard;
    bool checkpointed = false;
    try {
        enter(result, OperationPhase::Pending);

        CompatibilityReport compat = version_.check();
        if (!version_.mutations_allowed(compat)) {
            std::string why = compat.issues.empty() ? "store version is incompatible" : compat.issues.front();
            throw IncompatibleVersionError("mutations blocked: " + why, result.collection_id);
        }

        guard = locks_.acquire_all(steps.lock_ids);
        for (const auto& id : steps.lock_ids) {
            if (auto reason = locks_.halt_reason(id)) {
                throw UnrecoverableStateError("collection is halted: " + *reason, id, OperationPhase::Pending);
            }
        }

        if (steps.precondition) {
            steps.precondition();
        }

        ConsistencyReport pre = checker_.check_scoped(steps.verify_ids, false);
        if (pre.status == ConsistencyStatus::Error) {
            throw StorageUnavailableError("pre-operation check failed: " + pre.error_message,
                                          result.collection_id);
        }

        BackupArchive archive = backups_.checkpoint(steps.checkpoint_ids, result.operation_id);
        result.checkpoint_archive_id = archive.backup_id;
        checkpointed = true;
        enter(result, OperationPhase::Checkpointed);

        enter(result, OperationPhase::Executing);
        steps.execute();

        enter(result, OperationPhase::Verifying);
        ConsistencyReport post = checker_.check_scoped(steps.verify_ids, steps.verify_full);
        if (post.status == ConsistencyStatus::Error) {
            throw StorageUnavailableError("verification check failed: " + post.error_message,
                                          result.collection_id);
        }
        if (steps.verify) {
            steps.verify(post);
        } else {
            require_consistent(post);
        }
        result.consistency_verified = true;

        enter(result, OperationPhase::Committed);
        if (steps.commit) {
            steps.commit();
        }
        result.success = true;
        result.final_state = OperationPhase::Committed;
        committed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const StoreError& e) {
        fail(result, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(result, ErrorKind::Internal, e.what());
    }

    if (!result.success) {
        if (checkpointed) {
            roll_back(result, steps.lock_ids);
        } else {
            result.final_state = OperationPhase::Failed;
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    guard.release();

    if (result.success && !config_.current()->keep_checkpoint_after_commit) {
        try {
            backups_.remove(result.checkpoint_archive_id);
        } catch (const StoreError& e) {
            warn() << "Cannot discard checkpoint " << result.checkpoint_archive_id << ": " << e.what();
        }
    }

    if (result.success) {
        info() << "Operation " << result.operation_id << " committed";
    }
    log_operation(result);
}

void TransactionalOps::require_unique_name(const std::string& display_name, const std::string& except_id) const {
    for (const auto& rec : catalog_.list()) {
        if (rec.display_name == display_name && rec.collection_id != except_id) {
            throw AlreadyExistsError("display name '" + display_name + "' is used by " + rec.collection_id,
                                     rec.collection_id);
        }
    }
}

OperationResult TransactionalOps::create_collection(const std::string& display_name,
                                                    const EmbeddingDescriptor& embedding) {
    OperationResult result;
    result.kind = OperationKind::Create;
    const std::string id = generate_collection_id();
    result.collection_id = id;
    result.new_collection_id = id;

    Steps s;
    s.lock_ids = {id};
    s.checkpoint_ids = {id};
    s.verify_ids = {id};

    s.precondition = [&] {
        if (display_name.empty()) {
            throw InvalidArgumentError("display name must not be empty");
        }
        validate_embedding(embedding);
        if (!dimension_of(embedding)) {
            throw InvalidArgumentError("creating a collection requires a known dimension");
        }
        require_unique_name(display_name, std::string());
        if (catalog_.contains(id) || vectors_.exists(id)) {
            throw AlreadyExistsError("collection id already in use", id);
        }
    };

    s.execute = [&] {
        const int64_t now = clock_();
        vectors_.create(id, *dimension_of(embedding));
        if (fault_hook_) fault_hook_(OperationPhase::Executing);

        CollectionRecord rec;
        rec.collection_id = id;
        rec.display_name = display_name;
        rec.embedding = embedding;
        rec.created_unix_ms = now;
        rec.updated_unix_ms = now;
        catalog_.put(rec);
    };

    s.verify = [&](const ConsistencyReport& post) {
        require_consistent(post);
        require_unique_name(display_name, id);
    };

    s.commit = [&] {
        events_.publish(SyncEventKind::Created, id,
                        {{"display_name", display_name},
                         {"provider", provider_name(embedding)},
                         {"dimension", dimension_label(embedding)}});
    };

    run(s, result);
    return result;
}

OperationResult TransactionalOps::delete_collection(const std::string& collection_id) {
    OperationResult result;
    result.kind = OperationKind::Delete;
    result.collection_id = collection_id;
    const std::string& id = collection_id;

    std::optional<CollectionRecord> before;
    std::optional<uint64_t> removed_items;
    Steps s;
    s.lock_ids = {id};
    s.checkpoint_ids = {id};
    s.verify_ids = {id};
    s.verify_full = false;

    s.precondition = [&] {
        if (!is_valid_collection_id(id)) {
            throw InvalidArgumentError("invalid collection_id '" + id + "'", id);
        }
        before = catalog_.get(id);
        bool physical = vectors_.exists(id);
        if (!before && !physical) {
            throw NotFoundError("collection " + id + " not found", id);
        }
        // The catalog's item_count is not maintained by item writes
        if (physical) {
            try {
                removed_items = vectors_.count(id);
            } catch (const StoreError& e) {
                debug() << "Cannot count items of " << id << " before delete: " << e.what();
            }
        }
        if (!removed_items && before) {
            removed_items = before->item_count;
        }
    };

    // Physical first: a crash in between leaves an orphaned catalog entry, never lost data
    s.execute = [&] {
        if (vectors_.exists(id)) {
            vectors_.drop(id);
        }
        if (fault_hook_) fault_hook_(OperationPhase::Executing);
        catalog_.remove(id);
    };

    s.verify = [&](const ConsistencyReport& post) {
        require_consistent(post);
        if (catalog_.contains(id) || vectors_.exists(id)) {
            throw IntegrityError("collection still present after delete", id);
        }
    };

    s.commit = [&] {
        std::map<std::string, std::string> details;
        if (before) {
            details["display_name"] = before->display_name;
        }
        if (removed_items) {
            details["item_count"] = std::to_string(*removed_items);
        }
        events_.publish(SyncEventKind::Deleted, id, std::move(details));
    };

    run(s, result);
    return result;
}

OperationResult TransactionalOps::rename_collection(const std::string& collection_id,
                                                    const std::string& new_display_name) {
    OperationResult result;
    result.kind = OperationKind::Rename;
    result.collection_id = collection_id;
    const std::string& old_id = collection_id;
    const std::string new_id = generate_collection_id();
    result.new_collection_id = new_id;

    CollectionRecord old_rec;
    uint64_t copied = 0;

    Steps s;
    s.lock_ids = {old_id, new_id};
    s.checkpoint_ids = {old_id, new_id};
    s.verify_ids = {old_id, new_id};

    s.precondition = [&] {
        if (!is_valid_collection_id(old_id)) {
            throw InvalidArgumentError("invalid collection_id '" + old_id + "'", old_id);
        }
        if (new_display_name.empty()) {
            throw InvalidArgumentError("display name must not be empty", old_id);
        }
        auto rec = catalog_.get(old_id);
        if (!rec) {
            throw NotFoundError("collection " + old_id + " not found", old_id);
        }
        if (!vectors_.exists(old_id)) {
            throw NotFoundError("physical collection " + old_id + " is missing", old_id);
        }
        if (rec->display_name == new_display_name) {
            throw InvalidArgumentError("display name is unchanged", old_id);
        }
        require_unique_name(new_display_name, old_id);
        old_rec = *rec;
    };

    // Copy-then-swap: the old pair is untouched until the new one is complete
    s.execute = [&] {
        copied = vectors_.copy_collection(old_id, new_id);

        CollectionRecord next = old_rec;
        next.collection_id = new_id;
        next.display_name = new_display_name;
        next.item_count = copied;
        next.updated_unix_ms = clock_();
        next.extra_metadata["renamed_from"] = old_id;
        catalog_.put(next);

        if (fault_hook_) fault_hook_(OperationPhase::Executing);

        uint64_t old_count = vectors_.count(old_id);
        uint64_t new_count = vectors_.count(new_id);
        if (old_count != new_count) {
            throw IntegrityError("item count mismatch after copy: " + std::to_string(old_count) +
                                 " vs " + std::to_string(new_count), new_id);
        }

        vectors_.drop(old_id);
        catalog_.remove(old_id);
    };

    s.verify = [&](const ConsistencyReport& post) {
        require_consistent(post);
        if (catalog_.contains(old_id) || vectors_.exists(old_id)) {
            throw IntegrityError("old collection still present after rename", old_id);
        }
        if (!catalog_.contains(new_id) || !vectors_.exists(new_id)) {
            throw IntegrityError("renamed collection is missing", new_id);
        }
        require_unique_name(new_display_name, new_id);
    };

    s.commit = [&] {
        events_.publish(SyncEventKind::Renamed, new_id,
                        {{"old_collection_id", old_id},
                         {"old_display_name", old_rec.display_name},
                         {"new_display_name", new_display_name},
                         {"item_count", std::to_string(copied)}});
    };

    run(s, result);
    result.details["item_count"] = std::to_string(copied);
    return result;
}

OperationResult TransactionalOps::restore_archive(const std::string& archive_id) {
    OperationResult result;
    result.kind = OperationKind::Restore;
    result.details["archive_id"] = archive_id;

    std::optional<BackupArchive> archive;
    try {
        archive = backups_.get(archive_id);
    } catch (const StoreError& e) {
        result.operation_id = next_operation_id(result.kind);
        started_.fetch_add(1, std::memory_order_relaxed);
        fail(result, e.kind(), e.what());
        result.final_state = OperationPhase::Failed;
        failed_.fetch_add(1, std::memory_order_relaxed);
        log_operation(result);
        return result;
    }
    if (!archive) {
        result.operation_id = next_operation_id(result.kind);
        started_.fetch_add(1, std::memory_order_relaxed);
        fail(result, ErrorKind::NotFound, "backup " + archive_id + " not found");
        result.final_state = OperationPhase::Failed;
        failed_.fetch_add(1, std::memory_order_relaxed);
        log_operation(result);
        return result;
    }

    const bool full = archive->type == ArchiveType::Full;
    std::set<std::string> ids;
    for (const auto& src : archive->sources) {
        ids.insert(src.collection_id);
    }
    std::vector<std::string> source_ids(ids.begin(), ids.end());
    if (full) {
        // A full restore also removes what was created after the archive
        for (const auto& rec : catalog_.list()) ids.insert(rec.collection_id);
        try {
            for (const auto& id : vectors_.list_collections()) ids.insert(id);
        } catch (const StoreError& e) {
            warn() << "Cannot list physical collections before restore: " << e.what();
        }
    }
    if (source_ids.size() == 1) {
        result.collection_id = source_ids.front();
    }

    std::set<std::string> present_before;
    Steps s;
    s.lock_ids.assign(ids.begin(), ids.end());
    s.checkpoint_ids = full ? std::vector<std::string>() : source_ids;
    s.verify_ids = s.lock_ids;
    s.verify_full = false;

    s.precondition = [&] {
        for (const auto& id : s.lock_ids) {
            if (catalog_.contains(id) || vectors_.exists(id)) {
                present_before.insert(id);
            }
        }
    };

    s.execute = [&] {
        backups_.restore(archive_id);
        if (fault_hook_) fault_hook_(OperationPhase::Executing);
    };

    // The archived state itself may have been half-present; only demand what it recorded
    s.verify = [&](const ConsistencyReport& post) {
        std::set<std::string> tolerated;
        for (const auto& src : archive->sources) {
            if (catalog_.contains(src.collection_id) != src.had_record ||
                vectors_.exists(src.collection_id) != src.had_physical) {
                throw IntegrityError("restored state differs from archive", src.collection_id);
            }
            if (src.had_record != src.had_physical) {
                tolerated.insert(src.collection_id);
            }
        }
        if (full) {
            for (const auto& id : s.lock_ids) {
                bool archived = std::find(source_ids.begin(), source_ids.end(), id) != source_ids.end();
                if (!archived && (catalog_.contains(id) || vectors_.exists(id))) {
                    throw IntegrityError("collection not in the archive survived a full restore", id);
                }
            }
        }
        for (const auto& issue : post.issues) {
            if (!tolerated.count(issue_collection_id(issue))) {
                require_consistent(post);
            }
        }
    };

    s.commit = [&] {
        for (const auto& id : s.lock_ids) {
            bool present = catalog_.contains(id) || vectors_.exists(id);
            if (present) {
                events_.publish(SyncEventKind::Created, id, {{"restored_from", archive_id}});
            } else if (present_before.count(id)) {
                events_.publish(SyncEventKind::Deleted, id, {{"restored_from", archive_id}});
            }
        }
    };

    run(s, result);
    return result;
}

void TransactionalOps::log_operation(const OperationResult& result) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("time");
    writer.String(format_iso8601(clock_()).c_str());
    writer.Key("operation_id");
    writer.String(result.operation_id.c_str());
    writer.Key("kind");
    writer.String(to_string(result.kind));
    writer.Key("collection_id");
    writer.String(result.collection_id.c_str());
    if (!result.new_collection_id.empty()) {
        writer.Key("new_collection_id");
        writer.String(result.new_collection_id.c_str());
    }
    writer.Key("success");
    writer.Bool(result.success);
    writer.Key("phase_reached");
    writer.String(to_string(result.phase_reached));
    writer.Key("final_state");
    writer.String(to_string(result.final_state));
    writer.Key("checkpoint");
    writer.String(result.checkpoint_archive_id.c_str());
    writer.Key("rollback");
    writer.String(to_string(result.rollback_outcome));
    if (!result.success) {
        writer.Key("error_kind");
        writer.String(to_string(result.error_kind));
        writer.Key("message");
        writer.String(result.message.c_str());
    }
    writer.EndObject();

    std::string path = config_.current()->path_in_root(layout::kOperationsLog);
    FSResult r = PlatformFS::append_line(path, buffer.GetString());
    if (!r.ok) {
        error() << "Cannot append to " << path << ": " << errnoWithDescription(r.err);
    }
}

bool TransactionalOps::clear_halt(const std::string& collection_id) {
    bool cleared = locks_.clear_halt(collection_id);
    if (cleared) {
        info() << "Halt cleared for " << collection_id;
    }
    return cleared;
}

TransactionalOps::Stats TransactionalOps::stats() const {
    Stats s;
    s.started = started_.load(std::memory_order_relaxed);
    s.committed = committed_.load(std::memory_order_relaxed);
    s.rolled_back = rolled_back_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.unrecoverable = unrecoverable_.load(std::memory_order_relaxed);
    return s;
}

} // namespace persist
} // namespace vstore
