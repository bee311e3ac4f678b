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

#include "recovery.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include <algorithm>
#include <set>

namespace vstore {
namespace persist {

const char* to_string(RecoveryPriority priority) {
    return priority == RecoveryPriority::High ? "high" : "normal";
}

std::string placeholder_display_name(const std::string& collection_id) {
    std::string prefix = ids::kCollectionPrefix;
    std::string suffix = collection_id;
    if (suffix.compare(0, prefix.size(), prefix) == 0) {
        suffix = suffix.substr(prefix.size());
    }
    return "recovered_" + suffix.substr(0, ids::kPlaceholderFragment);
}

RecoveryPlanner::RecoveryPlanner(ConfigContext& config,
                                 const ConsistencyChecker& checker,
                                 const CatalogRepository& catalog,
                                 const VectorStoreAdapter& vectors,
                                 const FilesystemInspector& inspector,
                                 Clock clock)
    : config_(config), checker_(checker), catalog_(catalog), vectors_(vectors),
      inspector_(inspector), clock_(std::move(clock)) {}

RecoveryCandidate RecoveryPlanner::evaluate(const OrphanedVector& orphan) const {
    RecoveryCandidate c;
    c.collection_id = orphan.collection_id;
    c.dir = orphan.dir;
    c.est_size = orphan.est_size;
    c.est_count = orphan.est_count;

    auto cfg = config_.current();
    c.priority = orphan.est_size > cfg->recovery_high_priority_bytes ? RecoveryPriority::High
                                                                      : RecoveryPriority::Normal;

    auto not_recoverable = [&c](const std::string& reason) {
        c.recoverable = false;
        c.reason_if_not = reason;
        return c;
    };

    auto entry = inspector_.inspect(orphan.collection_id);
    if (!entry) {
        return not_recoverable("directory no longer exists");
    }
    if (entry->has_header && !entry->header_readable) {
        return not_recoverable("corrupt header: " + entry->header_error);
    }
    if (!entry->has_vectors) {
        return not_recoverable(std::string("missing ") + engine::kVectorsFile);
    }

    std::vector<VectorItem> items;
    try {
        items = vectors_.read_items(orphan.collection_id);
    } catch (const IntegrityError& e) {
        return not_recoverable(std::string("unreadable items: ") + e.what());
    } catch (const NotFoundError&) {
        return not_recoverable("directory no longer exists");
    }

    std::optional<uint32_t> dim = entry->dimension;
    for (const auto& item : items) {
        uint32_t d = static_cast<uint32_t>(item.values.size());
        if (!dim) {
            dim = d;
        } else if (*dim != d) {
            return not_recoverable("mixed item dimensions " + std::to_string(*dim) + " and " + std::to_string(d));
        }
    }

    c.recoverable = true;
    c.inferred_dimension = dim;
    c.est_count = items.size();
    for (size_t i = 0; i < items.size() && i < cfg->consistency_sample_size; i++) {
        c.item_ids_sampled.push_back(items[i].id);
    }
    return c;
}

std::vector<RecoveryCandidate> RecoveryPlanner::scan() const {
    ConsistencyReport report = checker_.check(false);
    if (report.status == ConsistencyStatus::Error) {
        throw StorageUnavailableError("recovery scan aborted: " + report.error_message);
    }

    std::vector<RecoveryCandidate> out;
    for (const auto& issue : report.issues) {
        if (const auto* orphan = std::get_if<OrphanedVector>(&issue)) {
            try {
                out.push_back(evaluate(*orphan));
            } catch (const StorageUnavailableError& e) {
                RecoveryCandidate c;
                c.collection_id = orphan->collection_id;
                c.dir = orphan->dir;
                c.est_size = orphan->est_size;
                c.est_count = orphan->est_count;
                c.reason_if_not = e.what();
                out.push_back(c);
            }
        }
    }
    info() << "Recovery scan found " << out.size() << " orphaned director"
           << (out.size() == 1 ? "y" : "ies");
    return out;
}

std::vector<ProposedCollectionRecord> RecoveryPlanner::plan(const std::vector<RecoveryCandidate>& candidates) const {
    std::set<std::string> taken;
    for (const auto& rec : catalog_.list()) {
        taken.insert(rec.display_name);
    }

    std::vector<const RecoveryCandidate*> ordered;
    for (const auto& c : candidates) {
        if (c.recoverable) {
            ordered.push_back(&c);
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const RecoveryCandidate* a, const RecoveryCandidate* b) {
        if (a->priority != b->priority) return a->priority == RecoveryPriority::High;
        if (a->est_size != b->est_size) return a->est_size > b->est_size;
        return a->collection_id < b->collection_id;
    });

    const int64_t now = clock_();
    std::vector<ProposedCollectionRecord> out;
    for (const auto* c : ordered) {
        ProposedCollectionRecord p;
        p.source_dir = c->dir;
        p.priority = c->priority;
        p.est_size = c->est_size;

        CollectionRecord& r = p.record;
        r.collection_id = c->collection_id;
        r.display_name = placeholder_display_name(c->collection_id);
        if (taken.count(r.display_name)) {
            r.display_name = "recovered_" + c->collection_id;
        }
        taken.insert(r.display_name);
        r.embedding = UnknownEmbedding{c->inferred_dimension};
        r.item_count = c->est_count;
        r.created_unix_ms = now;
        r.updated_unix_ms = now;
        r.extra_metadata["recovered"] = "true";
        r.extra_metadata["recovery_time"] = format_iso8601(now);
        r.extra_metadata["original_id"] = c->collection_id;

        out.push_back(std::move(p));
    }
    return out;
}

RecoveryExecutor::RecoveryExecutor(ConfigContext& config,
                                   CatalogRepository& catalog,
                                   const VectorStoreAdapter& vectors,
                                   const FilesystemInspector& inspector,
                                   const VersionChecker& version,
                                   OperationLockTable& locks,
                                   SyncEventQueue* events,
                                   Clock clock)
    : config_(config), catalog_(catalog), vectors_(vectors), inspector_(inspector),
      version_(version), locks_(locks), events_(events), clock_(std::move(clock)) {}

void RecoveryExecutor::log_attempt(const std::string& collection_id, const std::string& status,
                                   const std::string& display_name, const std::string& reason) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("time");
    writer.String(format_iso8601(clock_()).c_str());
    writer.Key("collection_id");
    writer.String(collection_id.c_str());
    writer.Key("status");
    writer.String(status.c_str());
    writer.Key("display_name");
    writer.String(display_name.c_str());
    if (!reason.empty()) {
        writer.Key("reason");
        writer.String(reason.c_str());
    }
    writer.EndObject();

    std::string path = config_.current()->path_in_root(layout::kRecoveryLog);
    FSResult r = PlatformFS::append_line(path, buffer.GetString());
    if (!r.ok) {
        error() << "Cannot append to " << path << ": " << errnoWithDescription(r.err);
    }
}

void RecoveryExecutor::recover_one(const ProposedCollectionRecord& proposal, CollectionRecord* written) {
    const std::string& id = proposal.record.collection_id;
    auto guard = locks_.acquire(id);

    if (locks_.is_halted(id)) {
        throw UnrecoverableStateError("collection is halted", id, OperationPhase::Pending);
    }
    if (catalog_.contains(id)) {
        throw AlreadyExistsError("catalog entry already exists", id);
    }

    // Fresh confirmation: the directory may have changed since planning
    auto entry = inspector_.inspect(id);
    if (!entry) {
        throw NotFoundError("directory disappeared before recovery", id);
    }
    if (entry->has_header && !entry->header_readable) {
        throw IntegrityError("header became unreadable: " + entry->header_error, id);
    }
    if (!entry->has_vectors) {
        throw IntegrityError(std::string("missing ") + engine::kVectorsFile, id);
    }

    CollectionRecord rec = proposal.record;
    rec.item_count = vectors_.count(id);
    auto planned_dim = dimension_of(rec.embedding);
    if (entry->dimension && planned_dim && *entry->dimension != *planned_dim) {
        throw IntegrityError("dimension changed since planning", id);
    }
    if (catalog_.find_by_display_name(rec.display_name)) {
        rec.display_name = "recovered_" + id;
    }

    catalog_.put(rec);
    *written = rec;

    if (events_) {
        events_->publish(SyncEventKind::Recovered, id,
                         {{"display_name", rec.display_name},
                          {"dimension", dimension_label(rec.embedding)},
                          {"item_count", std::to_string(rec.item_count)}});
    }
}

RecoveryResult RecoveryExecutor::execute(const std::vector<ProposedCollectionRecord>& plan,
                                         const std::atomic<bool>* cancel) {
    RecoveryResult result;
    if (plan.empty()) {
        return result;
    }

    CompatibilityReport compat = version_.check();
    if (!version_.mutations_allowed(compat)) {
        std::string why = compat.issues.empty() ? "store version is incompatible" : compat.issues.front();
        warn() << "Refusing to recover " << plan.size() << " collection(s): " << why;
        throw IncompatibleVersionError("mutations blocked: " + why);
    }

    for (size_t i = 0; i < plan.size(); i++) {
        const auto& proposal = plan[i];
        if (cancel && cancel->load(std::memory_order_acquire)) {
            result.cancelled = true;
            for (size_t j = i; j < plan.size(); j++) {
                result.not_attempted.push_back(plan[j].record.collection_id);
            }
            warn() << "Recovery cancelled with " << result.not_attempted.size() << " record(s) left";
            break;
        }

        const std::string& id = proposal.record.collection_id;
        try {
            CollectionRecord written;
            recover_one(proposal, &written);
            result.succeeded.push_back(written);
            log_attempt(id, "recovered", written.display_name, "");
            info() << "Recovered " << id << " as '" << written.display_name << "' ("
                   << written.item_count << " items, dim " << dimension_label(written.embedding) << ")";
        } catch (const StoreError& e) {
            result.failed.push_back(RecoveryFailure{id, e.what()});
            log_attempt(id, "failed", proposal.record.display_name, e.what());
            warn() << "Recovery of " << id << " failed: " << e.what();
        }
    }
    return result;
}

} // namespace persist
} // namespace vstore
