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

#include "consistency_checker.h"
#include "config.h"
#include "errors.h"
#include "../util/log.h"
#include <algorithm>
#include <map>
#include <set>

namespace vstore {
namespace persist {

const std::string& issue_collection_id(const ConsistencyIssue& issue) {
    return std::visit([](const auto& i) -> const std::string& { return i.collection_id; }, issue);
}

const char* issue_kind(const ConsistencyIssue& issue) {
    switch (issue.index()) {
        case 0: return "orphaned_vector";
        case 1: return "orphaned_catalog_entry";
        case 2: return "dimension_mismatch";
        case 3: return "unreadable_collection";
    }
    return "unknown";
}

const char* to_string(ConsistencyStatus status) {
    switch (status) {
        case ConsistencyStatus::Consistent:   return "consistent";
        case ConsistencyStatus::Inconsistent: return "inconsistent";
        case ConsistencyStatus::Error:        return "error";
    }
    return "unknown";
}

ConsistencyChecker::ConsistencyChecker(ConfigContext& config,
                                       const CatalogRepository& catalog,
                                       const FilesystemInspector& inspector,
                                       const VectorStoreAdapter& vectors,
                                       Clock clock)
    : config_(config), catalog_(catalog), inspector_(inspector), vectors_(vectors),
      clock_(std::move(clock)) {}

void ConsistencyChecker::finish(ConsistencyReport& report) {
    if (report.status == ConsistencyStatus::Error) {
        return;
    }
    report.status = report.issues.empty() ? ConsistencyStatus::Consistent : ConsistencyStatus::Inconsistent;
}

void ConsistencyChecker::sample_collection(const CollectionRecord& record,
                                           const PhysicalEntry& entry,
                                           std::vector<ConsistencyIssue>& issues) const {
    const std::string& id = record.collection_id;
    auto expected = dimension_of(record.embedding);

    if (entry.has_header && !entry.header_readable) {
        issues.push_back(UnreadableCollection{id, entry.header_error});
        return;
    }
    if (!entry.has_vectors) {
        issues.push_back(UnreadableCollection{id, "missing " + std::string(engine::kVectorsFile)});
        return;
    }
    if (expected && entry.dimension && *entry.dimension != *expected) {
        issues.push_back(DimensionMismatch{id, *expected, *entry.dimension});
        return;
    }

    size_t sample = config_.current()->consistency_sample_size;
    std::vector<VectorItem> items;
    try {
        items = vectors_.read_items(id, sample);
    } catch (const NotFoundError&) {
        // Dropped between the scan and the sample; the join already saw it
        return;
    } catch (const IntegrityError& e) {
        issues.push_back(UnreadableCollection{id, e.what()});
        return;
    }

    if (!expected) {
        return;
    }
    for (const auto& item : items) {
        if (item.values.size() != *expected) {
            issues.push_back(DimensionMismatch{id, *expected, static_cast<uint32_t>(item.values.size())});
            return;
        }
    }
}

ConsistencyReport ConsistencyChecker::check(bool full) const {
    ConsistencyReport report;
    report.full = full;
    report.generated_unix_ms = clock_();

    std::vector<PhysicalEntry> physical;
    try {
        physical = inspector_.scan();
    } catch (const StoreError& e) {
        report.status = ConsistencyStatus::Error;
        report.error_message = e.what();
        error() << "Consistency check failed: " << e.what();
        return report;
    }

    std::vector<CollectionRecord> records = catalog_.list();
    report.catalog_count = records.size();
    report.physical_count = physical.size();

    std::map<std::string, const PhysicalEntry*> by_id;
    for (const auto& e : physical) {
        by_id[e.collection_id] = &e;
    }

    std::set<std::string> seen;
    try {
        for (const auto& rec : records) {
            seen.insert(rec.collection_id);
            auto it = by_id.find(rec.collection_id);
            if (it == by_id.end()) {
                report.issues.push_back(OrphanedCatalogEntry{rec.collection_id});
                continue;
            }
            if (full) {
                sample_collection(rec, *it->second, report.issues);
            }
        }
    } catch (const StorageUnavailableError& e) {
        report.status = ConsistencyStatus::Error;
        report.error_message = e.what();
        error() << "Consistency check failed while sampling: " << e.what();
        return report;
    }

    for (const auto& e : physical) {
        if (!seen.count(e.collection_id)) {
            report.issues.push_back(OrphanedVector{e.collection_id, e.dir, e.size_bytes, e.est_count});
        }
    }

    finish(report);
    if (!report.consistent()) {
        info() << "Consistency check (" << (full ? "full" : "quick") << "): "
               << report.issues.size() << " issue(s)";
    }
    return report;
}

ConsistencyReport ConsistencyChecker::check_scoped(const std::vector<std::string>& ids, bool full) const {
    ConsistencyReport report;
    report.full = full;
    report.generated_unix_ms = clock_();
    report.scoped_ids = ids;

    try {
        for (const auto& id : ids) {
            auto rec = catalog_.get(id);
            auto entry = inspector_.inspect(id);
            if (rec) report.catalog_count++;
            if (entry) report.physical_count++;

            if (rec && !entry) {
                report.issues.push_back(OrphanedCatalogEntry{id});
            } else if (!rec && entry) {
                report.issues.push_back(OrphanedVector{id, entry->dir, entry->size_bytes, entry->est_count});
            } else if (rec && entry && full) {
                sample_collection(*rec, *entry, report.issues);
            }
        }
    } catch (const StoreError& e) {
        report.status = ConsistencyStatus::Error;
        report.error_message = e.what();
        report.issues.clear();
        error() << "Scoped consistency check failed: " << e.what();
        return report;
    }

    finish(report);
    return report;
}

CollectionValidation ConsistencyChecker::validate_collection(const std::string& collection_id) const {
    CollectionValidation v;
    v.collection_id = collection_id;

    auto rec = catalog_.get(collection_id);
    v.has_record = rec.has_value();
    if (rec) {
        v.expected_dimension = dimension_of(rec->embedding);
        v.catalog_count = rec->item_count;
    } else {
        v.problems.push_back("no catalog record");
    }

    std::optional<PhysicalEntry> entry;
    try {
        entry = inspector_.inspect(collection_id);
    } catch (const StoreError& e) {
        v.problems.push_back(e.what());
        return v;
    }
    v.has_physical = entry.has_value();
    if (!entry) {
        v.problems.push_back("no physical collection");
        return v;
    }

    v.files_complete = entry->complete();
    if (!v.files_complete) {
        v.problems.push_back("engine files incomplete");
    }
    if (entry->has_header && !entry->header_readable) {
        v.problems.push_back("header unreadable: " + entry->header_error);
    }
    v.observed_dimension = entry->dimension;

    try {
        v.physical_count = vectors_.count(collection_id);
        auto items = vectors_.read_items(collection_id, config_.current()->consistency_sample_size);
        v.readable = true;
        if (!v.observed_dimension && !items.empty()) {
            v.observed_dimension = static_cast<uint32_t>(items.front().values.size());
        }
        for (const auto& item : items) {
            if (v.observed_dimension && item.values.size() != *v.observed_dimension) {
                v.problems.push_back("item '" + item.id + "' has dimension " +
                                     std::to_string(item.values.size()));
                break;
            }
        }
    } catch (const StoreError& e) {
        v.problems.push_back(std::string("unreadable: ") + e.what());
    }

    if (v.expected_dimension && v.observed_dimension) {
        v.dimension_ok = (*v.expected_dimension == *v.observed_dimension);
        if (!v.dimension_ok) {
            v.problems.push_back("dimension " + std::to_string(*v.observed_dimension) +
                                 " differs from catalog " + std::to_string(*v.expected_dimension));
        }
    } else {
        // Nothing to compare against
        v.dimension_ok = true;
    }

    if (v.has_record && v.readable && v.catalog_count != v.physical_count) {
        v.problems.push_back("catalog item_count " + std::to_string(v.catalog_count) +
                             " differs from physical " + std::to_string(v.physical_count));
    }
    return v;
}

} // namespace persist
} // namespace vstore
