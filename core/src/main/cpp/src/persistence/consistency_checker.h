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
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "catalog_store.h"
#include "fs_inspector.h"
#include "store_config.h"
#include "vector_store.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

// Physical directory without a catalog entry
struct OrphanedVector {
    std::string collection_id;
    std::string dir;
    uint64_t est_size = 0;
    uint64_t est_count = 0;
};

// Catalog entry without a physical directory
struct OrphanedCatalogEntry {
    std::string collection_id;
};

struct DimensionMismatch {
    std::string collection_id;
    uint32_t expected = 0;
    uint32_t observed = 0;
};

// Both sides exist but the engine files cannot be read (full checks only)
struct UnreadableCollection {
    std::string collection_id;
    std::string reason;
};

using ConsistencyIssue = std::variant<OrphanedVector,
                                      OrphanedCatalogEntry,
                                      DimensionMismatch,
                                      UnreadableCollection>;

const std::string& issue_collection_id(const ConsistencyIssue& issue);
const char* issue_kind(const ConsistencyIssue& issue);

enum class ConsistencyStatus {
    Consistent,
    Inconsistent,
    Error
};

const char* to_string(ConsistencyStatus status);

struct ConsistencyReport {
    ConsistencyStatus status = ConsistencyStatus::Consistent;
    std::vector<ConsistencyIssue> issues;
    int64_t generated_unix_ms = 0;
    std::string error_message;          // set when status == Error
    size_t catalog_count = 0;
    size_t physical_count = 0;
    std::vector<std::string> scoped_ids;   // empty for a whole-store check
    bool full = false;

    bool consistent() const { return status == ConsistencyStatus::Consistent; }
};

// Per-collection integrity report
struct CollectionValidation {
    std::string collection_id;
    bool has_record = false;
    bool has_physical = false;
    bool files_complete = false;
    bool readable = false;
    bool dimension_ok = false;
    std::optional<uint32_t> expected_dimension;
    std::optional<uint32_t> observed_dimension;
    uint64_t catalog_count = 0;
    uint64_t physical_count = 0;
    std::vector<std::string> problems;

    bool valid() const { return problems.empty(); }
};

/**
 * ConsistencyChecker - outer join of catalog records against physical
 * directories by collection_id.
 *
 * Quick checks only look at directory listings. Full checks additionally
 * sample up to consistency_sample_size items per collection and compare
 * their length with the catalog dimension. A failed scan yields status
 * Error; it is never reported as consistent.
 *
 * Scans take no operation locks, so an issue for an id that is locked at
 * the time may be a transient view of an operation in flight.
 */
class ConsistencyChecker {
public:
    ConsistencyChecker(ConfigContext& config,
                       const CatalogRepository& catalog,
                       const FilesystemInspector& inspector,
                       const VectorStoreAdapter& vectors,
                       Clock clock = system_clock());

    ConsistencyReport check(bool full) const;
    ConsistencyReport check_scoped(const std::vector<std::string>& ids, bool full) const;

    CollectionValidation validate_collection(const std::string& collection_id) const;

private:
    // Appends issues for a collection present on both sides
    void sample_collection(const CollectionRecord& record,
                           const PhysicalEntry& entry,
                           std::vector<ConsistencyIssue>& issues) const;
    static void finish(ConsistencyReport& report);

    ConfigContext& config_;
    const CatalogRepository& catalog_;
    const FilesystemInspector& inspector_;
    const VectorStoreAdapter& vectors_;
    Clock clock_;
};

} // namespace persist
} // namespace vstore
