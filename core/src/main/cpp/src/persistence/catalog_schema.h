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
#include <string>
#include <vector>
#include "collection_record.h"
#include "rapidjson/document.h"

namespace vstore {
namespace persist {

/*
 * Catalog documents
 *
 *   schema 1: { "schema_version": 1 (or absent), "collections": [
 *               { "collection_id", "display_name", "provider", "model",
 *                 "dimension", "item_count", "created_unix_ms",
 *                 "updated_unix_ms", "metadata" } ] }
 *
 *   schema 2: { "schema_version": 2, "updated_unix_ms", "collections": [
 *               { "collection_id", "display_name", "embedding": {...},
 *                 "item_count", "created_unix_ms", "updated_unix_ms",
 *                 "extra_metadata" } ] }
 *
 * The same layout is used for catalog.json and for archive snapshots.
 */

uint32_t detect_catalog_schema(const rapidjson::Document& doc);

// Rewrites doc in place up to versions::kSchemaVersion. Idempotent.
// Throws IncompatibleVersionError for documents newer than this build.
void upgrade_catalog_document(rapidjson::Document& doc);

// Parse any readable schema; throws StorageUnavailableError on malformed JSON
// and InvalidArgumentError on malformed records.
std::vector<CollectionRecord> parse_catalog(const std::string& json_str);

std::string serialize_catalog(const std::vector<CollectionRecord>& records, int64_t updated_unix_ms);

} // namespace persist
} // namespace vstore
