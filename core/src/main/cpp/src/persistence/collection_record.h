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
#include <map>
#include <string>
#include "embedding_descriptor.h"
#include "rapidjson/document.h"

namespace vstore {
namespace persist {

/**
 * Catalog entry for one collection.
 *
 * collection_id is immutable and names the physical directory; a rename
 * produces a new record under a fresh id.
 */
struct CollectionRecord {
    std::string collection_id;
    std::string display_name;          // arbitrary UTF-8
    EmbeddingDescriptor embedding = SentenceTransformerEmbedding{};
    uint64_t item_count = 0;           // cached, refreshed by mutations
    int64_t created_unix_ms = 0;
    int64_t updated_unix_ms = 0;
    std::map<std::string, std::string> extra_metadata;

    bool operator==(const CollectionRecord& o) const {
        return collection_id == o.collection_id && display_name == o.display_name &&
               embedding == o.embedding && item_count == o.item_count &&
               created_unix_ms == o.created_unix_ms && updated_unix_ms == o.updated_unix_ms &&
               extra_metadata == o.extra_metadata;
    }
    bool operator!=(const CollectionRecord& o) const { return !(*this == o); }
};

// col_ + 32 hex digits from a random UUID
std::string generate_collection_id();

// [A-Za-z0-9_-]{1,128}, never "." or ".."
bool is_valid_collection_id(const std::string& id);

// Throws InvalidArgumentError on a missing or malformed field
CollectionRecord record_from_json(const rapidjson::Value& v);

template <typename Writer>
void write_record_json(Writer& writer, const CollectionRecord& r) {
    writer.StartObject();
    writer.Key("collection_id");
    writer.String(r.collection_id.c_str());
    writer.Key("display_name");
    writer.String(r.display_name.c_str(), static_cast<rapidjson::SizeType>(r.display_name.size()));
    writer.Key("embedding");
    write_embedding_json(writer, r.embedding);
    writer.Key("item_count");
    writer.Uint64(r.item_count);
    writer.Key("created_unix_ms");
    writer.Int64(r.created_unix_ms);
    writer.Key("updated_unix_ms");
    writer.Int64(r.updated_unix_ms);
    writer.Key("extra_metadata");
    writer.StartObject();
    for (const auto& kv : r.extra_metadata) {
        writer.Key(kv.first.c_str());
        writer.String(kv.second.c_str());
    }
    writer.EndObject();
    writer.EndObject();
}

} // namespace persist
} // namespace vstore
