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

#include "catalog_schema.h"
#include "config.h"
#include "errors.h"
#include "../util/log.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"

namespace vstore {
namespace persist {

uint32_t detect_catalog_schema(const rapidjson::Document& doc) {
    if (doc.IsObject() && doc.HasMember("schema_version") && doc["schema_version"].IsUint()) {
        return doc["schema_version"].GetUint();
    }
    // Legacy catalogs predate the version field
    return 1;
}

// Flat provider/model/dimension fields -> nested embedding object
static void upgrade_record_v1(rapidjson::Value& rec, rapidjson::Document::AllocatorType& alloc) {
    if (!rec.IsObject() || rec.HasMember("embedding")) {
        return;
    }

    std::string provider = "unknown";
    if (rec.HasMember("provider") && rec["provider"].IsString()) {
        provider = rec["provider"].GetString();
    }

    rapidjson::Value embedding(rapidjson::kObjectType);
    if (provider == "alibaba" || provider == "ollama" || provider == "sentence_transformers") {
        embedding.AddMember("provider", rapidjson::Value(provider.c_str(), alloc), alloc);
        std::string model = "unknown";
        if (rec.HasMember("model") && rec["model"].IsString()) {
            model = rec["model"].GetString();
        }
        embedding.AddMember("model_name", rapidjson::Value(model.c_str(), alloc), alloc);
    } else {
        embedding.AddMember("provider", "unknown", alloc);
    }

    if (rec.HasMember("dimension") && rec["dimension"].IsUint() && rec["dimension"].GetUint() > 0) {
        embedding.AddMember("dimension", rec["dimension"].GetUint(), alloc);
    } else if (provider == "alibaba") {
        // schema 1 stored alibaba collections without a dimension only at the default
        embedding.AddMember("dimension", 1024u, alloc);
    } else {
        embedding.AddMember("dimension", rapidjson::Value(rapidjson::kNullType), alloc);
    }

    rec.RemoveMember("provider");
    rec.RemoveMember("model");
    rec.RemoveMember("dimension");
    rec.AddMember("embedding", embedding, alloc);

    if (rec.HasMember("metadata")) {
        rapidjson::Value meta(rapidjson::kObjectType);
        if (rec["metadata"].IsObject()) {
            // Only string values survive; schema 2 metadata is a string map
            for (auto it = rec["metadata"].MemberBegin(); it != rec["metadata"].MemberEnd(); ++it) {
                if (it->value.IsString()) {
                    meta.AddMember(rapidjson::Value(it->name, alloc), rapidjson::Value(it->value, alloc), alloc);
                }
            }
        }
        rec.RemoveMember("metadata");
        rec.AddMember("extra_metadata", meta, alloc);
    }
}

void upgrade_catalog_document(rapidjson::Document& doc) {
    if (!doc.IsObject()) {
        throw StorageUnavailableError("catalog document root is not an object");
    }

    uint32_t schema = detect_catalog_schema(doc);
    if (schema > versions::kSchemaVersion) {
        throw IncompatibleVersionError("catalog schema " + std::to_string(schema) +
                                       " is newer than supported schema " +
                                       std::to_string(versions::kSchemaVersion));
    }
    if (schema < versions::kMinReadableSchemaVersion) {
        throw IncompatibleVersionError("catalog schema " + std::to_string(schema) + " is no longer readable");
    }

    auto& alloc = doc.GetAllocator();
    if (schema == 1) {
        if (doc.HasMember("collections") && doc["collections"].IsArray()) {
            for (auto& rec : doc["collections"].GetArray()) {
                upgrade_record_v1(rec, alloc);
            }
        }
        schema = 2;
    }

    if (doc.HasMember("schema_version")) {
        doc["schema_version"].SetUint(schema);
    } else {
        doc.AddMember("schema_version", schema, alloc);
    }
}

std::vector<CollectionRecord> parse_catalog(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str());

    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        throw StorageUnavailableError("catalog document is not valid JSON");
    }

    upgrade_catalog_document(doc);

    std::vector<CollectionRecord> records;
    if (doc.HasMember("collections") && doc["collections"].IsArray()) {
        const auto& cols = doc["collections"];
        records.reserve(cols.Size());
        for (rapidjson::SizeType i = 0; i < cols.Size(); i++) {
            records.push_back(record_from_json(cols[i]));
        }
    }
    return records;
}

std::string serialize_catalog(const std::vector<CollectionRecord>& records, int64_t updated_unix_ms) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("schema_version");
    writer.Uint(versions::kSchemaVersion);
    writer.Key("updated_unix_ms");
    writer.Int64(updated_unix_ms);
    writer.Key("collections");
    writer.StartArray();
    for (const auto& r : records) {
        write_record_json(writer, r);
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

} // namespace persist
} // namespace vstore
