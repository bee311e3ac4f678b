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

#include "collection_record.h"
#include "config.h"
#include "errors.h"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <cctype>
#include <mutex>

namespace vstore {
namespace persist {

std::string generate_collection_id() {
    // random_generator is not thread safe; one shared instance behind a mutex
    static std::mutex mu;
    static boost::uuids::random_generator gen;

    boost::uuids::uuid u;
    {
        std::lock_guard<std::mutex> lock(mu);
        u = gen();
    }

    static const char* hex = "0123456789abcdef";
    std::string id = ids::kCollectionPrefix;
    for (auto byte : u) {
        id.push_back(hex[(byte >> 4) & 0x0F]);
        id.push_back(hex[byte & 0x0F]);
    }
    return id;
}

bool is_valid_collection_id(const std::string& id) {
    if (id.empty() || id.size() > ids::kMaxIdLength) {
        return false;
    }
    if (id == "." || id == "..") {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

CollectionRecord record_from_json(const rapidjson::Value& v) {
    if (!v.IsObject()) {
        throw InvalidArgumentError("collection record must be an object");
    }

    CollectionRecord r;
    if (!v.HasMember("collection_id") || !v["collection_id"].IsString()) {
        throw InvalidArgumentError("collection record without collection_id");
    }
    r.collection_id = v["collection_id"].GetString();
    if (!is_valid_collection_id(r.collection_id)) {
        throw InvalidArgumentError("invalid collection_id '" + r.collection_id + "'", r.collection_id);
    }

    if (v.HasMember("display_name") && v["display_name"].IsString()) {
        r.display_name.assign(v["display_name"].GetString(), v["display_name"].GetStringLength());
    }
    if (!v.HasMember("embedding")) {
        throw InvalidArgumentError("collection record without embedding", r.collection_id);
    }
    r.embedding = embedding_from_json(v["embedding"]);

    if (v.HasMember("item_count") && v["item_count"].IsUint64()) {
        r.item_count = v["item_count"].GetUint64();
    }
    if (v.HasMember("created_unix_ms") && v["created_unix_ms"].IsInt64()) {
        r.created_unix_ms = v["created_unix_ms"].GetInt64();
    }
    if (v.HasMember("updated_unix_ms") && v["updated_unix_ms"].IsInt64()) {
        r.updated_unix_ms = v["updated_unix_ms"].GetInt64();
    }
    if (v.HasMember("extra_metadata") && v["extra_metadata"].IsObject()) {
        for (auto it = v["extra_metadata"].MemberBegin(); it != v["extra_metadata"].MemberEnd(); ++it) {
            if (it->value.IsString()) {
                r.extra_metadata[it->name.GetString()] = it->value.GetString();
            }
        }
    }
    return r;
}

} // namespace persist
} // namespace vstore
