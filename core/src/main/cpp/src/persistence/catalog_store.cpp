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

#include "catalog_store.h"
#include "catalog_schema.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

JsonCatalogStore::JsonCatalogStore(const std::string& data_root, Clock clock)
    : data_root_(data_root), clock_(std::move(clock)) {}

std::string JsonCatalogStore::get_catalog_path() const {
    fs::path p(data_root_);
    p /= layout::kCatalogFile;
    return p.string();
}

void JsonCatalogStore::load() {
    std::string catalog_path = get_catalog_path();

    std::error_code ec;
    if (!fs::exists(catalog_path, ec)) {
        if (ec) {
            throw StorageUnavailableError("cannot stat " + catalog_path + ": " + ec.message());
        }
        // Fresh store
        std::lock_guard<std::mutex> lock(mu_);
        records_.clear();
        return;
    }

    std::ifstream file(catalog_path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageUnavailableError("cannot open " + catalog_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    std::vector<CollectionRecord> parsed;
    try {
        parsed = parse_catalog(buffer.str());
    } catch (const InvalidArgumentError& e) {
        throw StorageUnavailableError(std::string("catalog contains a malformed record: ") + e.what(),
                                      e.collection_id());
    }

    std::map<std::string, CollectionRecord> next;
    for (auto& r : parsed) {
        if (next.count(r.collection_id)) {
            warn() << "Duplicate catalog entry for " << r.collection_id << ", keeping the last one";
        }
        next[r.collection_id] = std::move(r);
    }

    std::lock_guard<std::mutex> lock(mu_);
    records_.swap(next);
    debug() << "Loaded catalog with " << records_.size() << " collections from " << catalog_path;
}

void JsonCatalogStore::reload() {
    load();
}

std::optional<CollectionRecord> JsonCatalogStore::get(const std::string& collection_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(collection_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonCatalogStore::contains(const std::string& collection_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.count(collection_id) != 0;
}

std::vector<CollectionRecord> JsonCatalogStore::list() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<CollectionRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        out.push_back(kv.second);
    }
    return out;
}

std::optional<CollectionRecord> JsonCatalogStore::find_by_display_name(const std::string& display_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : records_) {
        if (kv.second.display_name == display_name) {
            return kv.second;
        }
    }
    return std::nullopt;
}

size_t JsonCatalogStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.size();
}

void JsonCatalogStore::put(const CollectionRecord& record) {
    if (!is_valid_collection_id(record.collection_id)) {
        throw InvalidArgumentError("invalid collection_id '" + record.collection_id + "'", record.collection_id);
    }
    validate_embedding(record.embedding);

    std::lock_guard<std::mutex> lock(mu_);
    auto next = records_;
    next[record.collection_id] = record;
    persist_locked(next);
    records_.swap(next);
}

bool JsonCatalogStore::remove(const std::string& collection_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (records_.count(collection_id) == 0) {
        return false;
    }
    auto next = records_;
    next.erase(collection_id);
    persist_locked(next);
    records_.swap(next);
    return true;
}

void JsonCatalogStore::replace_all(const std::vector<CollectionRecord>& records) {
    std::map<std::string, CollectionRecord> next;
    for (const auto& r : records) {
        if (!is_valid_collection_id(r.collection_id)) {
            throw InvalidArgumentError("invalid collection_id '" + r.collection_id + "'", r.collection_id);
        }
        next[r.collection_id] = r;
    }

    std::lock_guard<std::mutex> lock(mu_);
    persist_locked(next);
    records_.swap(next);
}

void JsonCatalogStore::persist_locked(const std::map<std::string, CollectionRecord>& next) {
    FSResult dir_res = PlatformFS::ensure_directory(data_root_);
    if (!dir_res.ok) {
        throw StorageUnavailableError("cannot create data root " + data_root_ + ": " +
                                      errnoWithDescription(dir_res.err));
    }

    std::vector<CollectionRecord> ordered;
    ordered.reserve(next.size());
    for (const auto& kv : next) {
        ordered.push_back(kv.second);
    }

    FSResult res = PlatformFS::write_file_atomic(get_catalog_path(), serialize_catalog(ordered, clock_()));
    if (!res.ok) {
        error() << "Failed to persist catalog " << get_catalog_path() << ": " << errnoWithDescription(res.err);
        throw StorageUnavailableError("cannot write catalog: " + errnoWithDescription(res.err));
    }
}

} // namespace persist
} // namespace vstore
