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

#include "vector_store.h"
#include "collection_record.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

// Items copied per append during copy_collection
static constexpr size_t kCopyBatch = 1024;

FileVectorStore::FileVectorStore(const std::string& data_root, Clock clock)
    : data_root_(data_root),
      collections_root_((fs::path(data_root) / layout::kCollectionsDir).string()),
      trash_root_((fs::path(data_root) / layout::kTrashDir).string()),
      clock_(std::move(clock)) {}

void FileVectorStore::require_valid_id(const std::string& collection_id) const {
    if (!is_valid_collection_id(collection_id)) {
        throw InvalidArgumentError("invalid collection_id '" + collection_id + "'", collection_id);
    }
}

std::string FileVectorStore::collection_dir(const std::string& collection_id) const {
    return (fs::path(collections_root_) / collection_id).string();
}

bool FileVectorStore::exists(const std::string& collection_id) const {
    if (!is_valid_collection_id(collection_id)) {
        return false;
    }
    std::error_code ec;
    bool is_dir = fs::is_directory(collection_dir(collection_id), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw StorageUnavailableError("cannot stat " + collection_dir(collection_id) + ": " + ec.message(),
                                      collection_id);
    }
    return is_dir;
}

void FileVectorStore::create(const std::string& collection_id, uint32_t dimension) {
    require_valid_id(collection_id);
    if (dimension == 0 || dimension > engine::kMaxDimension) {
        throw InvalidArgumentError("dimension must be 1-" + std::to_string(engine::kMaxDimension),
                                   collection_id);
    }
    if (exists(collection_id)) {
        throw AlreadyExistsError("physical collection exists", collection_id);
    }

    FSResult r = PlatformFS::ensure_directory(collections_root_);
    if (!r.ok) {
        throw StorageUnavailableError("cannot create " + collections_root_ + ": " + errnoWithDescription(r.err),
                                      collection_id);
    }

    std::string staging = (fs::path(collections_root_) / (std::string(layout::kStagingPrefix) + collection_id)).string();
    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directory(staging, ec);
    if (ec) {
        throw StorageUnavailableError("cannot create " + staging + ": " + ec.message(), collection_id);
    }

    try {
        EngineHeader h;
        h.format_version = engine::kFormatVersion;
        h.dimension = dimension;
        h.created_unix_ms = clock_();
        EngineFiles::write_header(staging, h);

        std::ofstream(EngineFiles::vectors_path(staging), std::ios::binary | std::ios::trunc).close();
        r = PlatformFS::fsync_file(EngineFiles::vectors_path(staging));
        if (r.ok) r = PlatformFS::fsync_directory(staging);
        if (!r.ok) {
            throw StorageUnavailableError("fsync failed in " + staging + ": " + errnoWithDescription(r.err),
                                          collection_id);
        }

        r = PlatformFS::atomic_replace(staging, collection_dir(collection_id));
        if (!r.ok) {
            throw StorageUnavailableError("cannot publish " + collection_dir(collection_id) + ": " +
                                          errnoWithDescription(r.err), collection_id);
        }
    } catch (...) {
        fs::remove_all(staging, ec);
        throw;
    }

    debug() << "Created physical collection " << collection_id << " dim=" << dimension;
}

void FileVectorStore::drop(const std::string& collection_id) {
    require_valid_id(collection_id);
    if (!exists(collection_id)) {
        throw NotFoundError("physical collection not found", collection_id);
    }

    FSResult r = PlatformFS::ensure_directory(trash_root_);
    if (!r.ok) {
        throw StorageUnavailableError("cannot create " + trash_root_ + ": " + errnoWithDescription(r.err),
                                      collection_id);
    }

    std::string trashed = (fs::path(trash_root_) / (collection_id + "_" + std::to_string(clock_()))).string();
    int n = 1;
    while (fs::exists(trashed)) {
        trashed = (fs::path(trash_root_) / (collection_id + "_" + std::to_string(clock_()) + "_" + std::to_string(n++))).string();
    }

    // The rename is the drop; everything after it is space reclamation
    r = PlatformFS::atomic_replace(collection_dir(collection_id), trashed);
    if (!r.ok) {
        throw StorageUnavailableError("cannot move " + collection_id + " to trash: " + errnoWithDescription(r.err),
                                      collection_id);
    }
    r = PlatformFS::fsync_directory(collections_root_);
    if (!r.ok) {
        warn() << "fsync of " << collections_root_ << " failed after drop: " << errnoWithDescription(r.err);
    }

    r = PlatformFS::remove_tree(trashed);
    if (!r.ok) {
        warn() << "Could not remove " << trashed << " (" << errnoWithDescription(r.err)
               << "), scheduling cleanup";
        record_pending(trashed);
    }
    debug() << "Dropped physical collection " << collection_id;
}

void FileVectorStore::rename(const std::string& old_id, const std::string& new_id) {
    require_valid_id(old_id);
    require_valid_id(new_id);
    if (!exists(old_id)) {
        throw NotFoundError("physical collection not found", old_id);
    }
    if (exists(new_id)) {
        throw AlreadyExistsError("physical collection exists", new_id);
    }
    FSResult r = PlatformFS::atomic_replace(collection_dir(old_id), collection_dir(new_id));
    if (!r.ok) {
        throw StorageUnavailableError("cannot rename " + old_id + " to " + new_id + ": " +
                                      errnoWithDescription(r.err), old_id);
    }
}

uint64_t FileVectorStore::count(const std::string& collection_id) const {
    require_valid_id(collection_id);
    if (!exists(collection_id)) {
        throw NotFoundError("physical collection not found", collection_id);
    }
    std::string dir = collection_dir(collection_id);
    try {
        return EngineFiles::read_header(dir).item_count;
    } catch (const NotFoundError&) {
        // Header-less directories (partial writes, recovered orphans) are counted by frames
        return EngineFiles::count_items(dir);
    }
}

uint32_t FileVectorStore::dimension(const std::string& collection_id) const {
    require_valid_id(collection_id);
    if (!exists(collection_id)) {
        throw NotFoundError("physical collection not found", collection_id);
    }
    std::string dir = collection_dir(collection_id);
    try {
        return EngineFiles::read_header(dir).dimension;
    } catch (const NotFoundError&) {
        auto first = EngineFiles::read_items(dir, 1);
        if (first.empty()) {
            throw IntegrityError("dimension unknown: no header and no items", collection_id);
        }
        return static_cast<uint32_t>(first.front().values.size());
    }
}

std::vector<std::string> FileVectorStore::list_ids(const std::string& collection_id) const {
    std::vector<std::string> ids;
    for (auto& item : read_items(collection_id)) {
        ids.push_back(std::move(item.id));
    }
    return ids;
}

std::vector<VectorItem> FileVectorStore::read_items(const std::string& collection_id, size_t limit) const {
    require_valid_id(collection_id);
    if (!exists(collection_id)) {
        throw NotFoundError("physical collection not found", collection_id);
    }
    try {
        return EngineFiles::read_items(collection_dir(collection_id), limit);
    } catch (const StoreError& e) {
        if (e.kind() == ErrorKind::NotFound) {
            // Directory present, vectors.bin absent
            throw IntegrityError(e.what(), collection_id);
        }
        throw;
    }
}

void FileVectorStore::add_items(const std::string& collection_id, const std::vector<VectorItem>& items) {
    require_valid_id(collection_id);
    if (!exists(collection_id)) {
        throw NotFoundError("physical collection not found", collection_id);
    }

    std::lock_guard<std::mutex> lock(mu_);
    std::string dir = collection_dir(collection_id);
    EngineHeader h = EngineFiles::read_header(dir);
    for (const auto& item : items) {
        if (item.values.size() != h.dimension) {
            throw InvalidArgumentError("item '" + item.id + "' has dimension " +
                                       std::to_string(item.values.size()) + ", collection has " +
                                       std::to_string(h.dimension), collection_id);
        }
    }

    EngineFiles::append_items(dir, items);
    h.item_count += items.size();
    EngineFiles::write_header(dir, h);
}

uint64_t FileVectorStore::copy_collection(const std::string& src_id, const std::string& dst_id) {
    uint32_t dim = dimension(src_id);
    std::vector<VectorItem> items = read_items(src_id);

    create(dst_id, dim);
    try {
        for (size_t i = 0; i < items.size(); i += kCopyBatch) {
            size_t end = std::min(items.size(), i + kCopyBatch);
            std::vector<VectorItem> batch(std::make_move_iterator(items.begin() + i),
                                          std::make_move_iterator(items.begin() + end));
            add_items(dst_id, batch);
        }
    } catch (const StoreError& e) {
        error() << "Copy " << src_id << " -> " << dst_id << " failed: " << e.what();
        try {
            drop(dst_id);
        } catch (const StoreError& drop_err) {
            error() << "Could not drop partial copy " << dst_id << ": " << drop_err.what();
        }
        throw;
    }
    return items.size();
}

std::vector<std::string> FileVectorStore::list_collections() const {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(collections_root_, ec)) {
        return out;
    }
    for (fs::directory_iterator it(collections_root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        if (it->is_directory(ec) && is_valid_collection_id(name)) {
            out.push_back(name);
        }
    }
    if (ec) {
        throw StorageUnavailableError("cannot list " + collections_root_ + ": " + ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> FileVectorStore::load_pending() const {
    std::vector<std::string> paths;
    std::string path = (fs::path(data_root_) / layout::kPendingCleanupFile).string();
    std::ifstream file(path);
    if (!file.is_open()) {
        return paths;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    rapidjson::Document doc;
    doc.Parse(buffer.str().c_str());
    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return paths;
    }
    if (doc.IsObject() && doc.HasMember("pending") && doc["pending"].IsArray()) {
        for (const auto& v : doc["pending"].GetArray()) {
            if (v.IsString()) {
                paths.push_back(v.GetString());
            }
        }
    }
    return paths;
}

void FileVectorStore::store_pending(const std::vector<std::string>& paths) {
    std::string path = (fs::path(data_root_) / layout::kPendingCleanupFile).string();
    if (paths.empty()) {
        std::error_code ec;
        fs::remove(path, ec);
        return;
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    writer.StartObject();
    writer.Key("pending");
    writer.StartArray();
    for (const auto& p : paths) {
        writer.String(p.c_str());
    }
    writer.EndArray();
    writer.EndObject();

    FSResult r = PlatformFS::write_file_atomic(path, buffer.GetString());
    if (!r.ok) {
        error() << "Failed to write " << path << ": " << errnoWithDescription(r.err);
    }
}

void FileVectorStore::record_pending(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    auto paths = load_pending();
    if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
        paths.push_back(path);
    }
    store_pending(paths);
}

std::vector<std::string> FileVectorStore::pending_cleanup() const {
    std::lock_guard<std::mutex> lock(mu_);
    return load_pending();
}

size_t FileVectorStore::run_pending_cleanup() {
    std::lock_guard<std::mutex> lock(mu_);
    auto paths = load_pending();
    std::vector<std::string> remaining;
    size_t cleaned = 0;
    for (const auto& p : paths) {
        FSResult r = PlatformFS::remove_tree(p);
        if (r.ok) {
            cleaned++;
        } else {
            warn() << "Pending cleanup of " << p << " failed again: " << errnoWithDescription(r.err);
            remaining.push_back(p);
        }
    }
    if (!paths.empty()) {
        store_pending(remaining);
        info() << "Pending cleanup: removed " << cleaned << ", " << remaining.size() << " remaining";
    }
    return cleaned;
}

} // namespace persist
} // namespace vstore
