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

#include "backup_manager.h"
#include "catalog_schema.h"
#include "checksums.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

const char* to_string(ArchiveType type) {
    switch (type) {
        case ArchiveType::Full:             return "full";
        case ArchiveType::SingleCollection: return "single_collection";
    }
    return "unknown";
}

static bool read_file(const std::string& path, std::string* out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    *out = buffer.str();
    return !file.bad();
}

BackupManager::BackupManager(ConfigContext& config,
                             CatalogRepository& catalog,
                             VectorStoreAdapter& vectors,
                             Clock clock)
    : config_(config), catalog_(catalog), vectors_(vectors), clock_(std::move(clock)) {}

std::string BackupManager::backups_root() const {
    return config_.current()->backups_dir();
}

std::string BackupManager::next_backup_id(int64_t now_ms) {
    char ms[8];
    std::snprintf(ms, sizeof(ms), "%03d", static_cast<int>(now_ms % 1000));
    std::string base = "backup_" + format_compact(now_ms) + "_" + ms + "_";
    std::string id;
    do {
        id = base + std::to_string(seq_.fetch_add(1) + 1);
    } while (fs::exists(fs::path(backups_root()) / id));
    return id;
}

void BackupManager::acquire_ids(const std::vector<std::string>& ids) {
    std::unique_lock<std::mutex> lock(progress_mu_);
    if (ids.empty()) {
        progress_cv_.wait(lock, [this] { return !full_in_progress_ && in_progress_.empty(); });
        full_in_progress_ = true;
        return;
    }
    progress_cv_.wait(lock, [this, &ids] {
        if (full_in_progress_) return false;
        for (const auto& id : ids) {
            if (in_progress_.count(id)) return false;
        }
        return true;
    });
    in_progress_.insert(ids.begin(), ids.end());
}

void BackupManager::release_ids(const std::vector<std::string>& ids) {
    {
        std::lock_guard<std::mutex> lock(progress_mu_);
        if (ids.empty()) {
            full_in_progress_ = false;
        } else {
            for (const auto& id : ids) {
                in_progress_.erase(id);
            }
        }
    }
    progress_cv_.notify_all();
}

std::string BackupManager::write_manifest_json(const BackupArchive& a) const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("archive_format_version");
    writer.Uint(versions::kArchiveFormatVersion);
    writer.Key("backup_id");
    writer.String(a.backup_id.c_str());
    writer.Key("type");
    writer.String(to_string(a.type));
    writer.Key("created_unix_ms");
    writer.Int64(a.created_unix_ms);
    writer.Key("operation_id");
    writer.String(a.operation_id.c_str());
    writer.Key("schema_version");
    writer.Uint(a.schema_version);
    writer.Key("engine_version");
    writer.String(a.engine_version.c_str());
    writer.Key("size_bytes");
    writer.Uint64(a.size_bytes);
    writer.Key("snapshot_crc32c");
    writer.Uint(a.snapshot_crc32c);
    writer.Key("sources");
    writer.StartArray();
    for (const auto& s : a.sources) {
        writer.StartObject();
        writer.Key("collection_id");
        writer.String(s.collection_id.c_str());
        writer.Key("had_record");
        writer.Bool(s.had_record);
        writer.Key("had_physical");
        writer.Bool(s.had_physical);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

std::optional<BackupArchive> BackupManager::read_manifest(const std::string& dir) const {
    std::string path = (fs::path(dir) / layout::kArchiveManifest).string();
    std::string json;
    if (!read_file(path, &json)) {
        warn() << "Archive " << dir << " has no readable manifest";
        return std::nullopt;
    }

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return std::nullopt;
    }
    if (!doc.IsObject() || !doc.HasMember("backup_id") || !doc["backup_id"].IsString()) {
        warn() << "Manifest " << path << " lacks backup_id";
        return std::nullopt;
    }

    BackupArchive a;
    a.backup_id = doc["backup_id"].GetString();
    a.path = dir;
    if (doc.HasMember("archive_format_version") && doc["archive_format_version"].IsUint() &&
        doc["archive_format_version"].GetUint() > versions::kArchiveFormatVersion) {
        warn() << "Archive " << a.backup_id << " uses a newer archive format ("
               << doc["archive_format_version"].GetUint() << ")";
        return std::nullopt;
    }
    if (doc.HasMember("type") && doc["type"].IsString()) {
        a.type = std::string(doc["type"].GetString()) == "full" ? ArchiveType::Full : ArchiveType::SingleCollection;
    }
    if (doc.HasMember("created_unix_ms") && doc["created_unix_ms"].IsInt64()) {
        a.created_unix_ms = doc["created_unix_ms"].GetInt64();
    }
    if (doc.HasMember("operation_id") && doc["operation_id"].IsString()) {
        a.operation_id = doc["operation_id"].GetString();
    }
    // Manifests written before schema tracking default to schema 1
    a.schema_version = 1;
    if (doc.HasMember("schema_version") && doc["schema_version"].IsUint()) {
        a.schema_version = doc["schema_version"].GetUint();
    }
    if (doc.HasMember("engine_version") && doc["engine_version"].IsString()) {
        a.engine_version = doc["engine_version"].GetString();
    }
    if (doc.HasMember("size_bytes") && doc["size_bytes"].IsUint64()) {
        a.size_bytes = doc["size_bytes"].GetUint64();
    }
    if (doc.HasMember("snapshot_crc32c") && doc["snapshot_crc32c"].IsUint()) {
        a.snapshot_crc32c = doc["snapshot_crc32c"].GetUint();
    }
    if (doc.HasMember("sources") && doc["sources"].IsArray()) {
        for (const auto& s : doc["sources"].GetArray()) {
            if (!s.IsObject() || !s.HasMember("collection_id") || !s["collection_id"].IsString()) {
                continue;
            }
            ArchiveSource src;
            src.collection_id = s["collection_id"].GetString();
            src.had_record = s.HasMember("had_record") && s["had_record"].IsBool() && s["had_record"].GetBool();
            src.had_physical = s.HasMember("had_physical") && s["had_physical"].IsBool() && s["had_physical"].GetBool();
            a.sources.push_back(src);
        }
    }
    return a;
}

BackupArchive BackupManager::checkpoint(const std::vector<std::string>& ids, const std::string& operation_id) {
    std::vector<std::string> wanted(ids);
    std::sort(wanted.begin(), wanted.end());
    wanted.erase(std::unique(wanted.begin(), wanted.end()), wanted.end());
    for (const auto& id : wanted) {
        if (!is_valid_collection_id(id)) {
            throw InvalidArgumentError("invalid collection_id '" + id + "'", id);
        }
    }

    acquire_ids(wanted);
    struct Release {
        BackupManager* self;
        const std::vector<std::string>& ids;
        ~Release() { self->release_ids(ids); }
    } release{this, wanted};

    const std::string root = backups_root();
    FSResult r = PlatformFS::ensure_directory(root);
    if (!r.ok) {
        throw StorageUnavailableError("cannot create backup root " + root + ": " + errnoWithDescription(r.err));
    }

    BackupArchive a;
    a.created_unix_ms = clock_();
    a.backup_id = next_backup_id(a.created_unix_ms);
    a.type = wanted.empty() ? ArchiveType::Full : ArchiveType::SingleCollection;
    a.schema_version = versions::kSchemaVersion;
    a.engine_version = versions::kEngineVersion;
    a.operation_id = operation_id;

    std::vector<std::string> targets = wanted;
    if (a.type == ArchiveType::Full) {
        std::set<std::string> all;
        for (const auto& rec : catalog_.list()) all.insert(rec.collection_id);
        for (const auto& id : vectors_.list_collections()) all.insert(id);
        targets.assign(all.begin(), all.end());
    }

    const std::string staging = (fs::path(root) / (std::string(layout::kStagingPrefix) + a.backup_id)).string();
    const std::string final_dir = (fs::path(root) / a.backup_id).string();

    try {
        r = PlatformFS::ensure_directory((fs::path(staging) / layout::kCollectionsDir).string());
        if (!r.ok) {
            throw StorageUnavailableError("cannot create " + staging + ": " + errnoWithDescription(r.err));
        }

        std::vector<CollectionRecord> snapshot;
        for (const auto& id : targets) {
            ArchiveSource src;
            src.collection_id = id;
            auto rec = catalog_.get(id);
            if (rec) {
                src.had_record = true;
                snapshot.push_back(*rec);
            }
            if (vectors_.exists(id)) {
                src.had_physical = true;
                std::string dst = (fs::path(staging) / layout::kCollectionsDir / id).string();
                r = PlatformFS::copy_tree(vectors_.collection_dir(id), dst);
                if (!r.ok) {
                    throw StorageUnavailableError("cannot copy " + id + " into archive: " +
                                                  errnoWithDescription(r.err), id);
                }
            }
            a.sources.push_back(src);
        }

        std::string snapshot_json = serialize_catalog(snapshot, a.created_unix_ms);
        a.snapshot_crc32c = CRC32C::compute(snapshot_json);
        r = PlatformFS::write_file_atomic((fs::path(staging) / layout::kArchiveCatalog).string(), snapshot_json);
        if (!r.ok) {
            throw StorageUnavailableError("cannot write catalog snapshot: " + errnoWithDescription(r.err));
        }

        auto usage = PlatformFS::tree_usage(staging);
        a.size_bytes = usage.first.ok ? usage.second.bytes : 0;

        r = PlatformFS::write_file_atomic((fs::path(staging) / layout::kArchiveManifest).string(),
                                          write_manifest_json(a));
        if (!r.ok) {
            throw StorageUnavailableError("cannot write manifest: " + errnoWithDescription(r.err));
        }

        r = PlatformFS::atomic_replace(staging, final_dir);
        if (!r.ok) {
            throw StorageUnavailableError("cannot publish archive " + a.backup_id + ": " +
                                          errnoWithDescription(r.err));
        }
    } catch (const StoreError&) {
        FSResult cleanup = PlatformFS::remove_tree(staging);
        if (!cleanup.ok) {
            warn() << "Could not remove " << staging << ": " << errnoWithDescription(cleanup.err);
        }
        throw;
    }

    a.path = final_dir;
    info() << "Checkpoint " << a.backup_id << " (" << to_string(a.type) << ", "
           << a.sources.size() << " collections, " << a.size_bytes << " bytes)"
           << (operation_id.empty() ? "" : " for ") << operation_id;
    return a;
}

void BackupManager::restore_source(const BackupArchive& archive,
                                   const ArchiveSource& src,
                                   const std::vector<CollectionRecord>& snapshot) {
    const std::string& id = src.collection_id;

    if (src.had_physical) {
        std::string archived = (fs::path(archive.path) / layout::kCollectionsDir / id).string();
        std::string target = vectors_.collection_dir(id);
        std::string parent = fs::path(target).parent_path().string();
        std::string staging = (fs::path(parent) / (std::string(layout::kStagingPrefix) + "restore_" + id)).string();

        FSResult r = PlatformFS::ensure_directory(parent);
        if (!r.ok) {
            throw StorageUnavailableError("cannot create " + parent + ": " + errnoWithDescription(r.err), id);
        }
        r = PlatformFS::remove_tree(staging);
        if (r.ok) {
            r = PlatformFS::copy_tree(archived, staging);
        }
        if (!r.ok) {
            throw StorageUnavailableError("cannot stage " + id + " from archive " + archive.backup_id + ": " +
                                          errnoWithDescription(r.err), id);
        }
        if (vectors_.exists(id)) {
            vectors_.drop(id);
        }
        r = PlatformFS::atomic_replace(staging, target);
        if (!r.ok) {
            throw StorageUnavailableError("cannot move restored " + id + " into place: " +
                                          errnoWithDescription(r.err), id);
        }
    } else if (vectors_.exists(id)) {
        vectors_.drop(id);
    }

    if (src.had_record) {
        auto it = std::find_if(snapshot.begin(), snapshot.end(),
                               [&id](const CollectionRecord& r) { return r.collection_id == id; });
        if (it == snapshot.end()) {
            throw IntegrityError("archive " + archive.backup_id + " lists a record it does not contain", id);
        }
        catalog_.put(*it);
    } else {
        catalog_.remove(id);
    }
}

void BackupManager::restore(const std::string& backup_id) {
    if (!is_valid_collection_id(backup_id)) {
        throw InvalidArgumentError("invalid backup id '" + backup_id + "'");
    }
    auto archive = get(backup_id);
    if (!archive) {
        throw NotFoundError("backup " + backup_id + " not found");
    }

    std::string snapshot_json;
    if (!read_file((fs::path(archive->path) / layout::kArchiveCatalog).string(), &snapshot_json)) {
        throw IntegrityError("backup " + backup_id + " has no catalog snapshot");
    }
    if (archive->snapshot_crc32c != 0 && CRC32C::compute(snapshot_json) != archive->snapshot_crc32c) {
        throw IntegrityError("backup " + backup_id + " catalog snapshot checksum mismatch");
    }

    // Older snapshot schemas are upgraded in memory; newer ones raise IncompatibleVersionError
    std::vector<CollectionRecord> snapshot = parse_catalog(snapshot_json);

    for (const auto& src : archive->sources) {
        restore_source(*archive, src, snapshot);
    }

    if (archive->type == ArchiveType::Full) {
        std::set<std::string> archived;
        for (const auto& src : archive->sources) archived.insert(src.collection_id);

        for (const auto& rec : catalog_.list()) {
            if (!archived.count(rec.collection_id)) {
                catalog_.remove(rec.collection_id);
            }
        }
        for (const auto& id : vectors_.list_collections()) {
            if (!archived.count(id)) {
                vectors_.drop(id);
            }
        }
    }

    info() << "Restored backup " << backup_id << " (" << archive->sources.size() << " collections)";
}

std::vector<BackupArchive> BackupManager::list() const {
    std::vector<BackupArchive> out;
    const std::string root = backups_root();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return out;
    }
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) {
            continue;
        }
        auto a = read_manifest(it->path().string());
        if (a) {
            out.push_back(std::move(*a));
        }
    }
    if (ec) {
        throw StorageUnavailableError("cannot list " + root + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [](const BackupArchive& x, const BackupArchive& y) {
        if (x.created_unix_ms != y.created_unix_ms) return x.created_unix_ms > y.created_unix_ms;
        return x.backup_id > y.backup_id;
    });
    return out;
}

std::optional<BackupArchive> BackupManager::get(const std::string& backup_id) const {
    if (!is_valid_collection_id(backup_id)) {
        return std::nullopt;
    }
    std::string dir = (fs::path(backups_root()) / backup_id).string();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }
    return read_manifest(dir);
}

bool BackupManager::remove(const std::string& backup_id) {
    auto a = get(backup_id);
    if (!a) {
        return false;
    }
    FSResult r = PlatformFS::remove_tree(a->path);
    if (!r.ok) {
        throw StorageUnavailableError("cannot remove backup " + backup_id + ": " + errnoWithDescription(r.err));
    }
    return true;
}

std::vector<BackupArchive> BackupManager::cleanup(const RetentionPolicy& policy) {
    std::vector<BackupArchive> archives = list();
    const int64_t cutoff = clock_() - static_cast<int64_t>(policy.retention_days) * kMillisPerDay;

    std::vector<BackupArchive> deleted;
    for (size_t i = 0; i < archives.size(); i++) {
        const auto& a = archives[i];
        bool among_newest = i < policy.retention_count;
        bool young = a.created_unix_ms >= cutoff;
        if (among_newest || young) {
            continue;
        }
        FSResult r = PlatformFS::remove_tree(a.path);
        if (!r.ok) {
            error() << "Failed to delete backup " << a.backup_id << ": " << errnoWithDescription(r.err);
            continue;
        }
        deleted.push_back(a);
    }

    // Staging directories left behind by interrupted checkpoints
    const std::string root = backups_root();
    std::error_code ec;
    if (fs::is_directory(root, ec)) {
        std::string prefix = layout::kStagingPrefix;
        std::vector<std::string> stale;
        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (name.compare(0, prefix.size(), prefix) == 0) {
                std::lock_guard<std::mutex> lock(progress_mu_);
                // A checkpoint in flight has its ids registered; only sweep when idle
                if (in_progress_.empty() && !full_in_progress_) {
                    stale.push_back(it->path().string());
                }
            }
        }
        for (const auto& p : stale) {
            debug() << "Removing stale staging directory " << p;
            FSResult r = PlatformFS::remove_tree(p);
            if (!r.ok) {
                warn() << "Could not remove " << p << ": " << errnoWithDescription(r.err);
            }
        }
    }

    if (!deleted.empty()) {
        info() << "Backup cleanup deleted " << deleted.size() << " of " << archives.size() << " archives";
    }
    return deleted;
}

std::vector<BackupArchive> BackupManager::cleanup() {
    return cleanup(RetentionPolicy::from(*config_.current()));
}

} // namespace persist
} // namespace vstore
