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

#include "version_checker.h"
#include "catalog_schema.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

static constexpr const char* kLegacyEngineVersion = "1.0.0";

uint32_t major_version(const std::string& version) {
    size_t dot = version.find('.');
    std::string head = version.substr(0, dot);
    if (head.empty()) {
        return 0;
    }
    for (char c : head) {
        if (c < '0' || c > '9') return 0;
    }
    return static_cast<uint32_t>(std::stoul(head));
}

VersionChecker::VersionChecker(ConfigContext& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

std::string VersionChecker::version_file() const {
    return config_.current()->path_in_root(layout::kVersionFile);
}

std::optional<uint32_t> VersionChecker::catalog_schema() const {
    std::ifstream file(config_.current()->path_in_root(layout::kCatalogFile), std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    rapidjson::Document doc;
    doc.Parse(buffer.str().c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    return detect_catalog_schema(doc);
}

std::optional<VersionInfo> VersionChecker::load() const {
    std::string path = version_file();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw StorageUnavailableError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    rapidjson::Document doc;
    doc.Parse(buffer.str().c_str());
    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        throw StorageUnavailableError(path + " is not valid JSON");
    }
    if (!doc.IsObject()) {
        throw StorageUnavailableError(path + " root is not an object");
    }

    VersionInfo vinfo;
    if (doc.HasMember("engine_version") && doc["engine_version"].IsString()) {
        vinfo.engine_version = doc["engine_version"].GetString();
    }
    if (doc.HasMember("schema_version") && doc["schema_version"].IsUint()) {
        vinfo.schema_version = doc["schema_version"].GetUint();
    }
    if (doc.HasMember("last_migration_unix_ms") && doc["last_migration_unix_ms"].IsInt64()) {
        vinfo.last_migration_unix_ms = doc["last_migration_unix_ms"].GetInt64();
    }
    if (doc.HasMember("migration_history") && doc["migration_history"].IsArray()) {
        for (const auto& m : doc["migration_history"].GetArray()) {
            if (!m.IsObject()) continue;
            MigrationRecord rec;
            if (m.HasMember("from_engine") && m["from_engine"].IsString()) rec.from_engine = m["from_engine"].GetString();
            if (m.HasMember("to_engine") && m["to_engine"].IsString()) rec.to_engine = m["to_engine"].GetString();
            if (m.HasMember("from_schema") && m["from_schema"].IsUint()) rec.from_schema = m["from_schema"].GetUint();
            if (m.HasMember("to_schema") && m["to_schema"].IsUint()) rec.to_schema = m["to_schema"].GetUint();
            if (m.HasMember("unix_ms") && m["unix_ms"].IsInt64()) rec.unix_ms = m["unix_ms"].GetInt64();
            if (m.HasMember("backup_id") && m["backup_id"].IsString()) rec.backup_id = m["backup_id"].GetString();
            if (m.HasMember("status") && m["status"].IsString()) rec.status = m["status"].GetString();
            if (m.HasMember("message") && m["message"].IsString()) rec.message = m["message"].GetString();
            vinfo.migration_history.push_back(rec);
        }
    }
    if (doc.HasMember("compatibility_check") && doc["compatibility_check"].IsObject()) {
        const auto& cc = doc["compatibility_check"];
        if (cc.HasMember("unix_ms") && cc["unix_ms"].IsInt64()) vinfo.last_check_unix_ms = cc["unix_ms"].GetInt64();
        if (cc.HasMember("compatible") && cc["compatible"].IsBool()) vinfo.last_check_compatible = cc["compatible"].GetBool();
    }
    return vinfo;
}

void VersionChecker::store(const VersionInfo& vinfo) const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("engine_version");
    writer.String(vinfo.engine_version.c_str());
    writer.Key("schema_version");
    writer.Uint(vinfo.schema_version);
    writer.Key("last_migration_unix_ms");
    writer.Int64(vinfo.last_migration_unix_ms);
    writer.Key("migration_history");
    writer.StartArray();
    for (const auto& m : vinfo.migration_history) {
        writer.StartObject();
        writer.Key("from_engine");
        writer.String(m.from_engine.c_str());
        writer.Key("to_engine");
        writer.String(m.to_engine.c_str());
        writer.Key("from_schema");
        writer.Uint(m.from_schema);
        writer.Key("to_schema");
        writer.Uint(m.to_schema);
        writer.Key("unix_ms");
        writer.Int64(m.unix_ms);
        writer.Key("backup_id");
        writer.String(m.backup_id.c_str());
        writer.Key("status");
        writer.String(m.status.c_str());
        writer.Key("message");
        writer.String(m.message.c_str());
        writer.EndObject();
    }
    writer.EndArray();
    writer.Key("compatibility_check");
    writer.StartObject();
    writer.Key("unix_ms");
    writer.Int64(vinfo.last_check_unix_ms);
    writer.Key("compatible");
    writer.Bool(vinfo.last_check_compatible);
    writer.EndObject();
    writer.EndObject();

    FSResult r = PlatformFS::ensure_directory(config_.current()->data_root);
    if (r.ok) {
        r = PlatformFS::write_file_atomic(version_file(), buffer.GetString());
    }
    if (!r.ok) {
        throw StorageUnavailableError("cannot write " + version_file() + ": " + errnoWithDescription(r.err));
    }
}

CompatibilityReport VersionChecker::check() const {
    CompatibilityReport report;
    auto cfg = config_.current();

    std::optional<VersionInfo> vinfo;
    try {
        vinfo = load();
    } catch (const StorageUnavailableError& e) {
        report.compatible = false;
        report.issues.push_back(e.what());
        return report;
    }

    if (!vinfo) {
        std::error_code ec;
        if (!fs::exists(cfg->path_in_root(layout::kCatalogFile), ec)) {
            // Fresh store
            report.stored_engine_version = versions::kEngineVersion;
            report.stored_schema_version = versions::kSchemaVersion;
            return report;
        }
        report.legacy = true;
        report.stored_engine_version = kLegacyEngineVersion;
        report.stored_schema_version = 1;
        report.issues.push_back("no version file; assuming legacy engine " + std::string(kLegacyEngineVersion));
    } else {
        report.stored_engine_version = vinfo->engine_version;
        report.stored_schema_version = vinfo->schema_version;
    }

    const std::string running_engine = versions::kEngineVersion;
    const uint32_t stored_major = major_version(report.stored_engine_version);
    const uint32_t running_major = major_version(running_engine);

    if (report.stored_schema_version > versions::kSchemaVersion) {
        report.compatible = false;
        report.issues.push_back("schema " + std::to_string(report.stored_schema_version) +
                                " is newer than supported schema " + std::to_string(versions::kSchemaVersion));
    } else if (report.stored_schema_version < versions::kMinReadableSchemaVersion) {
        report.compatible = false;
        report.issues.push_back("schema " + std::to_string(report.stored_schema_version) +
                                " is older than the oldest readable schema");
    } else if (report.stored_schema_version < versions::kSchemaVersion) {
        report.migration_needed = true;
        report.issues.push_back("schema " + std::to_string(report.stored_schema_version) +
                                " needs migration to " + std::to_string(versions::kSchemaVersion));
    }

    if (stored_major != running_major) {
        report.compatible = false;
        report.issues.push_back("engine major version changed from " + report.stored_engine_version +
                                " to " + running_engine);
        if (stored_major < running_major && report.stored_schema_version <= versions::kSchemaVersion) {
            report.migration_needed = true;
        }
    } else if (report.stored_engine_version != running_engine) {
        report.migration_needed = true;
        report.issues.push_back("engine version changed from " + report.stored_engine_version +
                                " to " + running_engine);
    }

    // catalog.json can be ahead of version_info.json when a newer engine wrote it
    auto on_disk = catalog_schema();
    if (on_disk && *on_disk > versions::kSchemaVersion) {
        report.compatible = false;
        report.migration_needed = false;
        report.issues.push_back("catalog schema " + std::to_string(*on_disk) +
                                " is newer than supported schema " + std::to_string(versions::kSchemaVersion));
    }

    if (!report.compatible) {
        warn() << "Store at " << cfg->data_root << " is not compatible with engine " << running_engine;
    }
    return report;
}

bool VersionChecker::mutations_allowed(const CompatibilityReport& report) const {
    return report.compatible || config_.current()->allow_incompatible_mutations;
}

bool VersionChecker::mutations_allowed() const {
    return mutations_allowed(check());
}

bool VersionChecker::initialize_if_missing() const {
    auto cfg = config_.current();
    std::error_code ec;
    if (fs::exists(version_file(), ec) || fs::exists(cfg->path_in_root(layout::kCatalogFile), ec)) {
        return false;
    }
    VersionInfo vinfo;
    vinfo.engine_version = versions::kEngineVersion;
    vinfo.schema_version = versions::kSchemaVersion;
    vinfo.last_check_unix_ms = clock_();
    store(vinfo);
    info() << "Initialized " << version_file();
    return true;
}

void VersionChecker::record_check(const CompatibilityReport& report) const {
    auto vinfo = load();
    if (!vinfo) {
        // Nothing to annotate until the store has a version file
        return;
    }
    vinfo->last_check_unix_ms = clock_();
    vinfo->last_check_compatible = report.compatible;
    store(*vinfo);
}

void migrate_catalog_v1_to_v2(const StoreConfig& cfg) {
    std::string path = cfg.path_in_root(layout::kCatalogFile);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        // No catalog, nothing to rewrite
        return;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    std::vector<CollectionRecord> records = parse_catalog(buffer.str());
    FSResult r = PlatformFS::write_file_atomic(path, serialize_catalog(records, now_unix_ms()));
    if (!r.ok) {
        throw StorageUnavailableError("cannot rewrite catalog: " + errnoWithDescription(r.err));
    }
    info() << "Migrated " << records.size() << " catalog records to schema 2";
}

MigrationManager::MigrationManager(ConfigContext& config,
                                   VersionChecker& checker,
                                   BackupManager& backups,
                                   CatalogRepository& catalog,
                                   Clock clock)
    : config_(config), checker_(checker), backups_(backups), catalog_(catalog), clock_(std::move(clock)) {
    register_step(MigrationStep{1, 2,
                                "nest provider/model/dimension into an embedding descriptor",
                                "catalog.json is rewritten",
                                migrate_catalog_v1_to_v2});
}

void MigrationManager::register_step(MigrationStep step) {
    uint32_t from = step.from_schema;
    steps_[from] = std::move(step);
}

MigrationPlan MigrationManager::plan() const {
    MigrationPlan p;
    CompatibilityReport report = checker_.check();
    p.from_engine = report.stored_engine_version;
    p.to_engine = versions::kEngineVersion;
    p.from_schema = report.stored_schema_version;
    p.to_schema = versions::kSchemaVersion;
    p.needed = report.migration_needed;
    if (!p.needed) {
        if (!report.compatible) {
            p.blocker = report.issues.empty() ? "store is incompatible" : report.issues.front();
        }
        return p;
    }

    uint32_t schema = p.from_schema;
    while (schema < p.to_schema) {
        auto it = steps_.find(schema);
        if (it == steps_.end()) {
            p.blocker = "no migration step from schema " + std::to_string(schema);
            break;
        }
        p.steps.push_back(it->second);
        if (!it->second.risk.empty()) {
            p.risks.push_back(it->second.risk);
        }
        schema = it->second.to_schema;
    }
    p.backup_required = !p.steps.empty() || p.from_engine != p.to_engine;
    return p;
}

MigrationOutcome MigrationManager::execute() {
    MigrationOutcome outcome;
    MigrationPlan p = plan();
    if (!p.needed) {
        outcome.success = p.blocker.empty();
        outcome.error = p.blocker;
        return outcome;
    }
    if (!p.blocker.empty()) {
        outcome.error = p.blocker;
        return outcome;
    }

    auto cfg = config_.current();
    std::optional<VersionInfo> stored;
    try {
        stored = checker_.load();
    } catch (const StorageUnavailableError& e) {
        outcome.error = e.what();
        return outcome;
    }
    VersionInfo vinfo = stored ? *stored : VersionInfo{};

    MigrationRecord rec;
    rec.from_engine = p.from_engine;
    rec.to_engine = p.to_engine;
    rec.from_schema = p.from_schema;
    rec.to_schema = p.to_schema;
    rec.unix_ms = clock_();

    try {
        BackupArchive archive = backups_.checkpoint({}, "migration_" + format_compact(rec.unix_ms));
        outcome.backup_id = archive.backup_id;
        rec.backup_id = archive.backup_id;
    } catch (const StoreError& e) {
        outcome.error = std::string("pre-migration backup failed: ") + e.what();
        return outcome;
    }

    try {
        for (const auto& step : p.steps) {
            info() << "Applying migration " << step.from_schema << " -> " << step.to_schema
                   << ": " << step.description;
            step.apply(*cfg);
            outcome.applied.push_back(std::to_string(step.from_schema) + "->" + std::to_string(step.to_schema));
        }
        catalog_.reload();

        vinfo.engine_version = p.to_engine;
        vinfo.schema_version = p.to_schema;
        vinfo.last_migration_unix_ms = rec.unix_ms;
        rec.status = "success";
        vinfo.migration_history.push_back(rec);
        vinfo.last_check_unix_ms = clock_();
        vinfo.last_check_compatible = true;
        checker_.store(vinfo);
        outcome.success = true;
        info() << "Migration " << p.from_engine << " -> " << p.to_engine << " complete";
    } catch (const std::exception& e) {
        outcome.error = e.what();
        error() << "Migration failed: " << e.what() << "; restoring " << outcome.backup_id;
        try {
            backups_.restore(outcome.backup_id);
            catalog_.reload();
            outcome.restored = true;
        } catch (const StoreError& restore_err) {
            severe() << "Restoring pre-migration backup " << outcome.backup_id
                     << " failed: " << restore_err.what();
        }

        // Stored versions stay as they were; only the attempt is recorded
        if (!stored) {
            vinfo.engine_version = p.from_engine;
            vinfo.schema_version = p.from_schema;
        }
        rec.status = "failed";
        rec.message = e.what();
        vinfo.migration_history.push_back(rec);
        try {
            checker_.store(vinfo);
        } catch (const StoreError& store_err) {
            error() << "Cannot record failed migration: " << store_err.what();
        }
    }
    return outcome;
}

} // namespace persist
} // namespace vstore
