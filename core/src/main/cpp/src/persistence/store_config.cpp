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

#include "store_config.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sstream>

namespace vstore {
namespace persist {

namespace fs = std::filesystem;

std::string StoreConfig::collections_dir() const {
    return (fs::path(data_root) / layout::kCollectionsDir).string();
}

std::string StoreConfig::backups_dir() const {
    if (!backup_root.empty()) {
        return backup_root;
    }
    return (fs::path(data_root) / layout::kBackupsDir).string();
}

std::string StoreConfig::path_in_root(const char* name) const {
    return (fs::path(data_root) / name).string();
}

bool StoreConfig::validate(std::string* why) const {
    auto fail = [why](const char* msg) {
        if (why) *why = msg;
        return false;
    };

    if (data_root.empty()) {
        return fail("data_root must not be empty");
    }
    if (retention_count < 1) {
        // Must keep at least one archive
        return fail("retention_count must be at least 1");
    }
    if (sync_queue_capacity < 1) {
        return fail("sync_queue_capacity must be at least 1");
    }
    if (consistency_sample_size < 1) {
        return fail("consistency_sample_size must be at least 1");
    }
    std::string level = log_level;
    for (auto& c : level) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (level != "TRACE" && level != "DEBUG" && level != "INFO" && level != "WARNING" &&
        level != "WARN" && level != "ERROR" && level != "SEVERE" && level != "FATAL") {
        return fail("log_level is not a known level");
    }
    return true;
}

ConfigContext::ConfigContext(StoreConfig config) {
    std::string why;
    if (!config.validate(&why)) {
        throw std::invalid_argument("invalid store configuration: " + why);
    }
    current_ = std::make_shared<const StoreConfig>(std::move(config));
    generation_ = 1;
}

std::shared_ptr<const StoreConfig> ConfigContext::current() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_;
}

uint64_t ConfigContext::generation() const {
    std::lock_guard<std::mutex> lock(mu_);
    return generation_;
}

bool ConfigContext::update(const StoreConfig& config) {
    return install(config, false);
}

bool ConfigContext::install(const StoreConfig& next, bool initial_load) {
    std::lock_guard<std::mutex> lock(mu_);
    std::string why;
    if (!next.validate(&why)) {
        last_error_ = why;
        warn() << "Rejected configuration: " << why;
        return false;
    }
    if (!initial_load && current_->data_root != next.data_root) {
        last_error_ = "data_root cannot change on reload";
        warn() << "Rejected configuration: " << last_error_
               << " (" << current_->data_root << " -> " << next.data_root << ")";
        return false;
    }
    current_ = std::make_shared<const StoreConfig>(next);
    generation_++;
    last_error_.clear();
    setLogLevelFromString(next.log_level);
    return true;
}

bool ConfigContext::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "cannot open " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json_str = buffer.str();

    rapidjson::Document doc;
    doc.Parse(json_str.c_str());
    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << " in " << path << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        last_error_ = "parse error";
        return false;
    }
    if (!doc.IsObject()) {
        last_error_ = "config root must be an object";
        return false;
    }

    // Keys absent from the file keep their current values
    StoreConfig next = *current();

    if (doc.HasMember("data_root") && doc["data_root"].IsString()) {
        next.data_root = doc["data_root"].GetString();
    }
    if (doc.HasMember("backup_root") && doc["backup_root"].IsString()) {
        next.backup_root = doc["backup_root"].GetString();
    }
    if (doc.HasMember("retention_count") && doc["retention_count"].IsUint64()) {
        next.retention_count = doc["retention_count"].GetUint64();
    }
    if (doc.HasMember("retention_days") && doc["retention_days"].IsUint()) {
        next.retention_days = doc["retention_days"].GetUint();
    }
    if (doc.HasMember("keep_checkpoint_after_commit") && doc["keep_checkpoint_after_commit"].IsBool()) {
        next.keep_checkpoint_after_commit = doc["keep_checkpoint_after_commit"].GetBool();
    }
    if (doc.HasMember("sync_queue_capacity") && doc["sync_queue_capacity"].IsUint64()) {
        next.sync_queue_capacity = doc["sync_queue_capacity"].GetUint64();
    }
    if (doc.HasMember("consistency_sample_size") && doc["consistency_sample_size"].IsUint64()) {
        next.consistency_sample_size = doc["consistency_sample_size"].GetUint64();
    }
    if (doc.HasMember("allow_orphan_catalog_cleanup") && doc["allow_orphan_catalog_cleanup"].IsBool()) {
        next.allow_orphan_catalog_cleanup = doc["allow_orphan_catalog_cleanup"].GetBool();
    }
    if (doc.HasMember("allow_incompatible_mutations") && doc["allow_incompatible_mutations"].IsBool()) {
        next.allow_incompatible_mutations = doc["allow_incompatible_mutations"].GetBool();
    }
    if (doc.HasMember("auto_migrate") && doc["auto_migrate"].IsBool()) {
        next.auto_migrate = doc["auto_migrate"].GetBool();
    }
    if (doc.HasMember("recovery_high_priority_bytes") && doc["recovery_high_priority_bytes"].IsUint64()) {
        next.recovery_high_priority_bytes = doc["recovery_high_priority_bytes"].GetUint64();
    }
    if (doc.HasMember("log_level") && doc["log_level"].IsString()) {
        next.log_level = doc["log_level"].GetString();
    }
    if (doc.HasMember("log_dir") && doc["log_dir"].IsString()) {
        next.log_dir = doc["log_dir"].GetString();
    }

    // The first file may relocate the root; reloads may not
    if (!install(next, source_path_.empty())) {
        return false;
    }
    source_path_ = path;
    info() << "Loaded configuration from " << path << " (generation " << generation() << ")";
    return true;
}

bool ConfigContext::reload() {
    if (source_path_.empty()) {
        last_error_ = "no configuration file loaded";
        return false;
    }
    return load(source_path_);
}

} // namespace persist
} // namespace vstore
