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

#include "store_runtime.h"
#include "config.h"
#include "errors.h"
#include "platform_fs.h"
#include "../util/log.h"

namespace vstore {
namespace persist {

StoreRuntime::StoreRuntime(ConfigContext& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

StoreRuntime::~StoreRuntime() {
    debug() << "Closing store at " << config_.current()->data_root;
}

std::unique_ptr<StoreRuntime> StoreRuntime::open(ConfigContext& config, Clock clock) {
    auto cfg = config.current();
    std::string why;
    if (!cfg->validate(&why)) {
        throw InvalidArgumentError("invalid configuration: " + why);
    }

    if (!setLogLevelFromString(cfg->log_level)) {
        warn() << "Unknown log_level '" << cfg->log_level << "', keeping current level";
    }

    std::unique_ptr<StoreRuntime> rt(new StoreRuntime(config, std::move(clock)));
    if (!cfg->log_dir.empty()) {
        try {
            rt->log_manager_.reset(new LogManager(cfg->log_dir));
        } catch (const std::runtime_error& e) {
            throw StorageUnavailableError(std::string("cannot open log directory: ") + e.what());
        }
    }

    rt->prepare_layout();
    rt->wire();

    size_t cleaned = rt->vectors_->run_pending_cleanup();
    if (cleaned > 0) {
        info() << "Removed " << cleaned << " leftover dropped collection(s)";
    }

    rt->version_->initialize_if_missing();
    try {
        rt->catalog_->load();
    } catch (const IncompatibleVersionError& e) {
        // Writes over an unread catalog would drop its records
        if (cfg->allow_incompatible_mutations) {
            throw;
        }
        // The checker reports the store incompatible, so the ops layer refuses writes
        warn() << "Cannot read catalog (" << e.what() << "), opening read-only with an empty catalog";
    }

    rt->compat_ = rt->version_->check();
    if (rt->compat_.migration_needed && cfg->auto_migrate) {
        info() << "Auto-migrating store from engine " << rt->compat_.stored_engine_version
               << " schema " << rt->compat_.stored_schema_version;
        MigrationOutcome outcome = rt->migrations_->execute();
        if (!outcome.success) {
            error() << "Auto-migration failed: " << outcome.error;
        }
        rt->compat_ = rt->version_->check();
    }
    try {
        rt->version_->record_check(rt->compat_);
    } catch (const StoreError& e) {
        warn() << "Cannot record compatibility check: " << e.what();
    }

    info() << "Opened store at " << cfg->data_root << ": " << rt->catalog_->size()
           << " collection(s), engine " << versions::kEngineVersion
           << (rt->compat_.compatible ? "" : " (incompatible, read-only)");
    return rt;
}

void StoreRuntime::prepare_layout() {
    auto cfg = config_.current();
    const std::string dirs[] = {
        cfg->data_root,
        cfg->collections_dir(),
        cfg->backups_dir(),
        cfg->path_in_root(layout::kTrashDir),
    };
    for (const auto& dir : dirs) {
        FSResult r = PlatformFS::ensure_directory(dir);
        if (!r.ok) {
            throw StorageUnavailableError("cannot create " + dir + ": " + errnoWithDescription(r.err));
        }
    }
}

void StoreRuntime::wire() {
    auto cfg = config_.current();
    const std::string& root = cfg->data_root;

    catalog_.reset(new JsonCatalogStore(root, clock_));
    vectors_.reset(new FileVectorStore(root, clock_));
    inspector_.reset(new FilesystemInspector(root));
    events_.reset(new SyncEventQueue(cfg->sync_queue_capacity, clock_));
    backups_.reset(new BackupManager(config_, *catalog_, *vectors_, clock_));
    checker_.reset(new ConsistencyChecker(config_, *catalog_, *inspector_, *vectors_, clock_));
    version_.reset(new VersionChecker(config_, clock_));
    planner_.reset(new RecoveryPlanner(config_, *checker_, *catalog_, *vectors_, *inspector_, clock_));
    executor_.reset(new RecoveryExecutor(config_, *catalog_, *vectors_, *inspector_, *version_,
                                         locks_, events_.get(), clock_));
    repair_.reset(new AutoRepair(*catalog_, *inspector_, locks_, *backups_, *planner_, *executor_, *version_));
    migrations_.reset(new MigrationManager(config_, *version_, *backups_, *catalog_, clock_));
    ops_.reset(new TransactionalOps(config_, *catalog_, *vectors_, *backups_, *checker_,
                                    *version_, locks_, *events_, clock_));
}

bool StoreRuntime::reload_config() {
    if (config_.source_path().empty()) {
        return false;
    }
    if (!config_.reload()) {
        warn() << "Config reload failed: " << config_.last_error();
        return false;
    }
    auto cfg = config_.current();
    if (!setLogLevelFromString(cfg->log_level)) {
        warn() << "Unknown log_level '" << cfg->log_level << "'";
    }
    info() << "Config reloaded (generation " << config_.generation() << ")";
    return true;
}

} // namespace persist
} // namespace vstore
