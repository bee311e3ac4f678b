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

#include <iostream>
#include <string>
#include <vector>
#include "../src/persistence/store_runtime.h"
#include "../src/util/log.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

using namespace vstore;
using namespace vstore::persist;

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void usage() {
    std::cerr <<
        "usage: vstore_admin [--config <file>] <data_root> <command> [args]\n"
        "\n"
        "commands:\n"
        "  check [--full]                          consistency report\n"
        "  scan                                    recovery candidates\n"
        "  recover [--dry-run]                     register orphaned directories\n"
        "  repair [--allow-catalog-cleanup] [--dry-run]\n"
        "  backups                                 list archives\n"
        "  cleanup                                 apply backup retention\n"
        "  checkpoint [<collection_id>...]         archive (no ids = full)\n"
        "  restore <archive_id>\n"
        "  delete <collection_id>\n"
        "  rename <collection_id> <display_name>\n"
        "  version                                 compatibility report\n"
        "  migrate [--plan]\n"
        "  events                                  sync status\n";
}

bool has_flag(const std::vector<std::string>& args, const char* flag) {
    for (const auto& a : args) {
        if (a == flag) return true;
    }
    return false;
}

void write_string_map(JsonWriter& w, const std::map<std::string, std::string>& m) {
    w.StartObject();
    for (const auto& kv : m) {
        w.Key(kv.first.c_str());
        w.String(kv.second.c_str());
    }
    w.EndObject();
}

void write_issue(JsonWriter& w, const ConsistencyIssue& issue) {
    w.StartObject();
    w.Key("kind");
    w.String(issue_kind(issue));
    w.Key("collection_id");
    w.String(issue_collection_id(issue).c_str());
    if (const auto* ov = std::get_if<OrphanedVector>(&issue)) {
        w.Key("dir");
        w.String(ov->dir.c_str());
        w.Key("est_size");
        w.Uint64(ov->est_size);
        w.Key("est_count");
        w.Uint64(ov->est_count);
    } else if (const auto* dm = std::get_if<DimensionMismatch>(&issue)) {
        w.Key("expected");
        w.Uint(dm->expected);
        w.Key("observed");
        w.Uint(dm->observed);
    } else if (const auto* uc = std::get_if<UnreadableCollection>(&issue)) {
        w.Key("reason");
        w.String(uc->reason.c_str());
    }
    w.EndObject();
}

void write_report(JsonWriter& w, const ConsistencyReport& r) {
    w.StartObject();
    w.Key("status");
    w.String(to_string(r.status));
    w.Key("full");
    w.Bool(r.full);
    w.Key("generated_at");
    w.String(format_iso8601(r.generated_unix_ms).c_str());
    w.Key("catalog_count");
    w.Uint64(r.catalog_count);
    w.Key("physical_count");
    w.Uint64(r.physical_count);
    if (!r.error_message.empty()) {
        w.Key("error");
        w.String(r.error_message.c_str());
    }
    w.Key("issues");
    w.StartArray();
    for (const auto& issue : r.issues) {
        write_issue(w, issue);
    }
    w.EndArray();
    w.EndObject();
}

void write_archive(JsonWriter& w, const BackupArchive& a) {
    w.StartObject();
    w.Key("backup_id");
    w.String(a.backup_id.c_str());
    w.Key("type");
    w.String(to_string(a.type));
    w.Key("created_at");
    w.String(format_iso8601(a.created_unix_ms).c_str());
    w.Key("size_bytes");
    w.Uint64(a.size_bytes);
    w.Key("operation_id");
    w.String(a.operation_id.c_str());
    w.Key("sources");
    w.StartArray();
    for (const auto& s : a.sources) {
        w.String(s.collection_id.c_str());
    }
    w.EndArray();
    w.EndObject();
}

void write_events(JsonWriter& w, const std::vector<SyncEvent>& events) {
    w.StartArray();
    for (const auto& e : events) {
        w.StartObject();
        w.Key("event_id");
        w.String(e.event_id.c_str());
        w.Key("kind");
        w.String(to_string(e.kind));
        w.Key("collection_id");
        w.String(e.collection_id.c_str());
        w.Key("timestamp");
        w.String(format_iso8601(e.timestamp_unix_ms).c_str());
        w.Key("details");
        write_string_map(w, e.details);
        w.EndObject();
    }
    w.EndArray();
}

void write_result(JsonWriter& w, const OperationResult& r, SyncEventQueue& events) {
    w.StartObject();
    w.Key("success");
    w.Bool(r.success);
    w.Key("operation_id");
    w.String(r.operation_id.c_str());
    w.Key("kind");
    w.String(to_string(r.kind));
    w.Key("collection_id");
    w.String(r.collection_id.c_str());
    w.Key("new_collection_id");
    w.String(r.new_collection_id.c_str());
    w.Key("phase_reached");
    w.String(to_string(r.phase_reached));
    w.Key("final_state");
    w.String(to_string(r.final_state));
    w.Key("checkpoint");
    w.String(r.checkpoint_archive_id.c_str());
    w.Key("consistency_verified");
    w.Bool(r.consistency_verified);
    w.Key("rollback");
    w.String(to_string(r.rollback_outcome));
    if (!r.success) {
        w.Key("error_kind");
        w.String(to_string(r.error_kind));
        w.Key("message");
        w.String(r.message.c_str());
    }
    w.Key("details");
    write_string_map(w, r.details);
    w.Key("events");
    write_events(w, events.drain());
    w.EndObject();
}

void write_repair_actions(JsonWriter& w, const char* key, const std::vector<RepairAction>& actions) {
    w.Key(key);
    w.StartArray();
    for (const auto& a : actions) {
        w.StartObject();
        w.Key("collection_id");
        w.String(a.collection_id.c_str());
        w.Key("issue");
        w.String(a.issue_kind.c_str());
        w.Key("action");
        w.String(a.action.c_str());
        w.Key("detail");
        w.String(a.detail.c_str());
        w.EndObject();
    }
    w.EndArray();
}

int run_command(StoreRuntime& rt, const std::string& cmd, const std::vector<std::string>& args, JsonWriter& w) {
    if (cmd == "check") {
        ConsistencyReport r = rt.checker().check(has_flag(args, "--full"));
        rt.events().note_consistency(r);
        write_report(w, r);
        return r.status == ConsistencyStatus::Error ? 1 : 0;
    }

    if (cmd == "scan") {
        auto candidates = rt.planner().scan();
        w.StartArray();
        for (const auto& c : candidates) {
            w.StartObject();
            w.Key("collection_id");
            w.String(c.collection_id.c_str());
            w.Key("dir");
            w.String(c.dir.c_str());
            w.Key("est_size");
            w.Uint64(c.est_size);
            w.Key("est_count");
            w.Uint64(c.est_count);
            w.Key("recoverable");
            w.Bool(c.recoverable);
            if (!c.recoverable) {
                w.Key("reason");
                w.String(c.reason_if_not.c_str());
            }
            w.Key("dimension");
            if (c.inferred_dimension) {
                w.Uint(*c.inferred_dimension);
            } else {
                w.String("unknown");
            }
            w.Key("priority");
            w.String(to_string(c.priority));
            w.EndObject();
        }
        w.EndArray();
        return 0;
    }

    if (cmd == "recover") {
        auto plan = rt.planner().plan(rt.planner().scan());
        w.StartObject();
        w.Key("planned");
        w.StartArray();
        for (const auto& p : plan) {
            w.StartObject();
            w.Key("collection_id");
            w.String(p.record.collection_id.c_str());
            w.Key("display_name");
            w.String(p.record.display_name.c_str());
            w.Key("dimension");
            w.String(dimension_label(p.record.embedding).c_str());
            w.Key("priority");
            w.String(to_string(p.priority));
            w.EndObject();
        }
        w.EndArray();
        int rc = 0;
        if (!has_flag(args, "--dry-run")) {
            RecoveryResult rr = rt.executor().execute(plan);
            w.Key("succeeded");
            w.StartArray();
            for (const auto& rec : rr.succeeded) {
                w.String(rec.collection_id.c_str());
            }
            w.EndArray();
            w.Key("failed");
            w.StartArray();
            for (const auto& f : rr.failed) {
                w.StartObject();
                w.Key("collection_id");
                w.String(f.collection_id.c_str());
                w.Key("reason");
                w.String(f.reason.c_str());
                w.EndObject();
            }
            w.EndArray();
            rc = rr.failed.empty() ? 0 : 1;
        }
        w.EndObject();
        return rc;
    }

    if (cmd == "repair") {
        RepairPolicy policy = RepairPolicy::from(*rt.config().current());
        if (has_flag(args, "--allow-catalog-cleanup")) policy.allow_orphan_catalog_cleanup = true;
        policy.dry_run = has_flag(args, "--dry-run");
        ConsistencyReport report = rt.checker().check(true);
        RepairResult result = rt.repair().repair(report, policy);
        w.StartObject();
        w.Key("dry_run");
        w.Bool(result.dry_run);
        write_repair_actions(w, "repaired", result.repaired);
        write_repair_actions(w, "failed", result.failed);
        write_repair_actions(w, "skipped", result.skipped);
        w.EndObject();
        return result.failed.empty() ? 0 : 1;
    }

    if (cmd == "backups") {
        w.StartArray();
        for (const auto& a : rt.backups().list()) {
            write_archive(w, a);
        }
        w.EndArray();
        return 0;
    }

    if (cmd == "cleanup") {
        w.StartObject();
        w.Key("deleted");
        w.StartArray();
        for (const auto& a : rt.backups().cleanup()) {
            write_archive(w, a);
        }
        w.EndArray();
        w.EndObject();
        return 0;
    }

    if (cmd == "checkpoint") {
        write_archive(w, rt.backups().checkpoint(args));
        return 0;
    }

    if (cmd == "restore" && args.size() == 1) {
        OperationResult r = rt.ops().restore_archive(args[0]);
        write_result(w, r, rt.events());
        return r.success ? 0 : 1;
    }

    if (cmd == "delete" && args.size() == 1) {
        OperationResult r = rt.ops().delete_collection(args[0]);
        write_result(w, r, rt.events());
        return r.success ? 0 : 1;
    }

    if (cmd == "rename" && args.size() == 2) {
        OperationResult r = rt.ops().rename_collection(args[0], args[1]);
        write_result(w, r, rt.events());
        return r.success ? 0 : 1;
    }

    if (cmd == "version") {
        CompatibilityReport r = rt.version().check();
        w.StartObject();
        w.Key("compatible");
        w.Bool(r.compatible);
        w.Key("migration_needed");
        w.Bool(r.migration_needed);
        w.Key("mutations_allowed");
        w.Bool(rt.version().mutations_allowed(r));
        w.Key("stored_engine_version");
        w.String(r.stored_engine_version.c_str());
        w.Key("stored_schema_version");
        w.Uint(r.stored_schema_version);
        w.Key("running_engine_version");
        w.String(versions::kEngineVersion);
        w.Key("running_schema_version");
        w.Uint(versions::kSchemaVersion);
        w.Key("issues");
        w.StartArray();
        for (const auto& i : r.issues) {
            w.String(i.c_str());
        }
        w.EndArray();
        w.EndObject();
        return 0;
    }

    if (cmd == "migrate") {
        MigrationPlan plan = rt.migrations().plan();
        w.StartObject();
        w.Key("needed");
        w.Bool(plan.needed);
        w.Key("from");
        w.String((plan.from_engine + "/" + std::to_string(plan.from_schema)).c_str());
        w.Key("to");
        w.String((plan.to_engine + "/" + std::to_string(plan.to_schema)).c_str());
        w.Key("steps");
        w.StartArray();
        for (const auto& s : plan.steps) {
            w.String(s.description.c_str());
        }
        w.EndArray();
        w.Key("risks");
        w.StartArray();
        for (const auto& r : plan.risks) {
            w.String(r.c_str());
        }
        w.EndArray();
        w.Key("backup_required");
        w.Bool(plan.backup_required);
        int rc = 0;
        if (!has_flag(args, "--plan") && plan.needed) {
            MigrationOutcome out = rt.migrations().execute();
            w.Key("success");
            w.Bool(out.success);
            w.Key("backup_id");
            w.String(out.backup_id.c_str());
            if (!out.success) {
                w.Key("error");
                w.String(out.error.c_str());
                w.Key("restored");
                w.Bool(out.restored);
                rc = 1;
            }
        }
        w.EndObject();
        return rc;
    }

    if (cmd == "events") {
        rt.events().note_consistency(rt.checker().check(false));
        SyncStatus s = rt.events().status();
        w.StartObject();
        w.Key("sync_status");
        w.String(to_string(s.sync_status));
        w.Key("pending");
        w.Uint64(s.pending);
        w.Key("dropped");
        w.Uint64(s.dropped);
        w.Key("published");
        w.Uint64(s.published);
        w.Key("last_consistency");
        w.String(to_string(s.last_consistency));
        w.Key("events");
        write_events(w, rt.events().drain());
        w.EndObject();
        return 0;
    }

    usage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    initLoggingFromEnv();

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_file;
    if (args.size() >= 2 && args[0] == "--config") {
        config_file = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.size() < 2) {
        usage();
        return 2;
    }

    // The data_root argument wins over the file
    StoreConfig cfg = StoreConfig::defaults();
    if (!config_file.empty()) {
        ConfigContext file_config(cfg);
        if (!file_config.load(config_file)) {
            std::cerr << "cannot load " << config_file << ": " << file_config.last_error() << "\n";
            return 2;
        }
        cfg = *file_config.current();
    }
    cfg.data_root = args[0];
    std::string why;
    if (!cfg.validate(&why)) {
        std::cerr << "invalid configuration: " << why << "\n";
        return 2;
    }
    ConfigContext config(cfg);

    const std::string cmd = args[1];
    std::vector<std::string> rest(args.begin() + 2, args.end());

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);
    int rc = 0;
    try {
        auto rt = StoreRuntime::open(config);
        rc = run_command(*rt, cmd, rest, writer);
    } catch (const StoreError& e) {
        std::cerr << "error (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    if (rc != 2) {
        std::cout << buffer.GetString() << std::endl;
    }
    return rc;
}
