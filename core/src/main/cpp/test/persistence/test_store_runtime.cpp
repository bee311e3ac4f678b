/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include "persistence/store_runtime.h"
#include "persistence/config.h"
#include "persistence/errors.h"
#include "persistence/test_helpers.h"
#include <filesystem>

namespace vstore {
namespace persist {
namespace test {

namespace fs = std::filesystem;

namespace {

const char* kLegacyCatalog = R"({
  "collections": [
    { "collection_id": "col_old", "display_name": "Legacy docs",
      "provider": "sentence_transformers", "model": "all-MiniLM-L6-v2", "dimension": 8,
      "item_count": 4, "created_unix_ms": 100, "updated_unix_ms": 100 }
  ]
})";

} // namespace

class StoreRuntimeTest : public ::testing::Test {
protected:
    std::string test_dir_;
    ManualClock clock_;

    void SetUp() override {
        test_dir_ = create_temp_dir("vstore_runtime_test");
    }

    void TearDown() override {
        if (!test_dir_.empty()) {
            fs::remove_all(test_dir_);
        }
    }

    void MakeLegacyStore() {
        write_file(test_dir_ + "/catalog.json", kLegacyCatalog);
        FileVectorStore vectors(test_dir_, clock_.fn());
        vectors.create("col_old", 8);
        vectors.add_items("col_old", make_items(4, 8));
    }
};

TEST_F(StoreRuntimeTest, OpenPreparesFreshStore) {
    ConfigContext config(make_config(test_dir_ + "/data"));
    auto rt = StoreRuntime::open(config, clock_.fn());

    EXPECT_TRUE(fs::is_directory(test_dir_ + "/data/collections"));
    EXPECT_TRUE(fs::is_directory(test_dir_ + "/data/backups"));
    EXPECT_TRUE(fs::is_directory(test_dir_ + "/data/" + layout::kTrashDir));

    auto vinfo = rt->version().load();
    ASSERT_TRUE(vinfo.has_value());
    EXPECT_EQ(vinfo->engine_version, versions::kEngineVersion);
    EXPECT_EQ(vinfo->schema_version, versions::kSchemaVersion);
    EXPECT_EQ(vinfo->last_check_unix_ms, clock_.now());

    EXPECT_TRUE(rt->compatibility_at_open().compatible);
    EXPECT_EQ(rt->catalog().size(), 0u);
    EXPECT_TRUE(rt->checker().check(false).consistent());
    EXPECT_EQ(&rt->config(), &config);
}

TEST_F(StoreRuntimeTest, ReopenSeesCommittedState) {
    ConfigContext config(make_config(test_dir_));
    std::string id;
    {
        auto rt = StoreRuntime::open(config, clock_.fn());
        SentenceTransformerEmbedding st;
        auto r = rt->ops().create_collection("persisted", st);
        ASSERT_TRUE(r.success) << r.message;
        id = r.new_collection_id;
        rt->vectors().add_items(id, make_items(9, 384));
    }

    auto rt = StoreRuntime::open(config, clock_.fn());
    auto rec = rt->catalog().get(id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->display_name, "persisted");
    EXPECT_EQ(rt->vectors().count(id), 9u);
    EXPECT_EQ(rt->backups().list().size(), 1u);
    EXPECT_TRUE(rt->checker().check(true).consistent());
}

TEST_F(StoreRuntimeTest, LegacyStoreOpensReadOnly) {
    MakeLegacyStore();
    ConfigContext config(make_config(test_dir_));
    auto rt = StoreRuntime::open(config, clock_.fn());

    const auto& compat = rt->compatibility_at_open();
    EXPECT_TRUE(compat.legacy);
    EXPECT_FALSE(compat.compatible);
    EXPECT_TRUE(compat.migration_needed);
    EXPECT_FALSE(fs::exists(rt->version().version_file()));

    // Reads still work
    ASSERT_TRUE(rt->catalog().contains("col_old"));
    EXPECT_EQ(rt->vectors().count("col_old"), 4u);

    auto r = rt->ops().delete_collection("col_old");
    EXPECT_EQ(r.error_kind, ErrorKind::IncompatibleVersion);
    EXPECT_TRUE(rt->vectors().exists("col_old"));
}

TEST_F(StoreRuntimeTest, OpensReadOnlyWithNewerCatalogSchema) {
    ConfigContext config(make_config(test_dir_));
    std::string id;
    {
        auto rt = StoreRuntime::open(config, clock_.fn());
        SentenceTransformerEmbedding st;
        auto r = rt->ops().create_collection("future", st);
        ASSERT_TRUE(r.success) << r.message;
        id = r.new_collection_id;
    }
    const std::string newer_catalog = R"({"schema_version": 99, "collections": []})";
    write_file(test_dir_ + "/catalog.json", newer_catalog);

    auto rt = StoreRuntime::open(config, clock_.fn());
    EXPECT_FALSE(rt->compatibility_at_open().compatible);
    EXPECT_FALSE(rt->compatibility_at_open().migration_needed);
    EXPECT_FALSE(rt->version().check().compatible);
    EXPECT_EQ(rt->catalog().size(), 0u);

    auto r = rt->ops().delete_collection(id);
    EXPECT_EQ(r.error_kind, ErrorKind::IncompatibleVersion);
    EXPECT_TRUE(rt->vectors().exists(id));
    EXPECT_EQ(read_file(test_dir_ + "/catalog.json"), newer_catalog);

    auto report = rt->checker().check(false);
    EXPECT_THROW(rt->repair().repair(report, RepairPolicy{}), IncompatibleVersionError);
    EXPECT_EQ(read_file(test_dir_ + "/catalog.json"), newer_catalog);
}

TEST_F(StoreRuntimeTest, NewerCatalogSchemaRefusedWhenMutationsForced) {
    {
        ConfigContext config(make_config(test_dir_));
        StoreRuntime::open(config, clock_.fn());
    }
    write_file(test_dir_ + "/catalog.json", R"({"schema_version": 99, "collections": []})");

    StoreConfig cfg = make_config(test_dir_);
    cfg.allow_incompatible_mutations = true;
    ConfigContext config(cfg);
    EXPECT_THROW(StoreRuntime::open(config, clock_.fn()), IncompatibleVersionError);
}

TEST_F(StoreRuntimeTest, AutoMigrateUpgradesLegacyStore) {
    MakeLegacyStore();
    StoreConfig cfg = make_config(test_dir_);
    cfg.auto_migrate = true;
    ConfigContext config(cfg);
    auto rt = StoreRuntime::open(config, clock_.fn());

    EXPECT_TRUE(rt->compatibility_at_open().compatible);
    EXPECT_FALSE(rt->compatibility_at_open().migration_needed);
    EXPECT_EQ(rt->backups().list().size(), 1u);

    auto rec = rt->catalog().get("col_old");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(dimension_of(rec->embedding), 8u);

    auto r = rt->ops().rename_collection("col_old", "Current docs");
    EXPECT_TRUE(r.success) << r.message;
}

TEST_F(StoreRuntimeTest, LogDirReceivesLogOutput) {
    StoreConfig cfg = make_config(test_dir_);
    cfg.log_dir = test_dir_ + "/logs";
    cfg.log_level = "INFO";
    ConfigContext config(cfg);
    {
        auto rt = StoreRuntime::open(config, clock_.fn());
        EXPECT_TRUE(fs::exists(test_dir_ + "/logs/vstore.log"));
    }
    std::string contents = read_file(test_dir_ + "/logs/vstore.log");
    EXPECT_NE(contents.find("Opened store"), std::string::npos);
    setLogLevelFromString("WARNING");
}

TEST_F(StoreRuntimeTest, ReloadConfigPicksUpFileChanges) {
    const std::string path = test_dir_ + "/vstore.json";
    write_file(path, "{ \"data_root\": \"" + test_dir_ + "/data\", \"retention_count\": 4, "
                     "\"log_level\": \"WARNING\" }");
    ConfigContext config;
    ASSERT_TRUE(config.load(path)) << config.last_error();
    auto rt = StoreRuntime::open(config, clock_.fn());
    EXPECT_EQ(config.current()->retention_count, 4u);
    uint64_t gen = config.generation();

    write_file(path, "{ \"data_root\": \"" + test_dir_ + "/data\", \"retention_count\": 2, "
                     "\"log_level\": \"WARNING\" }");
    EXPECT_TRUE(rt->reload_config());
    EXPECT_EQ(config.current()->retention_count, 2u);
    EXPECT_GT(config.generation(), gen);

    // Moving the data root under a running store is refused
    write_file(path, "{ \"data_root\": \"" + test_dir_ + "/elsewhere\" }");
    EXPECT_FALSE(rt->reload_config());
    EXPECT_EQ(config.current()->data_root, test_dir_ + "/data");
    EXPECT_EQ(config.current()->retention_count, 2u);
}

TEST_F(StoreRuntimeTest, ReloadWithoutConfigFileFails) {
    ConfigContext config(make_config(test_dir_));
    auto rt = StoreRuntime::open(config, clock_.fn());
    EXPECT_FALSE(rt->reload_config());
}

TEST_F(StoreRuntimeTest, UnwritableRootIsStorageUnavailable) {
    write_file(test_dir_ + "/blocker", "not a directory");
    ConfigContext config(make_config(test_dir_ + "/blocker"));
    EXPECT_THROW(StoreRuntime::open(config, clock_.fn()), StorageUnavailableError);
}

} // namespace test
} // namespace persist
} // namespace vstore
