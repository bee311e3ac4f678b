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

#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "persistence/config.h"
#include "persistence/errors.h"
#include "persistence/store_config.h"
#include "persistence/test_helpers.h"

using namespace vstore::persist;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = test::create_temp_dir("vstore_config_test");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_config(const std::string& name, const std::string& json) {
        std::string path = test_dir + "/" + name;
        test::write_file(path, json);
        return path;
    }
};

TEST_F(ConfigTest, LayoutConstants) {
    EXPECT_STREQ(layout::kCatalogFile, "catalog.json");
    EXPECT_STREQ(layout::kVersionFile, "version_info.json");
    EXPECT_EQ(engine::kHeaderSize, 48u);
    EXPECT_GE(versions::kSchemaVersion, versions::kMinReadableSchemaVersion);
}

TEST_F(ConfigTest, DefaultsAreValid) {
    StoreConfig cfg;
    std::string why;
    EXPECT_TRUE(cfg.validate(&why)) << why;
    EXPECT_EQ(cfg.retention_count, 10u);
    EXPECT_EQ(cfg.retention_days, 30u);
    EXPECT_FALSE(cfg.allow_orphan_catalog_cleanup);
    EXPECT_FALSE(cfg.allow_incompatible_mutations);
}

TEST_F(ConfigTest, DerivedPaths) {
    StoreConfig cfg = test::make_config(test_dir);
    EXPECT_EQ(cfg.collections_dir(), (fs::path(test_dir) / "collections").string());
    EXPECT_EQ(cfg.backups_dir(), (fs::path(test_dir) / "backups").string());
    EXPECT_EQ(cfg.path_in_root(layout::kCatalogFile), (fs::path(test_dir) / "catalog.json").string());

    cfg.backup_root = test_dir + "/elsewhere";
    EXPECT_EQ(cfg.backups_dir(), test_dir + "/elsewhere");
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    std::string why;

    StoreConfig cfg = test::make_config(test_dir);
    cfg.data_root.clear();
    EXPECT_FALSE(cfg.validate(&why));
    EXPECT_NE(why.find("data_root"), std::string::npos);

    cfg = test::make_config(test_dir);
    cfg.retention_count = 0;
    EXPECT_FALSE(cfg.validate(&why));
    EXPECT_NE(why.find("retention_count"), std::string::npos);

    cfg = test::make_config(test_dir);
    cfg.sync_queue_capacity = 0;
    EXPECT_FALSE(cfg.validate(&why));

    cfg = test::make_config(test_dir);
    cfg.consistency_sample_size = 0;
    EXPECT_FALSE(cfg.validate(&why));

    cfg = test::make_config(test_dir);
    cfg.log_level = "chatty";
    EXPECT_FALSE(cfg.validate(&why));

    cfg.log_level = "debug";
    EXPECT_TRUE(cfg.validate(&why)) << why;
}

TEST_F(ConfigTest, ContextRejectsInvalidInitialConfig) {
    StoreConfig cfg = test::make_config(test_dir);
    cfg.retention_count = 0;
    EXPECT_THROW(ConfigContext ctx(cfg), std::invalid_argument);
}

TEST_F(ConfigTest, LoadOverlaysFileOnCurrentSnapshot) {
    ConfigContext ctx(test::make_config(test_dir));
    std::string path = write_config("vstore.json",
        "{\"retention_count\": 3, \"retention_days\": 7, \"allow_orphan_catalog_cleanup\": true}");

    ASSERT_TRUE(ctx.load(path)) << ctx.last_error();
    auto cfg = ctx.current();
    EXPECT_EQ(cfg->retention_count, 3u);
    EXPECT_EQ(cfg->retention_days, 7u);
    EXPECT_TRUE(cfg->allow_orphan_catalog_cleanup);
    // Untouched keys keep their values
    EXPECT_EQ(cfg->data_root, test_dir);
    EXPECT_EQ(cfg->log_level, "WARNING");
    EXPECT_EQ(ctx.source_path(), path);
}

TEST_F(ConfigTest, LoadFailuresKeepSnapshot) {
    ConfigContext ctx(test::make_config(test_dir));
    uint64_t gen = ctx.generation();

    EXPECT_FALSE(ctx.load(test_dir + "/missing.json"));
    EXPECT_FALSE(ctx.load(write_config("broken.json", "{\"retention_count\": ")));
    EXPECT_FALSE(ctx.load(write_config("array.json", "[1, 2]")));
    EXPECT_FALSE(ctx.load(write_config("invalid.json", "{\"retention_count\": 0}")));

    EXPECT_EQ(ctx.generation(), gen);
    EXPECT_EQ(ctx.current()->retention_count, 10u);
    EXPECT_FALSE(ctx.last_error().empty());
}

TEST_F(ConfigTest, FirstLoadMayMoveDataRootReloadMayNot) {
    ConfigContext ctx(test::make_config(test_dir));
    std::string moved = test_dir + "/moved";
    std::string path = write_config("vstore.json", "{\"data_root\": \"" + moved + "\"}");

    ASSERT_TRUE(ctx.load(path)) << ctx.last_error();
    EXPECT_EQ(ctx.current()->data_root, moved);

    test::write_file(path, "{\"data_root\": \"" + test_dir + "/other\", \"retention_count\": 4}");
    EXPECT_FALSE(ctx.reload());
    EXPECT_EQ(ctx.current()->data_root, moved);
    EXPECT_EQ(ctx.current()->retention_count, 10u);

    test::write_file(path, "{\"data_root\": \"" + moved + "\", \"retention_count\": 4}");
    ASSERT_TRUE(ctx.reload()) << ctx.last_error();
    EXPECT_EQ(ctx.current()->retention_count, 4u);
}

TEST_F(ConfigTest, ReloadWithoutSourceFails) {
    ConfigContext ctx(test::make_config(test_dir));
    EXPECT_FALSE(ctx.reload());
}

TEST_F(ConfigTest, UpdateRejectsDataRootChange) {
    ConfigContext ctx(test::make_config(test_dir));
    uint64_t gen = ctx.generation();

    StoreConfig next = *ctx.current();
    next.retention_days = 1;
    ASSERT_TRUE(ctx.update(next));
    EXPECT_EQ(ctx.generation(), gen + 1);

    next.data_root = test_dir + "/elsewhere";
    EXPECT_FALSE(ctx.update(next));
    EXPECT_EQ(ctx.current()->data_root, test_dir);
}

TEST_F(ConfigTest, SnapshotsAreStableAcrossUpdates) {
    ConfigContext ctx(test::make_config(test_dir));
    auto before = ctx.current();

    StoreConfig next = *before;
    next.retention_count = 2;
    ASSERT_TRUE(ctx.update(next));

    // A reader holding the old snapshot is not affected
    EXPECT_EQ(before->retention_count, 10u);
    EXPECT_EQ(ctx.current()->retention_count, 2u);
}

TEST_F(ConfigTest, ErrorKindNames) {
    EXPECT_STREQ(to_string(ErrorKind::NotFound), "not_found");
    EXPECT_STREQ(to_string(OperationPhase::Verifying), "verifying");
    EXPECT_STREQ(to_string(RollbackOutcome::Succeeded), "succeeded");

    UnrecoverableStateError err("restore failed", "col_a", OperationPhase::Executing);
    EXPECT_EQ(err.kind(), ErrorKind::UnrecoverableState);
    EXPECT_EQ(err.rollback(), RollbackOutcome::Failed);
    EXPECT_EQ(err.collection_id(), "col_a");
}
