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
#include <memory>
#include <set>
#include <string>
#include <thread>
#include "persistence/backup_manager.h"
#include "persistence/catalog_store.h"
#include "persistence/config.h"
#include "persistence/errors.h"
#include "persistence/vector_store.h"
#include "persistence/test_helpers.h"
#include "util/time_util.h"

using namespace vstore;
using namespace vstore::persist;
namespace fs = std::filesystem;

class BackupManagerTest : public ::testing::Test {
protected:
    std::string test_dir;
    test::ManualClock clock;
    std::unique_ptr<ConfigContext> config;
    std::unique_ptr<JsonCatalogStore> catalog;
    std::unique_ptr<FileVectorStore> vectors;
    std::unique_ptr<BackupManager> backups;

    void SetUp() override {
        test_dir = test::create_temp_dir("vstore_backup_test");
        config = std::make_unique<ConfigContext>(test::make_config(test_dir));
        catalog = std::make_unique<JsonCatalogStore>(test_dir, clock.fn());
        catalog->load();
        vectors = std::make_unique<FileVectorStore>(test_dir, clock.fn());
        backups = std::make_unique<BackupManager>(*config, *catalog, *vectors, clock.fn());
    }

    void TearDown() override {
        backups.reset();
        vectors.reset();
        catalog.reset();
        config.reset();
        fs::remove_all(test_dir);
    }

    void make_collection(const std::string& id, const std::string& name, size_t n, uint32_t dim = 8) {
        vectors->create(id, dim);
        if (n > 0) {
            vectors->add_items(id, test::make_items(n, dim, id));
        }
        CollectionRecord r;
        r.collection_id = id;
        r.display_name = name;
        r.embedding = SentenceTransformerEmbedding{"all-MiniLM-L6-v2", dim};
        r.item_count = n;
        r.created_unix_ms = clock.now();
        r.updated_unix_ms = clock.now();
        catalog->put(r);
    }
};

TEST_F(BackupManagerTest, CheckpointWritesSelfContainedArchive) {
    make_collection("col_a", "Alpha", 20);

    BackupArchive a = backups->checkpoint({"col_a"}, "delete_x_1");
    EXPECT_EQ(a.type, ArchiveType::SingleCollection);
    EXPECT_EQ(a.operation_id, "delete_x_1");
    EXPECT_EQ(a.created_unix_ms, clock.now());
    EXPECT_EQ(a.schema_version, versions::kSchemaVersion);
    ASSERT_EQ(a.sources.size(), 1u);
    EXPECT_TRUE(a.sources[0].had_record);
    EXPECT_TRUE(a.sources[0].had_physical);
    EXPECT_GT(a.size_bytes, 0u);
    EXPECT_NE(a.snapshot_crc32c, 0u);

    EXPECT_TRUE(fs::exists(a.path + "/manifest.json"));
    EXPECT_TRUE(fs::exists(a.path + "/catalog_snapshot.json"));
    EXPECT_TRUE(fs::exists(a.path + "/collections/col_a/vectors.bin"));

    auto listed = backups->get(a.backup_id);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->snapshot_crc32c, a.snapshot_crc32c);
    EXPECT_EQ(listed->operation_id, "delete_x_1");
}

TEST_F(BackupManagerTest, RestoreOfCheckpointIsIdentity) {
    make_collection("col_a", "Alpha", 50);
    auto record_before = catalog->get("col_a");
    auto items_before = vectors->read_items("col_a");

    BackupArchive a = backups->checkpoint({"col_a"});

    // Mutate both sides
    vectors->add_items("col_a", test::make_items(5, 8, "extra"));
    CollectionRecord changed = *record_before;
    changed.display_name = "Changed";
    catalog->put(changed);

    backups->restore(a.backup_id);
    EXPECT_EQ(*catalog->get("col_a"), *record_before);
    EXPECT_EQ(vectors->read_items("col_a"), items_before);

    // Restoring twice changes nothing
    backups->restore(a.backup_id);
    EXPECT_EQ(*catalog->get("col_a"), *record_before);
    EXPECT_EQ(vectors->count("col_a"), 50u);
}

TEST_F(BackupManagerTest, RestoreBringsBackDeletedCollection) {
    make_collection("col_a", "Alpha", 10);
    BackupArchive a = backups->checkpoint({"col_a"});

    vectors->drop("col_a");
    catalog->remove("col_a");

    backups->restore(a.backup_id);
    EXPECT_TRUE(catalog->contains("col_a"));
    EXPECT_EQ(vectors->count("col_a"), 10u);
}

TEST_F(BackupManagerTest, AbsenceIsRestoredToo) {
    // Checkpoint of an id that does not exist yet, as taken before a create
    BackupArchive a = backups->checkpoint({"col_new"});
    ASSERT_EQ(a.sources.size(), 1u);
    EXPECT_FALSE(a.sources[0].had_record);
    EXPECT_FALSE(a.sources[0].had_physical);

    make_collection("col_new", "New", 3);
    backups->restore(a.backup_id);
    EXPECT_FALSE(catalog->contains("col_new"));
    EXPECT_FALSE(vectors->exists("col_new"));
}

TEST_F(BackupManagerTest, FullArchiveRemovesLaterCollections) {
    make_collection("col_a", "Alpha", 4);
    fs::create_directories(test_dir + "/collections");
    vectors->create("col_orphan", 8);

    BackupArchive full = backups->checkpoint({});
    EXPECT_EQ(full.type, ArchiveType::Full);
    EXPECT_EQ(full.sources.size(), 2u);

    make_collection("col_b", "Beta", 2);
    catalog->remove("col_a");

    backups->restore(full.backup_id);
    EXPECT_TRUE(catalog->contains("col_a"));
    EXPECT_FALSE(catalog->contains("col_b"));
    EXPECT_FALSE(vectors->exists("col_b"));
    EXPECT_TRUE(vectors->exists("col_orphan"));
}

TEST_F(BackupManagerTest, SnapshotChecksumMismatchBlocksRestore) {
    make_collection("col_a", "Alpha", 4);
    BackupArchive a = backups->checkpoint({"col_a"});

    std::string snapshot = a.path + "/catalog_snapshot.json";
    std::string json = test::read_file(snapshot);
    json.replace(json.find("Alpha"), 5, "Omega");
    test::write_file(snapshot, json);

    catalog->remove("col_a");
    EXPECT_THROW(backups->restore(a.backup_id), IntegrityError);
    EXPECT_FALSE(catalog->contains("col_a"));
}

TEST_F(BackupManagerTest, RestoreUnknownArchive) {
    EXPECT_THROW(backups->restore("backup_missing"), NotFoundError);
    EXPECT_THROW(backups->restore("../etc"), InvalidArgumentError);
}

TEST_F(BackupManagerTest, ListIsNewestFirstAndSkipsStaging) {
    make_collection("col_a", "Alpha", 1);
    auto first = backups->checkpoint({"col_a"});
    clock.advance(1000);
    auto second = backups->checkpoint({"col_a"});
    fs::create_directories(backups->backups_root() + "/.staging_backup_partial");
    fs::create_directories(backups->backups_root() + "/no_manifest");

    auto list = backups->list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].backup_id, second.backup_id);
    EXPECT_EQ(list[1].backup_id, first.backup_id);

    EXPECT_TRUE(backups->remove(first.backup_id));
    EXPECT_FALSE(backups->remove(first.backup_id));
    EXPECT_EQ(backups->list().size(), 1u);
}

TEST_F(BackupManagerTest, RetentionKeepsUnionOfNewestAndYoung) {
    make_collection("col_a", "Alpha", 1);

    // Ten archives, one every three days
    std::vector<BackupArchive> made;
    for (int i = 0; i < 10; i++) {
        made.push_back(backups->checkpoint({"col_a"}));
        if (i < 9) clock.advance(3 * kMillisPerDay);
    }

    // 3 newest = days 21, 24, 27; younger than 7 days = the same three
    auto deleted = backups->cleanup(RetentionPolicy{3, 7});
    EXPECT_EQ(deleted.size(), 7u);
    auto kept = backups->list();
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].backup_id, made[9].backup_id);
    EXPECT_EQ(kept[2].backup_id, made[7].backup_id);
}

TEST_F(BackupManagerTest, RetentionCountCanExceedAgeWindow) {
    make_collection("col_a", "Alpha", 1);
    for (int i = 0; i < 10; i++) {
        backups->checkpoint({"col_a"});
        clock.advance(3 * kMillisPerDay);
    }
    // Newest archive is now 3 days old; none are within 1 day
    auto deleted = backups->cleanup(RetentionPolicy{4, 1});
    EXPECT_EQ(deleted.size(), 6u);
    EXPECT_EQ(backups->list().size(), 4u);

    // Age window keeps more than the count
    deleted = backups->cleanup(RetentionPolicy{1, 30});
    EXPECT_TRUE(deleted.empty());
}

TEST_F(BackupManagerTest, CleanupUsesConfiguredPolicyAndSweepsStaging) {
    StoreConfig cfg = *config->current();
    cfg.retention_count = 2;
    cfg.retention_days = 0;
    ASSERT_TRUE(config->update(cfg));

    make_collection("col_a", "Alpha", 1);
    for (int i = 0; i < 4; i++) {
        backups->checkpoint({"col_a"});
        clock.advance(1000);
    }
    std::string stale = backups->backups_root() + "/.staging_backup_interrupted";
    fs::create_directories(stale);

    EXPECT_EQ(backups->cleanup().size(), 2u);
    EXPECT_EQ(backups->list().size(), 2u);
    EXPECT_FALSE(fs::exists(stale));
}

TEST_F(BackupManagerTest, ConcurrentCheckpointsGetDistinctIds) {
    make_collection("col_a", "Alpha", 5);
    make_collection("col_b", "Beta", 5);

    std::vector<std::string> ids(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < ids.size(); i++) {
        threads.emplace_back([this, &ids, i] {
            ids[i] = backups->checkpoint({i % 2 ? "col_a" : "col_b"}).backup_id;
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), ids.size());
    EXPECT_EQ(backups->list().size(), ids.size());
}
