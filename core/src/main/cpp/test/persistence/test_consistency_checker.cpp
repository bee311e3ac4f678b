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
#include <string>
#include "persistence/catalog_store.h"
#include "persistence/consistency_checker.h"
#include "persistence/errors.h"
#include "persistence/fs_inspector.h"
#include "persistence/vector_store.h"
#include "persistence/test_helpers.h"

using namespace vstore::persist;
namespace fs = std::filesystem;

class ConsistencyCheckerTest : public ::testing::Test {
protected:
    std::string test_dir;
    test::ManualClock clock;
    std::unique_ptr<ConfigContext> config;
    std::unique_ptr<JsonCatalogStore> catalog;
    std::unique_ptr<FileVectorStore> vectors;
    std::unique_ptr<FilesystemInspector> inspector;
    std::unique_ptr<ConsistencyChecker> checker;

    void SetUp() override {
        test_dir = test::create_temp_dir("vstore_consistency_test");
        fs::create_directories(test_dir + "/collections");
        config = std::make_unique<ConfigContext>(test::make_config(test_dir));
        catalog = std::make_unique<JsonCatalogStore>(test_dir, clock.fn());
        catalog->load();
        vectors = std::make_unique<FileVectorStore>(test_dir, clock.fn());
        inspector = std::make_unique<FilesystemInspector>(test_dir);
        checker = std::make_unique<ConsistencyChecker>(*config, *catalog, *inspector, *vectors, clock.fn());
    }

    void TearDown() override {
        checker.reset();
        inspector.reset();
        vectors.reset();
        catalog.reset();
        config.reset();
        fs::remove_all(test_dir);
    }

    void put_record(const std::string& id, uint32_t dim, uint64_t count = 0) {
        CollectionRecord r;
        r.collection_id = id;
        r.display_name = id;
        r.embedding = SentenceTransformerEmbedding{"all-MiniLM-L6-v2", dim};
        r.item_count = count;
        catalog->put(r);
    }

    void make_collection(const std::string& id, uint32_t dim, size_t n) {
        vectors->create(id, dim);
        if (n > 0) vectors->add_items(id, test::make_items(n, dim, id));
        put_record(id, dim, n);
    }
};

TEST_F(ConsistencyCheckerTest, EmptyStoreIsConsistent) {
    auto report = checker->check(false);
    EXPECT_TRUE(report.consistent());
    EXPECT_EQ(report.generated_unix_ms, clock.now());
    EXPECT_EQ(report.catalog_count, 0u);
}

TEST_F(ConsistencyCheckerTest, MatchedCollectionsAreConsistent) {
    make_collection("col_a", 8, 20);
    make_collection("col_b", 16, 0);

    auto quick = checker->check(false);
    EXPECT_TRUE(quick.consistent());
    EXPECT_EQ(quick.catalog_count, 2u);
    EXPECT_EQ(quick.physical_count, 2u);

    auto full = checker->check(true);
    EXPECT_TRUE(full.consistent());
    EXPECT_TRUE(full.full);
}

TEST_F(ConsistencyCheckerTest, DetectsOrphansOnBothSides) {
    make_collection("col_a", 8, 3);
    vectors->create("col_orphan", 8);
    vectors->add_items("col_orphan", test::make_items(4, 8));
    put_record("col_ghost", 8);

    auto report = checker->check(false);
    EXPECT_EQ(report.status, ConsistencyStatus::Inconsistent);
    ASSERT_EQ(report.issues.size(), 2u);

    bool saw_vector = false, saw_entry = false;
    for (const auto& issue : report.issues) {
        if (const auto* v = std::get_if<OrphanedVector>(&issue)) {
            saw_vector = true;
            EXPECT_EQ(v->collection_id, "col_orphan");
            EXPECT_EQ(v->est_count, 4u);
            EXPECT_GT(v->est_size, 0u);
        } else if (const auto* c = std::get_if<OrphanedCatalogEntry>(&issue)) {
            saw_entry = true;
            EXPECT_EQ(c->collection_id, "col_ghost");
        }
    }
    EXPECT_TRUE(saw_vector);
    EXPECT_TRUE(saw_entry);
    EXPECT_STREQ(issue_kind(report.issues[0]), "orphaned_catalog_entry");
}

TEST_F(ConsistencyCheckerTest, FullCheckFindsDimensionMismatch) {
    vectors->create("col_a", 16);
    vectors->add_items("col_a", test::make_items(5, 16));
    put_record("col_a", 384, 5);

    EXPECT_TRUE(checker->check(false).consistent());

    auto full = checker->check(true);
    ASSERT_EQ(full.issues.size(), 1u);
    const auto* m = std::get_if<DimensionMismatch>(&full.issues[0]);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->expected, 384u);
    EXPECT_EQ(m->observed, 16u);
}

TEST_F(ConsistencyCheckerTest, FullCheckFindsUnreadableCollection) {
    make_collection("col_a", 4, 10);
    std::string vectors_file = vectors->collection_dir("col_a") + "/vectors.bin";
    test::corrupt_file(vectors_file, 10, 4);

    auto full = checker->check(true);
    ASSERT_EQ(full.issues.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<UnreadableCollection>(full.issues[0]));
}

TEST_F(ConsistencyCheckerTest, MissingCollectionsRootIsErrorNotEmpty) {
    make_collection("col_a", 4, 1);
    fs::remove_all(test_dir + "/collections");

    auto report = checker->check(false);
    EXPECT_EQ(report.status, ConsistencyStatus::Error);
    EXPECT_FALSE(report.consistent());
    EXPECT_FALSE(report.error_message.empty());
    EXPECT_TRUE(report.issues.empty());
}

TEST_F(ConsistencyCheckerTest, ScopedCheckOnlyLooksAtGivenIds) {
    make_collection("col_a", 8, 2);
    vectors->create("col_orphan", 8);
    put_record("col_ghost", 8);

    auto scoped = checker->check_scoped({"col_a"}, true);
    EXPECT_TRUE(scoped.consistent());
    EXPECT_EQ(scoped.scoped_ids.size(), 1u);

    scoped = checker->check_scoped({"col_a", "col_ghost"}, false);
    ASSERT_EQ(scoped.issues.size(), 1u);
    EXPECT_EQ(issue_collection_id(scoped.issues[0]), "col_ghost");

    // An id absent on both sides is consistent
    EXPECT_TRUE(checker->check_scoped({"col_never"}, false).consistent());
}

TEST_F(ConsistencyCheckerTest, ValidateCollection) {
    make_collection("col_a", 8, 12);
    auto v = checker->validate_collection("col_a");
    EXPECT_TRUE(v.valid());
    EXPECT_TRUE(v.readable);
    EXPECT_EQ(v.physical_count, 12u);
    EXPECT_EQ(v.observed_dimension, 8u);

    // Stale cached count
    put_record("col_a", 8, 99);
    v = checker->validate_collection("col_a");
    EXPECT_FALSE(v.valid());

    v = checker->validate_collection("col_missing");
    EXPECT_FALSE(v.has_record);
    EXPECT_FALSE(v.has_physical);
    EXPECT_FALSE(v.valid());
}
