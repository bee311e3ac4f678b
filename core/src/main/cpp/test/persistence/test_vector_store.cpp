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
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include "persistence/config.h"
#include "persistence/errors.h"
#include "persistence/vector_engine.h"
#include "persistence/vector_store.h"
#include "persistence/test_helpers.h"

using namespace vstore::persist;
namespace fs = std::filesystem;

class VectorStoreTest : public ::testing::Test {
protected:
    std::string test_dir;
    test::ManualClock clock;
    std::unique_ptr<FileVectorStore> store;

    void SetUp() override {
        test_dir = test::create_temp_dir("vstore_vector_test");
        store = std::make_unique<FileVectorStore>(test_dir, clock.fn());
    }

    void TearDown() override {
        store.reset();
        fs::remove_all(test_dir);
    }
};

TEST_F(VectorStoreTest, CreateWritesHeaderAndEmptyVectors) {
    store->create("col_a", 8);

    std::string dir = store->collection_dir("col_a");
    EXPECT_TRUE(fs::exists(EngineFiles::header_path(dir)));
    EXPECT_TRUE(fs::exists(EngineFiles::vectors_path(dir)));
    EXPECT_EQ(fs::file_size(EngineFiles::vectors_path(dir)), 0u);

    EngineHeader h = EngineFiles::read_header(dir);
    EXPECT_EQ(h.dimension, 8u);
    EXPECT_EQ(h.item_count, 0u);
    EXPECT_EQ(h.created_unix_ms, clock.now());

    EXPECT_TRUE(store->exists("col_a"));
    EXPECT_EQ(store->dimension("col_a"), 8u);
    EXPECT_EQ(store->count("col_a"), 0u);

    // No staging directory left behind
    for (const auto& entry : fs::directory_iterator(test_dir + "/collections")) {
        EXPECT_NE(entry.path().filename().string().rfind(layout::kStagingPrefix, 0), 0u);
    }
}

TEST_F(VectorStoreTest, CreateRejectsBadArguments) {
    EXPECT_THROW(store->create("bad/id", 8), InvalidArgumentError);
    EXPECT_THROW(store->create("col_a", 0), InvalidArgumentError);
    EXPECT_THROW(store->create("col_a", engine::kMaxDimension + 1), InvalidArgumentError);

    store->create("col_a", 4);
    EXPECT_THROW(store->create("col_a", 4), AlreadyExistsError);
}

TEST_F(VectorStoreTest, AddAndReadItems) {
    store->create("col_a", 16);
    auto items = test::make_items(100, 16);
    store->add_items("col_a", std::vector<VectorItem>(items.begin(), items.begin() + 40));
    store->add_items("col_a", std::vector<VectorItem>(items.begin() + 40, items.end()));

    EXPECT_EQ(store->count("col_a"), 100u);
    EXPECT_EQ(store->read_items("col_a"), items);
    EXPECT_EQ(store->read_items("col_a", 5).size(), 5u);

    auto ids = store->list_ids("col_a");
    ASSERT_EQ(ids.size(), 100u);
    EXPECT_EQ(ids.front(), "doc_0");
    EXPECT_EQ(ids.back(), "doc_99");
    EXPECT_EQ(EngineFiles::count_items(store->collection_dir("col_a")), 100u);
}

TEST_F(VectorStoreTest, AddRejectsDimensionMismatch) {
    store->create("col_a", 16);
    EXPECT_THROW(store->add_items("col_a", test::make_items(3, 8)), InvalidArgumentError);
    EXPECT_EQ(store->count("col_a"), 0u);
    EXPECT_THROW(store->add_items("col_missing", test::make_items(1, 16)), NotFoundError);
}

TEST_F(VectorStoreTest, CorruptItemIsIntegrityError) {
    store->create("col_a", 4);
    store->add_items("col_a", test::make_items(10, 4));
    std::string vectors = EngineFiles::vectors_path(store->collection_dir("col_a"));

    test::corrupt_file(vectors, fs::file_size(vectors) - 6, 2);
    EXPECT_THROW(store->read_items("col_a"), IntegrityError);
}

TEST_F(VectorStoreTest, TruncatedVectorsIsIntegrityError) {
    store->create("col_a", 4);
    store->add_items("col_a", test::make_items(10, 4));
    std::string vectors = EngineFiles::vectors_path(store->collection_dir("col_a"));

    test::truncate_file(vectors, fs::file_size(vectors) - 3);
    EXPECT_THROW(store->read_items("col_a"), IntegrityError);
    // The header still reports the committed count
    EXPECT_EQ(store->count("col_a"), 10u);
}

TEST_F(VectorStoreTest, HeaderlessDirectoryIsCountedByFrames) {
    store->create("col_a", 4);
    store->add_items("col_a", test::make_items(6, 4));
    fs::remove(EngineFiles::header_path(store->collection_dir("col_a")));

    EXPECT_EQ(store->count("col_a"), 6u);
    EXPECT_EQ(store->dimension("col_a"), 4u);
}

TEST_F(VectorStoreTest, MissingVectorsFileIsIntegrityError) {
    store->create("col_a", 4);
    fs::remove(EngineFiles::vectors_path(store->collection_dir("col_a")));
    EXPECT_THROW(store->read_items("col_a"), IntegrityError);
}

TEST_F(VectorStoreTest, DropMovesThroughTrash) {
    store->create("col_a", 4);
    store->add_items("col_a", test::make_items(3, 4));

    store->drop("col_a");
    EXPECT_FALSE(store->exists("col_a"));
    EXPECT_TRUE(store->pending_cleanup().empty());
    EXPECT_TRUE(fs::is_empty(test_dir + "/trash"));

    EXPECT_THROW(store->drop("col_a"), NotFoundError);
}

TEST_F(VectorStoreTest, FailedTrashRemovalIsRetried) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    store->create("col_a", 4);
    store->add_items("col_a", test::make_items(3, 4));

    // The directory can still be renamed into trash but the locked subdirectory cannot be emptied
    std::string locked = store->collection_dir("col_a") + "/locked";
    fs::create_directories(locked);
    test::write_file(locked + "/stale.bin", "x");
    ASSERT_EQ(::chmod(locked.c_str(), 0555), 0);

    store->drop("col_a");
    EXPECT_FALSE(store->exists("col_a"));
    auto pending = store->pending_cleanup();
    ASSERT_EQ(pending.size(), 1u);

    ::chmod((pending.front() + "/locked").c_str(), 0755);
    EXPECT_EQ(store->run_pending_cleanup(), 1u);
    EXPECT_TRUE(store->pending_cleanup().empty());
    EXPECT_FALSE(fs::exists(pending.front()));
}

TEST_F(VectorStoreTest, RenameMovesDirectory) {
    store->create("col_a", 4);
    store->add_items("col_a", test::make_items(5, 4));
    store->create("col_c", 4);

    store->rename("col_a", "col_b");
    EXPECT_FALSE(store->exists("col_a"));
    EXPECT_EQ(store->count("col_b"), 5u);

    EXPECT_THROW(store->rename("col_b", "col_c"), AlreadyExistsError);
    EXPECT_THROW(store->rename("col_a", "col_d"), NotFoundError);
}

TEST_F(VectorStoreTest, CopyCollectionPreservesItems) {
    store->create("col_src", 32);
    auto items = test::make_items(2500, 32);
    store->add_items("col_src", items);

    EXPECT_EQ(store->copy_collection("col_src", "col_dst"), 2500u);
    EXPECT_EQ(store->count("col_dst"), 2500u);
    EXPECT_EQ(store->dimension("col_dst"), 32u);
    EXPECT_EQ(store->read_items("col_dst"), items);
    EXPECT_EQ(store->count("col_src"), 2500u);
}

TEST_F(VectorStoreTest, ListCollectionsSkipsHiddenAndInvalid) {
    store->create("col_b", 4);
    store->create("col_a", 4);
    fs::create_directories(test_dir + "/collections/.staging_col_z");
    fs::create_directories(test_dir + "/collections/not valid");
    test::write_file(test_dir + "/collections/col_file", "x");

    auto cols = store->list_collections();
    ASSERT_EQ(cols.size(), 2u);
    EXPECT_EQ(cols[0], "col_a");
    EXPECT_EQ(cols[1], "col_b");
}
