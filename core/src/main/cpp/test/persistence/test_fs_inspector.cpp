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
#include "persistence/config.h"
#include "persistence/errors.h"
#include "persistence/fs_inspector.h"
#include "persistence/vector_store.h"
#include "persistence/test_helpers.h"

using namespace vstore::persist;
namespace fs = std::filesystem;

class FsInspectorTest : public ::testing::Test {
protected:
    std::string test_dir;
    test::ManualClock clock;

    void SetUp() override {
        test_dir = test::create_temp_dir("vstore_inspector_test");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(FsInspectorTest, MissingCollectionsRootIsAnError) {
    FilesystemInspector inspector(test_dir);
    EXPECT_THROW(inspector.scan(), StorageUnavailableError);
    EXPECT_THROW(inspector.inspect("col_a"), StorageUnavailableError);
}

TEST_F(FsInspectorTest, EmptyRootScansEmpty) {
    fs::create_directories(test_dir + "/collections");
    FilesystemInspector inspector(test_dir);
    EXPECT_TRUE(inspector.scan().empty());
}

TEST_F(FsInspectorTest, DescribesCompleteCollections) {
    FileVectorStore vectors(test_dir, clock.fn());
    vectors.create("col_b", 8);
    vectors.add_items("col_b", test::make_items(25, 8));
    vectors.create("col_a", 4);

    FilesystemInspector inspector(test_dir);
    auto entries = inspector.scan();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].collection_id, "col_a");

    const PhysicalEntry& b = entries[1];
    EXPECT_TRUE(b.complete());
    EXPECT_TRUE(b.header_readable);
    EXPECT_EQ(b.dimension, 8u);
    EXPECT_EQ(b.header_count, 25u);
    EXPECT_EQ(b.est_count, 25u);
    EXPECT_EQ(b.file_count, 2u);
    EXPECT_EQ(b.size_bytes, fs::file_size(b.dir + "/header.bin") + fs::file_size(b.dir + "/vectors.bin"));
}

TEST_F(FsInspectorTest, ReportsDamagedHeaders) {
    FileVectorStore vectors(test_dir, clock.fn());
    vectors.create("col_a", 4);
    vectors.add_items("col_a", test::make_items(3, 4));
    test::corrupt_file(vectors.collection_dir("col_a") + "/header.bin", 8, 2);

    FilesystemInspector inspector(test_dir);
    auto entry = inspector.inspect("col_a");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->has_header);
    EXPECT_FALSE(entry->header_readable);
    EXPECT_FALSE(entry->header_error.empty());
    EXPECT_FALSE(entry->dimension.has_value());
}

TEST_F(FsInspectorTest, HeaderlessDirectoryIsIncomplete) {
    fs::create_directories(test_dir + "/collections/col_orphan");
    test::write_file(test_dir + "/collections/col_orphan/vectors.bin", "");

    FilesystemInspector inspector(test_dir);
    auto entries = inspector.scan();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_FALSE(entries[0].complete());
    EXPECT_FALSE(entries[0].has_header);
    EXPECT_TRUE(entries[0].has_vectors);
    EXPECT_EQ(entries[0].est_count, 0u);
}

TEST_F(FsInspectorTest, SkipsStagingAndInvalidNames) {
    fs::create_directories(test_dir + "/collections/.staging_col_a");
    fs::create_directories(test_dir + "/collections/has space");
    fs::create_directories(test_dir + "/collections/col_ok");

    FilesystemInspector inspector(test_dir);
    auto entries = inspector.scan();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].collection_id, "col_ok");

    EXPECT_FALSE(inspector.inspect("col_missing").has_value());
    EXPECT_FALSE(inspector.inspect("../x").has_value());
}
