/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include "persistence/recovery.h"
#include "persistence/catalog_store.h"
#include "persistence/consistency_checker.h"
#include "persistence/errors.h"
#include "persistence/fs_inspector.h"
#include "persistence/operation_lock.h"
#include "persistence/sync_events.h"
#include "persistence/vector_store.h"
#include "persistence/version_checker.h"
#include "persistence/test_helpers.h"
#include <atomic>
#include <filesystem>
#include <fstream>

namespace vstore {
namespace persist {
namespace test {

namespace fs = std::filesystem;

class RecoveryTest : public ::testing::Test {
protected:
    std::string test_dir_;
    ManualClock clock_;
    std::unique_ptr<ConfigContext> config_;
    std::unique_ptr<JsonCatalogStore> catalog_;
    std::unique_ptr<FileVectorStore> vectors_;
    std::unique_ptr<FilesystemInspector> inspector_;
    std::unique_ptr<ConsistencyChecker> checker_;
    std::unique_ptr<OperationLockTable> locks_;
    std::unique_ptr<SyncEventQueue> events_;
    std::unique_ptr<VersionChecker> version_;
    std::unique_ptr<RecoveryPlanner> planner_;
    std::unique_ptr<RecoveryExecutor> executor_;

    void SetUp() override {
        test_dir_ = create_temp_dir("vstore_recovery_test");
        fs::create_directories(test_dir_ + "/collections");

        config_ = std::make_unique<ConfigContext>(make_config(test_dir_));
        version_ = std::make_unique<VersionChecker>(*config_, clock_.fn());
        ASSERT_TRUE(version_->initialize_if_missing());
        catalog_ = std::make_unique<JsonCatalogStore>(test_dir_, clock_.fn());
        catalog_->load();
        vectors_ = std::make_unique<FileVectorStore>(test_dir_, clock_.fn());
        inspector_ = std::make_unique<FilesystemInspector>(test_dir_);
        checker_ = std::make_unique<ConsistencyChecker>(*config_, *catalog_, *inspector_, *vectors_, clock_.fn());
        locks_ = std::make_unique<OperationLockTable>();
        events_ = std::make_unique<SyncEventQueue>(64, clock_.fn());
        planner_ = std::make_unique<RecoveryPlanner>(*config_, *checker_, *catalog_, *vectors_, *inspector_, clock_.fn());
        executor_ = std::make_unique<RecoveryExecutor>(*config_, *catalog_, *vectors_, *inspector_,
                                                       *version_, *locks_, events_.get(), clock_.fn());
    }

    void TearDown() override {
        executor_.reset();
        planner_.reset();
        checker_.reset();
        inspector_.reset();
        vectors_.reset();
        catalog_.reset();
        if (!test_dir_.empty()) {
            fs::remove_all(test_dir_);
        }
    }

    // Physical collection with no catalog entry
    void CreateOrphan(const std::string& id, size_t n, uint32_t dim) {
        vectors_->create(id, dim);
        if (n > 0) {
            vectors_->add_items(id, make_items(n, dim, id));
        }
    }
};

TEST_F(RecoveryTest, NothingToRecover) {
    EXPECT_TRUE(planner_->scan().empty());
    auto result = executor_->execute(planner_->plan({}));
    EXPECT_TRUE(result.succeeded.empty());
    EXPECT_TRUE(result.failed.empty());
}

TEST_F(RecoveryTest, RoundTripRestoresCatalogEntry) {
    const std::string id = "col_0123456789abcdef";
    CreateOrphan(id, 300, 24);
    auto items = vectors_->read_items(id);

    auto candidates = planner_->scan();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_TRUE(candidates[0].recoverable) << candidates[0].reason_if_not;
    EXPECT_EQ(candidates[0].inferred_dimension, 24u);
    EXPECT_EQ(candidates[0].est_count, 300u);
    EXPECT_EQ(candidates[0].item_ids_sampled.size(), config_->current()->consistency_sample_size);

    auto plan = planner_->plan(candidates);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].record.display_name, "recovered_01234567");
    EXPECT_EQ(plan[0].record.extra_metadata.at("recovered"), "true");
    EXPECT_EQ(plan[0].record.extra_metadata.at("original_id"), id);

    auto result = executor_->execute(plan);
    ASSERT_EQ(result.succeeded.size(), 1u);
    EXPECT_TRUE(result.failed.empty());

    auto rec = catalog_->get(id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->item_count, 300u);
    ASSERT_TRUE(std::holds_alternative<UnknownEmbedding>(rec->embedding));
    EXPECT_EQ(dimension_of(rec->embedding), 24u);

    // Vectors untouched, store consistent
    EXPECT_EQ(vectors_->read_items(id), items);
    EXPECT_TRUE(checker_->check(true).consistent());

    EXPECT_EQ(count_lines(test_dir_ + "/recovery.log"), 1u);
    auto published = events_->drain();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].kind, SyncEventKind::Recovered);
    EXPECT_EQ(published[0].details.at("item_count"), "300");
}

TEST_F(RecoveryTest, PlaceholderNames) {
    EXPECT_EQ(placeholder_display_name("col_abcdef0123456789"), "recovered_abcdef01");
    EXPECT_EQ(placeholder_display_name("legacy"), "recovered_legacy");
}

TEST_F(RecoveryTest, PlaceholderCollisionFallsBackToFullId) {
    CollectionRecord taken;
    taken.collection_id = "col_existing";
    taken.display_name = "recovered_aaaaaaaa";
    taken.embedding = UnknownEmbedding{8u};
    vectors_->create("col_existing", 8);
    catalog_->put(taken);

    CreateOrphan("col_aaaaaaaa11111111", 2, 8);
    auto plan = planner_->plan(planner_->scan());
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].record.display_name, "recovered_col_aaaaaaaa11111111");
}

TEST_F(RecoveryTest, UnrecoverableCandidatesAreReported) {
    CreateOrphan("col_badheader", 3, 4);
    corrupt_file(vectors_->collection_dir("col_badheader") + "/header.bin", 0, 4);

    CreateOrphan("col_novectors", 0, 4);
    fs::remove(vectors_->collection_dir("col_novectors") + "/vectors.bin");

    CreateOrphan("col_torn", 5, 4);
    std::string torn = vectors_->collection_dir("col_torn") + "/vectors.bin";
    truncate_file(torn, fs::file_size(torn) - 2);

    auto candidates = planner_->scan();
    ASSERT_EQ(candidates.size(), 3u);
    for (const auto& c : candidates) {
        EXPECT_FALSE(c.recoverable) << c.collection_id;
        EXPECT_FALSE(c.reason_if_not.empty());
    }
    EXPECT_TRUE(planner_->plan(candidates).empty());
}

TEST_F(RecoveryTest, HeaderlessEmptyDirectoryHasUnknownDimension) {
    fs::create_directories(test_dir_ + "/collections/col_bare");
    std::ofstream(test_dir_ + "/collections/col_bare/vectors.bin").close();

    auto candidates = planner_->scan();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_TRUE(candidates[0].recoverable);
    EXPECT_FALSE(candidates[0].inferred_dimension.has_value());

    auto result = executor_->execute(planner_->plan(candidates));
    ASSERT_EQ(result.succeeded.size(), 1u);
    EXPECT_EQ(dimension_label(result.succeeded[0].embedding), "unknown");
}

TEST_F(RecoveryTest, LargeCollectionsComeFirst) {
    StoreConfig cfg = *config_->current();
    cfg.recovery_high_priority_bytes = 4096;
    ASSERT_TRUE(config_->update(cfg));

    CreateOrphan("col_small", 2, 4);
    CreateOrphan("col_large", 200, 16);
    CreateOrphan("col_medium", 20, 4);

    auto plan = planner_->plan(planner_->scan());
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0].record.collection_id, "col_large");
    EXPECT_EQ(plan[0].priority, RecoveryPriority::High);
    EXPECT_EQ(plan[1].record.collection_id, "col_medium");
    EXPECT_EQ(plan[2].record.collection_id, "col_small");
}

TEST_F(RecoveryTest, CancelStopsBetweenRecords) {
    CreateOrphan("col_a", 1, 4);
    CreateOrphan("col_b", 1, 4);
    CreateOrphan("col_c", 1, 4);
    auto plan = planner_->plan(planner_->scan());
    ASSERT_EQ(plan.size(), 3u);

    std::atomic<bool> cancel{false};
    events_->subscribe([&cancel](const SyncEvent&) { cancel = true; });

    auto result = executor_->execute(plan, &cancel);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.succeeded.size(), 1u);
    EXPECT_EQ(result.not_attempted.size(), 2u);
    EXPECT_EQ(catalog_->size(), 1u);
}

TEST_F(RecoveryTest, CancelledBeforeStart) {
    CreateOrphan("col_a", 1, 4);
    std::atomic<bool> cancel{true};
    auto result = executor_->execute(planner_->plan(planner_->scan()), &cancel);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.succeeded.empty());
    EXPECT_EQ(result.not_attempted.size(), 1u);
}

TEST_F(RecoveryTest, FailuresDoNotUndoEarlierSuccesses) {
    CreateOrphan("col_a", 3, 4);
    CreateOrphan("col_b", 3, 4);
    auto plan = planner_->plan(planner_->scan());
    ASSERT_EQ(plan.size(), 2u);

    // col_b vanishes between planning and execution
    vectors_->drop("col_b");
    locks_->halt("col_a", "test");
    CreateOrphan("col_c", 1, 4);
    auto plan_c = planner_->plan({planner_->evaluate(OrphanedVector{"col_c", vectors_->collection_dir("col_c"), 0, 0})});
    plan.insert(plan.end(), plan_c.begin(), plan_c.end());

    auto result = executor_->execute(plan);
    EXPECT_EQ(result.succeeded.size(), 1u);
    EXPECT_EQ(result.failed.size(), 2u);
    EXPECT_TRUE(catalog_->contains("col_c"));
    EXPECT_FALSE(catalog_->contains("col_a"));
    EXPECT_EQ(count_lines(test_dir_ + "/recovery.log"), 3u);
}

TEST_F(RecoveryTest, IncompatibleStoreRefusesWholePlan) {
    CreateOrphan("col_a", 3, 4);
    CreateOrphan("col_b", 2, 4);
    auto plan = planner_->plan(planner_->scan());
    ASSERT_EQ(plan.size(), 2u);

    VersionInfo newer;
    newer.engine_version = "3.0.0";
    newer.schema_version = versions::kSchemaVersion;
    version_->store(newer);

    std::vector<SyncEvent> seen;
    events_->subscribe([&seen](const SyncEvent& e) { seen.push_back(e); });

    EXPECT_THROW(executor_->execute(plan), IncompatibleVersionError);
    EXPECT_EQ(catalog_->size(), 0u);
    EXPECT_FALSE(fs::exists(test_dir_ + "/catalog.json"));
    EXPECT_FALSE(fs::exists(test_dir_ + "/recovery.log"));
    EXPECT_TRUE(seen.empty());
    EXPECT_TRUE(vectors_->exists("col_a"));
}

TEST_F(RecoveryTest, EmptyPlanIsNotGatedOnVersion) {
    VersionInfo newer;
    newer.engine_version = "3.0.0";
    newer.schema_version = versions::kSchemaVersion;
    version_->store(newer);

    auto result = executor_->execute({});
    EXPECT_TRUE(result.succeeded.empty());
    EXPECT_TRUE(result.failed.empty());
}

TEST_F(RecoveryTest, ScanFailsClosedWithoutCollectionsRoot) {
    fs::remove_all(test_dir_ + "/collections");
    EXPECT_THROW(planner_->scan(), StorageUnavailableError);
}

} // namespace test
} // namespace persist
} // namespace vstore
