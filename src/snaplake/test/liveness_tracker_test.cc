/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "snaplake/liveness_tracker.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "snaplake/arrow/arrow_fs_file_io.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/test/matchers.h"
#include "snaplake/test/test_common.h"
#include "snaplake/util/timepoint.h"

namespace snaplake {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

class LivenessTrackerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    file_io_ = arrow::MakeMockFileIO();
    store_ = std::make_shared<SnapshotStore>(file_io_, "/warehouse");
    ASSERT_THAT(store_->Open(), IsOk());
    tracker_ = std::make_unique<LivenessTracker>(store_);
  }

  /// \brief Write the named data files and store a snapshot listing them.
  SnapshotId PutSnapshot(const std::vector<std::string>& files,
                         std::optional<SnapshotId> parent = std::nullopt) {
    SnapshotManifest manifest{
        .parent_snapshot_id = parent, .schema = IntSchema(), .data_files = {}};
    for (const auto& file : files) {
      auto location = "/warehouse/t/_b/" + file;
      EXPECT_THAT(file_io_->WriteFile(location, "data"), IsOk());
      manifest.data_files.push_back(DataFile{
          .location = location, .record_count = 1, .file_size_in_bytes = 4});
    }
    auto snapshot_id = store_->Put(manifest);
    EXPECT_THAT(snapshot_id, IsOk());
    return *snapshot_id;
  }

  bool DataFileExists(const std::string& file) {
    auto exists = file_io_->FileExists("/warehouse/t/_b/" + file);
    EXPECT_THAT(exists, IsOk());
    return exists.value_or(false);
  }

  static TimePointMs Later() { return CurrentTimePointMs() + std::chrono::hours(1); }

  std::shared_ptr<FileIO> file_io_;
  std::shared_ptr<SnapshotStore> store_;
  std::unique_ptr<LivenessTracker> tracker_;
  TableId table_a_ = TableId::Generate();
  TableId table_b_ = TableId::Generate();
};

TEST_F(LivenessTrackerTest, AcquireAndRelease) {
  auto snapshot_id = PutSnapshot({"1.parquet"});
  EXPECT_THAT(tracker_->Acquire(table_a_, snapshot_id), IsOk());
  EXPECT_THAT(tracker_->Acquire(table_b_, snapshot_id), IsOk());
  EXPECT_EQ(tracker_->ReferenceCount(snapshot_id), 2);
  EXPECT_THAT(tracker_->ReferencedSnapshots(table_a_), ElementsAre(snapshot_id));

  EXPECT_THAT(tracker_->Acquire(table_a_, snapshot_id),
              IsError(ErrorKind::kAlreadyExists));
  EXPECT_EQ(tracker_->ReferenceCount(snapshot_id), 2);

  EXPECT_THAT(tracker_->Release(table_a_, snapshot_id), IsOk());
  EXPECT_EQ(tracker_->ReferenceCount(snapshot_id), 1);
  EXPECT_THAT(tracker_->Release(table_a_, snapshot_id),
              IsError(ErrorKind::kReferenceNotHeld));
  EXPECT_THAT(tracker_->ReferencedSnapshots(table_a_), IsEmpty());
}

TEST_F(LivenessTrackerTest, AcquireUnknownSnapshot) {
  EXPECT_THAT(tracker_->Acquire(table_a_, SnapshotId::Generate()),
              IsError(ErrorKind::kSnapshotNotFound));
  EXPECT_THAT(tracker_->ReferencedSnapshots(table_a_), IsEmpty());
}

TEST_F(LivenessTrackerTest, PutAndAcquire) {
  ASSERT_THAT(file_io_->WriteFile("/warehouse/t/_b/1.parquet", "data"), IsOk());
  DataFile data_file{.location = "/warehouse/t/_b/1.parquet",
                     .record_count = 1,
                     .file_size_in_bytes = 4};
  SnapshotManifest manifest{.schema = IntSchema(), .data_files = {data_file}};
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id,
                          tracker_->PutAndAcquire(table_a_, manifest));
  EXPECT_TRUE(store_->Contains(snapshot_id));
  EXPECT_EQ(tracker_->ReferenceCount(snapshot_id), 1);

  SNAPLAKE_UNWRAP_OR_FAIL(auto report, tracker_->Sweep(*file_io_, Later()));
  EXPECT_THAT(report.reclaimed_snapshots, IsEmpty());
  EXPECT_TRUE(DataFileExists("1.parquet"));
}

TEST_F(LivenessTrackerTest, ReleaseAll) {
  auto first = PutSnapshot({"1.parquet"});
  auto second = PutSnapshot({"1.parquet", "2.parquet"}, first);
  ASSERT_THAT(tracker_->Acquire(table_a_, first), IsOk());
  ASSERT_THAT(tracker_->Acquire(table_a_, second), IsOk());
  ASSERT_THAT(tracker_->Acquire(table_b_, second), IsOk());

  EXPECT_THAT(tracker_->ReleaseAll(table_a_), HasValue(::testing::Eq(size_t{2})));
  EXPECT_EQ(tracker_->ReferenceCount(first), 0);
  EXPECT_EQ(tracker_->ReferenceCount(second), 1);
  EXPECT_THAT(tracker_->ReleaseAll(table_a_), HasValue(::testing::Eq(size_t{0})));
}

TEST_F(LivenessTrackerTest, IsReclaimable) {
  auto snapshot_id = PutSnapshot({"1.parquet"});
  EXPECT_THAT(tracker_->IsReclaimable(snapshot_id), HasValue(::testing::Eq(true)));
  ASSERT_THAT(tracker_->Acquire(table_a_, snapshot_id), IsOk());
  EXPECT_THAT(tracker_->IsReclaimable(snapshot_id), HasValue(::testing::Eq(false)));
  EXPECT_THAT(tracker_->IsReclaimable(SnapshotId::Generate()),
              IsError(ErrorKind::kSnapshotNotFound));
}

TEST_F(LivenessTrackerTest, SweepKeepsReferencedSnapshots) {
  auto first = PutSnapshot({"1.parquet"});
  auto second = PutSnapshot({"1.parquet", "2.parquet"}, first);
  auto orphan = PutSnapshot({"3.parquet"});
  ASSERT_THAT(tracker_->Acquire(table_a_, second), IsOk());

  SNAPLAKE_UNWRAP_OR_FAIL(auto report, tracker_->Sweep(*file_io_, Later()));
  EXPECT_THAT(report.reclaimed_snapshots, ElementsAre(first, orphan));
  // 1.parquet is still listed by the referenced snapshot.
  EXPECT_THAT(report.deleted_files, ElementsAre("/warehouse/t/_b/3.parquet"));
  EXPECT_EQ(report.retained_snapshots, 1);

  EXPECT_THAT(store_->List(), ElementsAre(second));
  EXPECT_TRUE(DataFileExists("1.parquet"));
  EXPECT_TRUE(DataFileExists("2.parquet"));
  EXPECT_FALSE(DataFileExists("3.parquet"));
}

TEST_F(LivenessTrackerTest, SweepSharedFilesOnce) {
  auto first = PutSnapshot({"1.parquet"});
  auto second = PutSnapshot({"1.parquet", "2.parquet"}, first);

  SNAPLAKE_UNWRAP_OR_FAIL(auto report, tracker_->Sweep(*file_io_, Later()));
  EXPECT_THAT(report.reclaimed_snapshots, ElementsAre(first, second));
  EXPECT_THAT(report.deleted_files,
              UnorderedElementsAre("/warehouse/t/_b/1.parquet",
                                   "/warehouse/t/_b/2.parquet"));
  EXPECT_EQ(report.retained_snapshots, 0);
  EXPECT_THAT(store_->List(), IsEmpty());
}

TEST_F(LivenessTrackerTest, SweepRespectsAgeBound) {
  auto snapshot_id = PutSnapshot({"1.parquet"});
  SNAPLAKE_UNWRAP_OR_FAIL(auto report,
                          tracker_->Sweep(*file_io_, snapshot_id.timestamp()));
  EXPECT_THAT(report.reclaimed_snapshots, IsEmpty());
  EXPECT_EQ(report.retained_snapshots, 1);
  EXPECT_TRUE(DataFileExists("1.parquet"));
}

TEST_F(LivenessTrackerTest, AcquireAfterSweepFails) {
  auto snapshot_id = PutSnapshot({"1.parquet"});
  ASSERT_THAT(tracker_->Sweep(*file_io_, Later()), IsOk());
  EXPECT_THAT(tracker_->Acquire(table_a_, snapshot_id),
              IsError(ErrorKind::kSnapshotNotFound));
}

TEST_F(LivenessTrackerTest, LineagePolicyKeepsAncestors) {
  LivenessTracker tracker(store_, RetentionPolicy::kLineageAware);
  auto first = PutSnapshot({"1.parquet"});
  auto second = PutSnapshot({"1.parquet", "2.parquet"}, first);
  auto unrelated = PutSnapshot({"3.parquet"});
  ASSERT_THAT(tracker.Acquire(table_a_, second), IsOk());

  EXPECT_THAT(tracker.IsReclaimable(first), HasValue(::testing::Eq(false)));
  EXPECT_THAT(tracker.IsReclaimable(unrelated), HasValue(::testing::Eq(true)));

  SNAPLAKE_UNWRAP_OR_FAIL(auto report, tracker.Sweep(*file_io_, Later()));
  EXPECT_THAT(report.reclaimed_snapshots, ElementsAre(unrelated));
  EXPECT_THAT(store_->List(), ElementsAre(first, second));

  // Once nothing references the head, the whole lineage goes.
  ASSERT_THAT(tracker.Release(table_a_, second), IsOk());
  SNAPLAKE_UNWRAP_OR_FAIL(auto second_report, tracker.Sweep(*file_io_, Later()));
  EXPECT_THAT(second_report.reclaimed_snapshots, ElementsAre(first, second));
  EXPECT_FALSE(DataFileExists("1.parquet"));
}

TEST(RetentionPolicyTest, Strings) {
  EXPECT_EQ(RetentionPolicyToString(RetentionPolicy::kReferenceCounted), "reference");
  EXPECT_EQ(RetentionPolicyToString(RetentionPolicy::kLineageAware), "lineage");
  EXPECT_THAT(RetentionPolicyFromString("Lineage"),
              HasValue(::testing::Eq(RetentionPolicy::kLineageAware)));
  EXPECT_THAT(RetentionPolicyFromString("reference"),
              HasValue(::testing::Eq(RetentionPolicy::kReferenceCounted)));
  EXPECT_THAT(RetentionPolicyFromString("mark-sweep"),
              IsError(ErrorKind::kInvalidArgument));
}

}  // namespace snaplake
